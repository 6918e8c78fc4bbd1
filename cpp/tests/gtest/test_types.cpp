// =============================================================================
// Type Registry and Conversion Tests
// =============================================================================

#include <gtest/gtest.h>

#include "typegraph/error.hpp"
#include "typegraph/type_registry.hpp"

using namespace typegraph;

class TypeRegistryTest : public ::testing::Test {
protected:
    TypeRegistry types;
};

TEST_F(TypeRegistryTest, BuiltinsAreRegistered) {
    for (const char* name : {"boolean", "byte", "short", "int", "long", "float", "double", "string", "date"}) {
        EXPECT_EQ(types.get(name)->category(), TypeCategory::Primitive) << name;
    }
    const StructType& id = types.id_type();
    EXPECT_EQ(id.name(), id_type::NAME);
    ASSERT_EQ(id.field_mapping().fields.size(), 4u);
    EXPECT_TRUE(id.field_mapping().contains(id_type::GUID));
    EXPECT_TRUE(id.field_mapping().contains(id_type::TYPE_NAME));
    EXPECT_TRUE(id.field_mapping().contains(id_type::STATE));
    EXPECT_TRUE(id.field_mapping().contains(id_type::VERSION));
}

TEST_F(TypeRegistryTest, CollectionTypesResolveOnDemand) {
    EXPECT_FALSE(types.is_registered("array<int>"));
    auto array = types.get("array<int>");
    EXPECT_EQ(array->category(), TypeCategory::Array);
    EXPECT_EQ(static_cast<const ArrayType&>(*array).element_type().name(), "int");
    EXPECT_TRUE(types.is_registered("array<int>"));
    EXPECT_EQ(types.define_array_type("int").get(), array.get());

    auto map = types.get("map<string, array<int>>");
    EXPECT_EQ(map->category(), TypeCategory::Map);
    EXPECT_EQ(map->name(), "map<string,array<int>>");
    EXPECT_EQ(types.define_map_type("string", "array<int>").get(), map.get());
}

TEST_F(TypeRegistryTest, UnknownNamesAreTypeNotFound) {
    EXPECT_THROW(types.get("Missing"), TypeNotFoundError);
    EXPECT_THROW(types.get("array<Missing>"), TypeNotFoundError);
    EXPECT_THROW(types.get("map<string>"), TypeNotFoundError);
    EXPECT_THROW(types.define_array_type("Missing"), TypeNotFoundError);
}

TEST_F(TypeRegistryTest, TypedLookupChecksCategory) {
    types.define_struct("Address", {AttributeInfo("street", "string")});
    EXPECT_NO_THROW(types.struct_type("Address"));
    EXPECT_THROW(types.class_type("Address"), TypeNotFoundError);
    EXPECT_THROW(types.trait_type("int"), TypeNotFoundError);
}

TEST_F(TypeRegistryTest, DefinitionsAreValidated) {
    types.define_class("Asset", {}, {AttributeInfo("name", "string")});
    types.define_trait("PII", {}, {});

    EXPECT_THROW(types.define_class("Asset", {}, {}), InvalidArgumentError);
    EXPECT_THROW(types.define_class("int", {}, {}), InvalidArgumentError);
    EXPECT_THROW(types.define_class("Table", {"Missing"}, {}), InvalidArgumentError);
    EXPECT_THROW(types.define_class("Table", {"PII"}, {}), InvalidArgumentError);
    EXPECT_THROW(types.define_class("Table", {"Asset"}, {AttributeInfo("name", "string")}),
                 InvalidArgumentError);
    EXPECT_THROW(types.define_struct("array<x>", {}), InvalidArgumentError);
    EXPECT_FALSE(types.is_registered("Table"));
}

TEST_F(TypeRegistryTest, InheritedFieldsComeFirst) {
    types.define_class("Asset", {}, {AttributeInfo("name", "string"), AttributeInfo("owner", "string")});
    types.define_class("DataSet", {"Asset"}, {AttributeInfo("rows", "long")});
    auto table = types.define_class("Table", {"DataSet"}, {AttributeInfo("temporary", "boolean")});

    const auto& fields = table->field_mapping().fields;
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0].name, "name");
    EXPECT_EQ(fields[1].name, "owner");
    EXPECT_EQ(fields[2].name, "rows");
    EXPECT_EQ(fields[3].name, "temporary");
    EXPECT_EQ(table->field_mapping().declaring_type.at("owner"), "Asset");
    EXPECT_EQ(table->field_mapping().declaring_type.at("rows"), "DataSet");
    EXPECT_EQ(table->field_mapping().declaring_type.at("temporary"), "Table");

    EXPECT_TRUE(table->is_subtype_of("Asset"));
    EXPECT_TRUE(table->is_subtype_of("Table"));
    EXPECT_FALSE(types.class_type("Asset")->is_subtype_of("Table"));
    EXPECT_EQ(table->all_super_type_names(), (std::set<std::string>{"Asset", "DataSet"}));
}

TEST_F(TypeRegistryTest, DiamondInheritanceKeepsOneCopy) {
    types.define_class("Base", {}, {AttributeInfo("id", "string")});
    types.define_class("Left", {"Base"}, {});
    types.define_class("Right", {"Base"}, {});
    auto bottom = types.define_class("Bottom", {"Left", "Right"}, {});
    EXPECT_EQ(bottom->field_mapping().fields.size(), 1u);
}

// =============================================================================
// Conversion
// =============================================================================

TEST_F(TypeRegistryTest, PrimitiveConversion) {
    const DataType& byte_type = *types.get("byte");
    EXPECT_EQ(byte_type.convert(Value(std::string("12")), Multiplicity::OPTIONAL).as_int(), 12);
    EXPECT_THROW(byte_type.convert(Value(std::int64_t{300}), Multiplicity::OPTIONAL), ConversionError);

    const DataType& boolean = *types.get("boolean");
    EXPECT_TRUE(boolean.convert(Value(std::string("TRUE")), Multiplicity::OPTIONAL).as_bool());
    EXPECT_THROW(boolean.convert(Value(std::string("yes")), Multiplicity::OPTIONAL), ConversionError);

    const DataType& str = *types.get("string");
    EXPECT_EQ(str.convert(Value(std::int64_t{5}), Multiplicity::OPTIONAL).as_string(), "5");

    EXPECT_TRUE(str.convert(Value(), Multiplicity::OPTIONAL).is_null());
    EXPECT_THROW(str.convert(Value(), Multiplicity::REQUIRED), ConversionError);
}

TEST_F(TypeRegistryTest, EnumConversion) {
    auto tier = types.define_enum("Tier", {{"GOLD", 1}, {"SILVER", 2}});
    EXPECT_EQ(tier->convert(Value(std::string("GOLD")), Multiplicity::OPTIONAL).as_enum().ordinal, 1);
    EXPECT_EQ(tier->convert(Value(std::int64_t{2}), Multiplicity::OPTIONAL).as_enum().name, "SILVER");
    EXPECT_THROW(tier->convert(Value(std::string("BRONZE")), Multiplicity::OPTIONAL), ConversionError);
}

TEST_F(TypeRegistryTest, MapConversionRejectsValues) {
    const DataType& map = *types.get("map<string,int>");
    EXPECT_TRUE(map.convert(Value(), Multiplicity::OPTIONAL).is_null());
    EXPECT_THROW(map.convert(Value(std::string("k")), Multiplicity::OPTIONAL), ConversionError);
}

TEST_F(TypeRegistryTest, StructInstancesOnlyAcceptDeclaredFields) {
    auto address = types.define_struct("Address", {AttributeInfo("street", "string")});
    auto instance = address->create_instance();
    instance->set("street", std::string("Main"));
    EXPECT_EQ(instance->get("street").as_string(), "Main");
    EXPECT_THROW(instance->set("city", std::string("x")), ConversionError);
    EXPECT_THROW(instance->get("city"), ConversionError);

    instance->set("street", Value());
    EXPECT_FALSE(instance->is_set("street"));
}

TEST_F(TypeRegistryTest, ClassConversionAcceptsSubtypes) {
    auto asset = types.define_class("Asset", {}, {});
    auto table = types.define_class("Table", {"Asset"}, {});
    auto instance = table->create_instance(Id{"G1", ""});
    EXPECT_EQ(instance->id().type_name, "Table");

    Value v(instance);
    EXPECT_TRUE(asset->convert(v, Multiplicity::OPTIONAL).is_referenceable());
    auto base = asset->create_instance(Id{"G2", "Asset"});
    EXPECT_THROW(table->convert(Value(base), Multiplicity::OPTIONAL), ConversionError);
}
