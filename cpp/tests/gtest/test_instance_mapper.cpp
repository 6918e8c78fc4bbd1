// =============================================================================
// Graph Instance Mapper Tests
// =============================================================================

#include "graph_fixture.hpp"

#include "typegraph/error.hpp"

using namespace typegraph;
using typegraph::test::GraphFixture;

class InstanceMapperTest : public GraphFixture {};

TEST_F(InstanceMapperTest, MapsScalarEnumAndListAttributes) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->set_property("Person.age", std::int64_t{30});
    vertex->set_property("Person.tier", std::string("GOLD"));
    vertex->add_property_value("Person.nicknames", std::string("al"));
    vertex->add_property_value("Person.nicknames", std::string("ally"));

    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->id().guid, "G1");
    EXPECT_EQ(person->id().type_name, "Person");
    EXPECT_EQ(person->get("age").as_int(), 30);
    EXPECT_EQ(person->get("tier").as_enum().name, "GOLD");

    const auto& nicknames = person->get("nicknames").as_list();
    ASSERT_EQ(nicknames.size(), 2u);
    EXPECT_EQ(nicknames[0].as_string(), "al");
    EXPECT_EQ(nicknames[1].as_string(), "ally");
}

TEST_F(InstanceMapperTest, UnsetPropertiesStayUnset) {
    add_person("p1", "G1", "alice");
    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    EXPECT_FALSE(person->is_set("age"));
    EXPECT_FALSE(person->is_set("address"));
    EXPECT_FALSE(person->is_set("manager"));
}

TEST_F(InstanceMapperTest, MapAttributesAreSkipped) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->set_property("Person.labels", std::string("ignored"));

    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    EXPECT_FALSE(person->is_set("labels"));
}

TEST_F(InstanceMapperTest, StructAttributeFollowsOutEdge) {
    add_person("p1", "G1", "alice");
    auto address = graph->add_vertex("a1");
    address->set_property("Address.street", std::string("Elm St"));
    link("e1", "p1", "a1", "__Person.address");

    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    ASSERT_TRUE(person->get("address").is_struct());
    EXPECT_EQ(person->get("address").as_struct()->get("street").as_string(), "Elm St");
}

TEST_F(InstanceMapperTest, InheritedAttributesUseDeclaringTypeNames) {
    auto vertex = add_class_vertex("e1", "Employee", "G7");
    vertex->set_property("Person.name", std::string("bob"));
    vertex->set_property("Employee.badge", std::string("B-1"));
    add_person("p2", "G2", "carol");
    link("x1", "e1", "p2", "__Person.manager");

    auto employee = mapper->map_graph_to_typed_instance(ctx, "G7", graph->vertex("e1"));
    EXPECT_EQ(employee->get("name").as_string(), "bob");
    EXPECT_EQ(employee->get("badge").as_string(), "B-1");
    EXPECT_EQ(employee->get("manager").as_referenceable()->get("name").as_string(), "carol");
}

TEST_F(InstanceMapperTest, TraitsFollowOutboundTraitEdges) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->add_property_value(constants::TRAIT_NAMES_PROPERTY_KEY, std::string("PII"));
    auto trait = graph->add_vertex("t1");
    trait->set_property("PII.level", std::int64_t{2});
    link("e1", "p1", "t1", "Person.PII");

    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    ASSERT_EQ(person->trait_names().size(), 1u);
    auto pii = person->trait("PII");
    ASSERT_NE(pii, nullptr);
    EXPECT_EQ(pii->get("level").as_int(), 2);
}

TEST_F(InstanceMapperTest, InstanceIsCachedBeforeFieldsAreMapped) {
    add_person("p1", "G1", "alice");
    link("e1", "p1", "p1", "__Person.manager");

    auto person = mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1"));
    EXPECT_TRUE(ctx.contains("G1"));
    EXPECT_EQ(ctx.get_instance("G1").get(), person.get());
    EXPECT_EQ(person->get("manager").as_referenceable().get(), person.get());
    EXPECT_TRUE(person->get("manager").is_reference());
}

TEST_F(InstanceMapperTest, FailedMappingIsRemovedFromContext) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->set_property("Person.age", std::string("not-a-number"));

    EXPECT_THROW(mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1")), ConversionError);
    EXPECT_FALSE(ctx.contains("G1"));
    EXPECT_EQ(ctx.get_instance("G1"), nullptr);
}

TEST_F(InstanceMapperTest, MissingTypeNameIsMappingError) {
    auto vertex = graph->add_vertex("p1");
    vertex->set_property(constants::GUID_PROPERTY_KEY, std::string("G1"));
    EXPECT_THROW(mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1")), MappingError);
}

TEST_F(InstanceMapperTest, UnknownTypeIsTypeNotFound) {
    add_class_vertex("p1", "Ghost", "G1");
    EXPECT_THROW(mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1")), TypeNotFoundError);
}

TEST_F(InstanceMapperTest, MalformedPropertyIsConversionError) {
    auto vertex = add_person("p1", "G1", "alice");
    vertex->set_property("Person.age", std::string("thirty"));
    EXPECT_THROW(mapper->map_graph_to_typed_instance(ctx, "G1", graph->vertex("p1")), ConversionError);
}

TEST_F(InstanceMapperTest, ReferredEntityForMissingEdgeIsNull) {
    EXPECT_TRUE(mapper->get_referred_entity(ctx, "nope", type("Person")).is_null());
}

TEST_F(InstanceMapperTest, ReferredStructIsMappedFromInVertex) {
    add_person("p1", "G1", "alice");
    auto address = graph->add_vertex("a1");
    address->set_property("Address.zip", std::int64_t{90210});
    link("e1", "p1", "a1", "__Person.address");

    Value v = mapper->get_referred_entity(ctx, "e1", type("Address"));
    ASSERT_TRUE(v.is_struct());
    EXPECT_EQ(v.as_struct()->get("zip").as_int(), 90210);
}

TEST_F(InstanceMapperTest, ReferredEntityOfPrimitiveTypeIsMappingError) {
    add_person("p1", "G1", "alice");
    add_person("p2", "G2", "bob");
    link("e1", "p1", "p2", "__Person.manager");
    EXPECT_THROW(mapper->get_referred_entity(ctx, "e1", type("string")), MappingError);
}
