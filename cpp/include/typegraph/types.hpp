#pragma once

#include <climits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "typegraph/value.hpp"

namespace typegraph {

// Closed classification of a type. Dispatch sites switch over every
// enumerator so that a new category is a compile-time-visible decision.
enum class TypeCategory {
    Primitive,
    Enum,
    Array,
    Map,
    Struct,
    Trait,
    Class
};

const char* type_category_name(TypeCategory category);

struct Multiplicity {
    int lower;
    int upper;
    bool is_unique;

    bool null_allowed() const { return lower == 0; }
    bool is_many() const { return upper > 1; }
    std::string to_string() const;

    static const Multiplicity OPTIONAL;
    static const Multiplicity REQUIRED;
    static const Multiplicity COLLECTION;
    static const Multiplicity SET;
};

struct AttributeInfo {
    std::string name;
    std::string type_name;
    Multiplicity multiplicity;
    bool is_composite;
    bool is_unique;
    bool is_indexable;
    std::string reverse_attribute_name;

    AttributeInfo(std::string name, std::string type_name,
                  Multiplicity multiplicity = Multiplicity::OPTIONAL,
                  bool is_composite = false,
                  std::string reverse_attribute_name = "");
};

// Ordered declared fields of a struct-like type, inherited fields first.
struct FieldMapping {
    std::vector<AttributeInfo> fields;
    std::map<std::string, std::string> declaring_type;  // attribute -> declaring type name

    const AttributeInfo* find(const std::string& attr_name) const;
    bool contains(const std::string& attr_name) const { return find(attr_name) != nullptr; }
};

// Names of the identity pseudo-type and its four fields.
namespace id_type {
inline constexpr const char* NAME = "__IdType";
inline constexpr const char* GUID = "guid";
inline constexpr const char* TYPE_NAME = "typeName";
inline constexpr const char* STATE = "state";
inline constexpr const char* VERSION = "version";
}

// =============================================================================
// Type descriptors
// =============================================================================

/**
 * Immutable type descriptor. Owned by the TypeRegistry and always held by
 * shared_ptr, so instances created from it can keep it alive.
 */
class DataType : public std::enable_shared_from_this<DataType> {
public:
    virtual ~DataType() = default;

    DataType(const DataType&) = delete;
    DataType& operator=(const DataType&) = delete;

    const std::string& name() const { return name_; }
    TypeCategory category() const { return category_; }

    /**
     * Coerce a raw value to this type.
     * @throws ConversionError on a shape mismatch, or on null when the
     *         multiplicity does not allow it.
     */
    virtual Value convert(const Value& value, const Multiplicity& multiplicity) const = 0;

protected:
    DataType(std::string name, TypeCategory category);

    Value convert_null(const Multiplicity& multiplicity) const;

private:
    std::string name_;
    TypeCategory category_;
};

using DataTypePtr = std::shared_ptr<const DataType>;

enum class PrimitiveKind {
    Boolean,
    Byte,
    Short,
    Int,
    Long,
    Float,
    Double,
    String,
    Date
};

class PrimitiveType final : public DataType {
public:
    PrimitiveType(std::string name, PrimitiveKind kind);

    PrimitiveKind kind() const { return kind_; }
    Value convert(const Value& value, const Multiplicity& multiplicity) const override;

private:
    Value convert_integral(const Value& value, std::int64_t min, std::int64_t max) const;
    Value convert_floating(const Value& value, double limit) const;

    PrimitiveKind kind_;
};

class EnumType final : public DataType {
public:
    EnumType(std::string name, std::vector<EnumValue> values);

    const std::vector<EnumValue>& values() const { return values_; }
    const EnumValue* from_name(const std::string& name) const;
    const EnumValue* from_ordinal(std::int64_t ordinal) const;

    Value convert(const Value& value, const Multiplicity& multiplicity) const override;

private:
    std::vector<EnumValue> values_;
};

class ArrayType final : public DataType {
public:
    explicit ArrayType(DataTypePtr element_type);

    const DataType& element_type() const { return *element_type_; }
    Value convert(const Value& value, const Multiplicity& multiplicity) const override;

private:
    DataTypePtr element_type_;
};

class MapType final : public DataType {
public:
    MapType(DataTypePtr key_type, DataTypePtr value_type);

    const DataType& key_type() const { return *key_type_; }
    const DataType& value_type() const { return *value_type_; }

    // Map values are not modelled; only null converts.
    Value convert(const Value& value, const Multiplicity& multiplicity) const override;

private:
    DataTypePtr key_type_;
    DataTypePtr value_type_;
};

class StructType : public DataType {
public:
    StructType(std::string name, FieldMapping field_mapping);

    const FieldMapping& field_mapping() const { return field_mapping_; }

    // A fresh instance with no fields set.
    std::shared_ptr<StructInstance> create_instance() const;

    virtual bool is_subtype_of(const std::string& type_name) const { return type_name == name(); }

    Value convert(const Value& value, const Multiplicity& multiplicity) const override;

protected:
    StructType(std::string name, TypeCategory category, FieldMapping field_mapping);

private:
    FieldMapping field_mapping_;
};

// Struct-like type with super types (traits and classes).
class HierarchicalType : public StructType {
public:
    const std::vector<std::string>& super_type_names() const { return super_type_names_; }
    const std::set<std::string>& all_super_type_names() const { return all_super_type_names_; }

    bool is_subtype_of(const std::string& type_name) const override;

protected:
    HierarchicalType(std::string name, TypeCategory category,
                     std::vector<std::string> super_type_names,
                     std::set<std::string> all_super_type_names,
                     FieldMapping field_mapping);

private:
    std::vector<std::string> super_type_names_;
    std::set<std::string> all_super_type_names_;
};

class TraitType final : public HierarchicalType {
public:
    TraitType(std::string name, std::vector<std::string> super_type_names,
              std::set<std::string> all_super_type_names, FieldMapping field_mapping);
};

class ClassType final : public HierarchicalType {
public:
    ClassType(std::string name, std::vector<std::string> super_type_names,
              std::set<std::string> all_super_type_names, FieldMapping field_mapping);

    std::shared_ptr<ReferenceableInstance> create_instance(Id id,
                                                           std::vector<std::string> trait_names = {}) const;

    Value convert(const Value& value, const Multiplicity& multiplicity) const override;
};

} // namespace typegraph
