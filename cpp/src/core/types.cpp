#include "typegraph/types.hpp"
#include "typegraph/error.hpp"

#include <algorithm>
#include <cctype>
#include <cfloat>
#include <cmath>
#include <limits>

namespace typegraph {

const char* type_category_name(TypeCategory category) {
    switch (category) {
        case TypeCategory::Primitive: return "PRIMITIVE";
        case TypeCategory::Enum: return "ENUM";
        case TypeCategory::Array: return "ARRAY";
        case TypeCategory::Map: return "MAP";
        case TypeCategory::Struct: return "STRUCT";
        case TypeCategory::Trait: return "TRAIT";
        case TypeCategory::Class: return "CLASS";
    }
    return "UNKNOWN";
}

// =============================================================================
// Multiplicity / AttributeInfo / FieldMapping
// =============================================================================

const Multiplicity Multiplicity::OPTIONAL{0, 1, false};
const Multiplicity Multiplicity::REQUIRED{1, 1, false};
const Multiplicity Multiplicity::COLLECTION{1, INT_MAX, false};
const Multiplicity Multiplicity::SET{1, INT_MAX, true};

std::string Multiplicity::to_string() const {
    return "{lower=" + std::to_string(lower) + ", upper=" +
           (upper == INT_MAX ? std::string("*") : std::to_string(upper)) +
           ", isUnique=" + (is_unique ? "true" : "false") + "}";
}

AttributeInfo::AttributeInfo(std::string name, std::string type_name, Multiplicity multiplicity,
                             bool is_composite, std::string reverse_attribute_name)
    : name(std::move(name))
    , type_name(std::move(type_name))
    , multiplicity(multiplicity)
    , is_composite(is_composite)
    , is_unique(false)
    , is_indexable(false)
    , reverse_attribute_name(std::move(reverse_attribute_name)) {}

const AttributeInfo* FieldMapping::find(const std::string& attr_name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
                           [&](const AttributeInfo& a) { return a.name == attr_name; });
    return it == fields.end() ? nullptr : &*it;
}

// =============================================================================
// DataType
// =============================================================================

DataType::DataType(std::string name, TypeCategory category)
    : name_(std::move(name)), category_(category) {
    TYPEGRAPH_CHECK_ARGUMENT(!name_.empty(), "Type name must not be empty");
}

Value DataType::convert_null(const Multiplicity& multiplicity) const {
    if (!multiplicity.null_allowed()) {
        throw ConversionError("Null value not allowed for multiplicity " + multiplicity.to_string(),
                              name_);
    }
    return Value();
}

// =============================================================================
// PrimitiveType
// =============================================================================

namespace {

ConversionError cannot_convert(const Value& value, const std::string& type_name) {
    return ConversionError("Cannot convert value '" + value.to_string() + "' to datatype " + type_name);
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

bool parse_int64(const std::string& text, std::int64_t& out) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(text, &consumed);
        if (consumed != text.size()) return false;
        out = static_cast<std::int64_t>(parsed);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

PrimitiveType::PrimitiveType(std::string name, PrimitiveKind kind)
    : DataType(std::move(name), TypeCategory::Primitive), kind_(kind) {}

Value PrimitiveType::convert_integral(const Value& value, std::int64_t min, std::int64_t max) const {
    std::int64_t result = 0;
    if (value.is_int()) {
        result = value.as_int();
    } else if (value.is_double()) {
        double d = value.as_double();
        if (std::trunc(d) != d || d < static_cast<double>(min) || d > static_cast<double>(max)) {
            throw cannot_convert(value, name());
        }
        result = static_cast<std::int64_t>(d);
    } else if (value.is_string()) {
        if (!parse_int64(value.as_string(), result)) {
            throw cannot_convert(value, name());
        }
    } else {
        throw cannot_convert(value, name());
    }
    if (result < min || result > max) {
        throw ConversionError("Value " + std::to_string(result) + " out of range for datatype " + name());
    }
    return Value(result);
}

Value PrimitiveType::convert_floating(const Value& value, double limit) const {
    double result = 0.0;
    if (value.is_double()) {
        result = value.as_double();
    } else if (value.is_int()) {
        result = static_cast<double>(value.as_int());
    } else if (value.is_string()) {
        if (!parse_double(value.as_string(), result)) {
            throw cannot_convert(value, name());
        }
    } else {
        throw cannot_convert(value, name());
    }
    if (std::isfinite(result) && std::fabs(result) > limit) {
        throw ConversionError("Value " + value.to_string() + " out of range for datatype " + name());
    }
    return Value(result);
}

Value PrimitiveType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }

    switch (kind_) {
        case PrimitiveKind::Boolean:
            if (value.is_bool()) return value;
            if (value.is_int() && (value.as_int() == 0 || value.as_int() == 1)) {
                return Value(value.as_int() == 1);
            }
            if (value.is_string()) {
                std::string s = lowercase(value.as_string());
                if (s == "true") return Value(true);
                if (s == "false") return Value(false);
            }
            throw cannot_convert(value, name());
        case PrimitiveKind::Byte:
            return convert_integral(value, std::numeric_limits<std::int8_t>::min(),
                                    std::numeric_limits<std::int8_t>::max());
        case PrimitiveKind::Short:
            return convert_integral(value, std::numeric_limits<std::int16_t>::min(),
                                    std::numeric_limits<std::int16_t>::max());
        case PrimitiveKind::Int:
            return convert_integral(value, std::numeric_limits<std::int32_t>::min(),
                                    std::numeric_limits<std::int32_t>::max());
        case PrimitiveKind::Long:
        case PrimitiveKind::Date:
            // Dates are persisted as epoch milliseconds.
            return convert_integral(value, std::numeric_limits<std::int64_t>::min(),
                                    std::numeric_limits<std::int64_t>::max());
        case PrimitiveKind::Float:
            return convert_floating(value, FLT_MAX);
        case PrimitiveKind::Double:
            return convert_floating(value, DBL_MAX);
        case PrimitiveKind::String:
            if (value.is_string()) return value;
            if (value.is_int()) return Value(std::to_string(value.as_int()));
            if (value.is_bool()) return Value(std::string(value.as_bool() ? "true" : "false"));
            if (value.is_double()) return Value(value.to_string());
            throw cannot_convert(value, name());
    }
    throw cannot_convert(value, name());
}

// =============================================================================
// EnumType
// =============================================================================

EnumType::EnumType(std::string name, std::vector<EnumValue> values)
    : DataType(std::move(name), TypeCategory::Enum), values_(std::move(values)) {}

const EnumValue* EnumType::from_name(const std::string& value_name) const {
    auto it = std::find_if(values_.begin(), values_.end(),
                           [&](const EnumValue& v) { return v.name == value_name; });
    return it == values_.end() ? nullptr : &*it;
}

const EnumValue* EnumType::from_ordinal(std::int64_t ordinal) const {
    auto it = std::find_if(values_.begin(), values_.end(),
                           [&](const EnumValue& v) { return v.ordinal == ordinal; });
    return it == values_.end() ? nullptr : &*it;
}

Value EnumType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }

    const EnumValue* found = nullptr;
    if (value.is_enum()) {
        found = from_name(value.as_enum().name);
    } else if (value.is_string()) {
        found = from_name(value.as_string());
    } else if (value.is_int()) {
        found = from_ordinal(value.as_int());
    }
    if (!found) {
        throw ConversionError("Cannot convert value '" + value.to_string() + "' to enum " + name());
    }
    return Value(*found);
}

// =============================================================================
// ArrayType / MapType
// =============================================================================

ArrayType::ArrayType(DataTypePtr element_type)
    : DataType("array<" + (element_type ? element_type->name() : std::string("?")) + ">",
               TypeCategory::Array)
    , element_type_(std::move(element_type)) {
    TYPEGRAPH_CHECK_POINTER(element_type_.get(), "element_type");
}

Value ArrayType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }

    const Multiplicity& element_multiplicity =
        multiplicity.is_unique ? Multiplicity::SET : Multiplicity::COLLECTION;
    Value::List converted;
    if (value.is_list()) {
        for (const auto& element : value.as_list()) {
            converted.push_back(element_type_->convert(element, element_multiplicity));
        }
    } else {
        converted.push_back(element_type_->convert(value, element_multiplicity));
    }
    return Value(std::move(converted));
}

MapType::MapType(DataTypePtr key_type, DataTypePtr value_type)
    : DataType("map<" + (key_type ? key_type->name() : std::string("?")) + "," +
                   (value_type ? value_type->name() : std::string("?")) + ">",
               TypeCategory::Map)
    , key_type_(std::move(key_type))
    , value_type_(std::move(value_type)) {
    TYPEGRAPH_CHECK_POINTER(key_type_.get(), "key_type");
    TYPEGRAPH_CHECK_POINTER(value_type_.get(), "value_type");
}

Value MapType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }
    throw ConversionError("Map values are not supported", name());
}

// =============================================================================
// Struct-like types
// =============================================================================

StructType::StructType(std::string name, FieldMapping field_mapping)
    : StructType(std::move(name), TypeCategory::Struct, std::move(field_mapping)) {}

StructType::StructType(std::string name, TypeCategory category, FieldMapping field_mapping)
    : DataType(std::move(name), category), field_mapping_(std::move(field_mapping)) {}

std::shared_ptr<StructInstance> StructType::create_instance() const {
    return std::make_shared<StructInstance>(
        std::static_pointer_cast<const StructType>(shared_from_this()));
}

Value StructType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }
    if (value.is_struct() && value.as_struct() && value.as_struct()->type().is_subtype_of(name())) {
        return value;
    }
    throw ConversionError("Cannot convert value '" + value.to_string() + "' to datatype " + name());
}

HierarchicalType::HierarchicalType(std::string name, TypeCategory category,
                                   std::vector<std::string> super_type_names,
                                   std::set<std::string> all_super_type_names,
                                   FieldMapping field_mapping)
    : StructType(std::move(name), category, std::move(field_mapping))
    , super_type_names_(std::move(super_type_names))
    , all_super_type_names_(std::move(all_super_type_names)) {}

bool HierarchicalType::is_subtype_of(const std::string& type_name) const {
    return type_name == name() || all_super_type_names_.count(type_name) > 0;
}

TraitType::TraitType(std::string name, std::vector<std::string> super_type_names,
                     std::set<std::string> all_super_type_names, FieldMapping field_mapping)
    : HierarchicalType(std::move(name), TypeCategory::Trait, std::move(super_type_names),
                       std::move(all_super_type_names), std::move(field_mapping)) {}

ClassType::ClassType(std::string name, std::vector<std::string> super_type_names,
                     std::set<std::string> all_super_type_names, FieldMapping field_mapping)
    : HierarchicalType(std::move(name), TypeCategory::Class, std::move(super_type_names),
                       std::move(all_super_type_names), std::move(field_mapping)) {}

std::shared_ptr<ReferenceableInstance> ClassType::create_instance(Id id,
                                                                  std::vector<std::string> trait_names) const {
    if (id.type_name.empty()) {
        id.type_name = name();
    }
    return std::make_shared<ReferenceableInstance>(
        std::static_pointer_cast<const ClassType>(shared_from_this()), std::move(id),
        std::move(trait_names));
}

Value ClassType::convert(const Value& value, const Multiplicity& multiplicity) const {
    if (value.is_null()) {
        return convert_null(multiplicity);
    }
    if (value.is_referenceable()) {
        auto instance = value.as_referenceable();
        if (instance && instance->type().is_subtype_of(name())) {
            return value;
        }
    }
    throw ConversionError("Cannot convert value '" + value.to_string() + "' to datatype " + name());
}

} // namespace typegraph
