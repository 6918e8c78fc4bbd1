#include "typegraph/type_registry.hpp"
#include "typegraph/error.hpp"
#include "typegraph/logging.hpp"

#include <utility>

namespace typegraph {

namespace {

const char ARRAY_PREFIX[] = "array<";
const char MAP_PREFIX[] = "map<";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// Splits "K,V" at the comma that is not nested inside angle brackets.
bool split_map_arguments(const std::string& args, std::string& key, std::string& value) {
    int depth = 0;
    for (size_t i = 0; i < args.size(); ++i) {
        char ch = args[i];
        if (ch == '<') ++depth;
        else if (ch == '>') --depth;
        else if (ch == ',' && depth == 0) {
            key = trim(args.substr(0, i));
            value = trim(args.substr(i + 1));
            return !key.empty() && !value.empty();
        }
    }
    return false;
}

} // namespace

TypeRegistry::TypeRegistry() {
    const std::pair<const char*, PrimitiveKind> primitives[] = {
        {"boolean", PrimitiveKind::Boolean},
        {"byte", PrimitiveKind::Byte},
        {"short", PrimitiveKind::Short},
        {"int", PrimitiveKind::Int},
        {"long", PrimitiveKind::Long},
        {"float", PrimitiveKind::Float},
        {"double", PrimitiveKind::Double},
        {"string", PrimitiveKind::String},
        {"date", PrimitiveKind::Date},
    };
    for (const auto& [name, kind] : primitives) {
        types_.emplace(name, std::make_shared<PrimitiveType>(name, kind));
    }

    std::vector<AttributeInfo> id_fields = {
        AttributeInfo(id_type::GUID, "string", Multiplicity::REQUIRED),
        AttributeInfo(id_type::TYPE_NAME, "string", Multiplicity::REQUIRED),
        AttributeInfo(id_type::STATE, "string", Multiplicity::OPTIONAL),
        AttributeInfo(id_type::VERSION, "int", Multiplicity::REQUIRED),
    };
    id_type_ = std::make_shared<StructType>(id_type::NAME,
                                            build_field_mapping_locked(id_type::NAME, {}, std::move(id_fields)));
    types_.emplace(id_type::NAME, id_type_);
}

void TypeRegistry::check_new_name_locked(const std::string& name) const {
    if (name.empty()) {
        throw InvalidArgumentError("Type name must not be empty", "TypeRegistry");
    }
    if (types_.count(name) > 0) {
        throw InvalidArgumentError("Redefinition of type " + name + " not supported", "TypeRegistry");
    }
    if (starts_with(name, ARRAY_PREFIX) || starts_with(name, MAP_PREFIX)) {
        throw InvalidArgumentError("Type name " + name + " is reserved for collection types",
                                   "TypeRegistry");
    }
}

FieldMapping TypeRegistry::build_field_mapping_locked(
    const std::string& name,
    const std::vector<std::shared_ptr<const HierarchicalType>>& supers,
    std::vector<AttributeInfo> fields) const {
    FieldMapping mapping;

    for (const auto& super : supers) {
        const FieldMapping& inherited = super->field_mapping();
        for (const auto& field : inherited.fields) {
            // Diamond inheritance reaches the same declaration twice.
            if (mapping.contains(field.name)) continue;
            mapping.fields.push_back(field);
            mapping.declaring_type[field.name] = inherited.declaring_type.at(field.name);
        }
    }

    for (auto& field : fields) {
        if (field.name.empty() || field.type_name.empty()) {
            throw InvalidArgumentError("Attribute of type " + name + " needs a name and a type",
                                       "TypeRegistry");
        }
        if (mapping.contains(field.name)) {
            throw InvalidArgumentError("Attribute " + field.name + " of type " + name +
                                       " is already declared", "TypeRegistry");
        }
        mapping.declaring_type[field.name] = name;
        mapping.fields.push_back(std::move(field));
    }
    return mapping;
}

std::vector<std::shared_ptr<const HierarchicalType>> TypeRegistry::resolve_supers_locked(
    const std::string& name, const std::vector<std::string>& super_types, TypeCategory category) const {
    std::vector<std::shared_ptr<const HierarchicalType>> supers;
    for (const auto& super_name : super_types) {
        DataTypePtr super = find_locked(super_name);
        if (!super) {
            throw InvalidArgumentError("Unknown super type " + super_name + " of " + name, "TypeRegistry");
        }
        if (super->category() != category) {
            throw InvalidArgumentError("Super type " + super_name + " of " + name + " is a " +
                                       type_category_name(super->category()) + ", expected " +
                                       type_category_name(category), "TypeRegistry");
        }
        supers.push_back(std::static_pointer_cast<const HierarchicalType>(super));
    }
    return supers;
}

std::shared_ptr<const EnumType> TypeRegistry::define_enum(const std::string& name,
                                                          std::vector<EnumValue> values) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_new_name_locked(name);
    auto type = std::make_shared<EnumType>(name, std::move(values));
    types_.emplace(name, type);
    return type;
}

std::shared_ptr<const StructType> TypeRegistry::define_struct(const std::string& name,
                                                              std::vector<AttributeInfo> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_new_name_locked(name);
    auto type = std::make_shared<StructType>(name, build_field_mapping_locked(name, {}, std::move(fields)));
    types_.emplace(name, type);
    return type;
}

std::shared_ptr<const TraitType> TypeRegistry::define_trait(const std::string& name,
                                                            std::vector<std::string> super_types,
                                                            std::vector<AttributeInfo> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_new_name_locked(name);
    auto supers = resolve_supers_locked(name, super_types, TypeCategory::Trait);

    std::set<std::string> all_supers;
    for (const auto& super : supers) {
        all_supers.insert(super->name());
        all_supers.insert(super->all_super_type_names().begin(), super->all_super_type_names().end());
    }

    auto type = std::make_shared<TraitType>(name, std::move(super_types), std::move(all_supers),
                                            build_field_mapping_locked(name, supers, std::move(fields)));
    types_.emplace(name, type);
    return type;
}

std::shared_ptr<const ClassType> TypeRegistry::define_class(const std::string& name,
                                                            std::vector<std::string> super_types,
                                                            std::vector<AttributeInfo> fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    check_new_name_locked(name);
    auto supers = resolve_supers_locked(name, super_types, TypeCategory::Class);

    std::set<std::string> all_supers;
    for (const auto& super : supers) {
        all_supers.insert(super->name());
        all_supers.insert(super->all_super_type_names().begin(), super->all_super_type_names().end());
    }

    auto type = std::make_shared<ClassType>(name, std::move(super_types), std::move(all_supers),
                                            build_field_mapping_locked(name, supers, std::move(fields)));
    types_.emplace(name, type);
    TYPEGRAPH_LOG_DEBUG("Defined class ", name, " with ", type->field_mapping().fields.size(), " fields");
    return type;
}

std::shared_ptr<const ArrayType> TypeRegistry::define_array_type(const std::string& element_type_name) {
    return std::static_pointer_cast<const ArrayType>(get(ARRAY_PREFIX + element_type_name + ">"));
}

std::shared_ptr<const MapType> TypeRegistry::define_map_type(const std::string& key_type_name,
                                                             const std::string& value_type_name) {
    return std::static_pointer_cast<const MapType>(
        get(MAP_PREFIX + key_type_name + "," + value_type_name + ">"));
}

DataTypePtr TypeRegistry::find_locked(const std::string& name) const {
    auto it = types_.find(name);
    if (it != types_.end()) {
        return it->second;
    }
    return resolve_composite_locked(name);
}

DataTypePtr TypeRegistry::resolve_composite_locked(const std::string& name) const {
    if (name.empty() || name.back() != '>') {
        return nullptr;
    }

    DataTypePtr created;
    if (starts_with(name, ARRAY_PREFIX)) {
        std::string inner = trim(name.substr(sizeof(ARRAY_PREFIX) - 1, name.size() - sizeof(ARRAY_PREFIX)));
        DataTypePtr element = find_locked(inner);
        if (!element) return nullptr;
        created = std::make_shared<ArrayType>(element);
    } else if (starts_with(name, MAP_PREFIX)) {
        std::string key_name;
        std::string value_name;
        std::string args = name.substr(sizeof(MAP_PREFIX) - 1, name.size() - sizeof(MAP_PREFIX));
        if (!split_map_arguments(args, key_name, value_name)) return nullptr;
        DataTypePtr key = find_locked(key_name);
        DataTypePtr value = find_locked(value_name);
        if (!key || !value) return nullptr;
        created = std::make_shared<MapType>(key, value);
    } else {
        return nullptr;
    }

    // Register under both the canonical and the requested spelling.
    types_.emplace(created->name(), created);
    types_.emplace(name, created);
    return types_.at(created->name());
}

DataTypePtr TypeRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DataTypePtr type = find_locked(name);
    if (!type) {
        throw TypeNotFoundError(name, "TypeRegistry::get");
    }
    return type;
}

bool TypeRegistry::is_registered(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.count(name) > 0;
}

template<typename T>
std::shared_ptr<const T> TypeRegistry::get_as(const std::string& name, TypeCategory category) const {
    DataTypePtr type = get(name);
    if (type->category() != category) {
        throw TypeNotFoundError(name, std::string("expected a ") + type_category_name(category) +
                                          " type, found " + type_category_name(type->category()));
    }
    return std::static_pointer_cast<const T>(type);
}

std::shared_ptr<const StructType> TypeRegistry::struct_type(const std::string& name) const {
    return get_as<StructType>(name, TypeCategory::Struct);
}

std::shared_ptr<const TraitType> TypeRegistry::trait_type(const std::string& name) const {
    return get_as<TraitType>(name, TypeCategory::Trait);
}

std::shared_ptr<const ClassType> TypeRegistry::class_type(const std::string& name) const {
    return get_as<ClassType>(name, TypeCategory::Class);
}

std::vector<std::string> TypeRegistry::type_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& entry : types_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace typegraph
