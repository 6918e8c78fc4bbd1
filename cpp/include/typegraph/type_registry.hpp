#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "typegraph/types.hpp"

namespace typegraph {

/**
 * Owns every type descriptor. Built-in primitives and the identity
 * pseudo-type are registered on construction; "array<T>" and "map<K,V>"
 * names are resolved on first lookup.
 *
 * Definitions are validated eagerly (duplicate names, unknown or
 * mismatched super types, duplicate attributes) and reported as
 * InvalidArgumentError. Attribute type names are resolved lazily so that
 * classes may reference themselves.
 */
class TypeRegistry {
public:
    TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    std::shared_ptr<const EnumType> define_enum(const std::string& name, std::vector<EnumValue> values);
    std::shared_ptr<const StructType> define_struct(const std::string& name,
                                                    std::vector<AttributeInfo> fields);
    std::shared_ptr<const TraitType> define_trait(const std::string& name,
                                                  std::vector<std::string> super_types,
                                                  std::vector<AttributeInfo> fields);
    std::shared_ptr<const ClassType> define_class(const std::string& name,
                                                  std::vector<std::string> super_types,
                                                  std::vector<AttributeInfo> fields);
    std::shared_ptr<const ArrayType> define_array_type(const std::string& element_type_name);
    std::shared_ptr<const MapType> define_map_type(const std::string& key_type_name,
                                                   const std::string& value_type_name);

    /**
     * @throws TypeNotFoundError for unknown names.
     */
    DataTypePtr get(const std::string& name) const;
    bool is_registered(const std::string& name) const;

    // Typed lookups; a category mismatch is reported as TypeNotFoundError.
    std::shared_ptr<const StructType> struct_type(const std::string& name) const;
    std::shared_ptr<const TraitType> trait_type(const std::string& name) const;
    std::shared_ptr<const ClassType> class_type(const std::string& name) const;

    const StructType& id_type() const { return *id_type_; }

    std::vector<std::string> type_names() const;

private:
    DataTypePtr find_locked(const std::string& name) const;
    DataTypePtr resolve_composite_locked(const std::string& name) const;
    void check_new_name_locked(const std::string& name) const;

    template<typename T>
    std::shared_ptr<const T> get_as(const std::string& name, TypeCategory category) const;

    FieldMapping build_field_mapping_locked(const std::string& name,
                                            const std::vector<std::shared_ptr<const HierarchicalType>>& supers,
                                            std::vector<AttributeInfo> fields) const;

    std::vector<std::shared_ptr<const HierarchicalType>> resolve_supers_locked(
        const std::string& name, const std::vector<std::string>& super_types, TypeCategory category) const;

    mutable std::mutex mutex_;
    mutable std::map<std::string, DataTypePtr> types_;
    std::shared_ptr<const StructType> id_type_;
};

} // namespace typegraph
