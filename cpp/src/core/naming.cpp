#include "typegraph/naming.hpp"
#include "typegraph/constants.hpp"
#include "typegraph/error.hpp"
#include "typegraph/graph/graph_helper.hpp"

namespace typegraph {

// =============================================================================
// DefaultNamingPolicy
// =============================================================================

std::string DefaultNamingPolicy::type_attribute_name() const {
    return constants::ENTITY_TYPE_PROPERTY_KEY;
}

std::string DefaultNamingPolicy::super_type_attribute_name() const {
    return constants::SUPER_TYPES_PROPERTY_KEY;
}

std::string DefaultNamingPolicy::id_attribute_name() const {
    return constants::GUID_PROPERTY_KEY;
}

std::string DefaultNamingPolicy::state_attribute_name() const {
    return constants::STATE_PROPERTY_KEY;
}

std::string DefaultNamingPolicy::version_attribute_name() const {
    return constants::VERSION_PROPERTY_KEY;
}

std::string DefaultNamingPolicy::qualified_name(const DataType& type, const std::string& attr_name) const {
    switch (type.category()) {
        case TypeCategory::Struct:
        case TypeCategory::Trait:
        case TypeCategory::Class: {
            const auto& mapping = static_cast<const StructType&>(type).field_mapping();
            auto it = mapping.declaring_type.find(attr_name);
            if (it == mapping.declaring_type.end()) {
                throw RepositoryError("Unknown attribute " + attr_name + " in type " + type.name(),
                                      "qualified_name",
                                      "Check the attribute against the type's field mapping");
            }
            return it->second + constants::QUALIFIED_NAME_SEPARATOR + attr_name;
        }
        case TypeCategory::Primitive:
        case TypeCategory::Enum:
        case TypeCategory::Array:
        case TypeCategory::Map:
            return attr_name;
    }
    return attr_name;
}

std::string DefaultNamingPolicy::edge_label(const DataType& type, const AttributeInfo& attr) const {
    return constants::EDGE_LABEL_PREFIX + qualified_name(type, attr.name);
}

std::string DefaultNamingPolicy::trait_label(const DataType& type, const std::string& trait_name) const {
    return type.name() + constants::QUALIFIED_NAME_SEPARATOR + trait_name;
}

std::string DefaultNamingPolicy::field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const {
    return qualified_name(type, attr.name);
}

// =============================================================================
// NamingResolver
// =============================================================================

namespace {

template<typename Fn>
auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const RepositoryError& e) {
        throw NamingError(e, operation);
    }
}

} // namespace

NamingResolver::NamingResolver(std::shared_ptr<const NamingPolicy> policy) : policy_(std::move(policy)) {
    TYPEGRAPH_CHECK_POINTER(policy_.get(), "policy");
}

std::string NamingResolver::type_attribute_name() const {
    return guarded("type_attribute_name", [&] { return policy_->type_attribute_name(); });
}

std::string NamingResolver::super_type_attribute_name() const {
    return guarded("super_type_attribute_name", [&] { return policy_->super_type_attribute_name(); });
}

std::string NamingResolver::id_attribute_name() const {
    return guarded("id_attribute_name", [&] { return policy_->id_attribute_name(); });
}

std::string NamingResolver::state_attribute_name() const {
    return guarded("state_attribute_name", [&] { return policy_->state_attribute_name(); });
}

std::string NamingResolver::version_attribute_name() const {
    return guarded("version_attribute_name", [&] { return policy_->version_attribute_name(); });
}

std::string NamingResolver::edge_label(const DataType& type, const AttributeInfo& attr) const {
    return guarded("edge_label", [&] { return policy_->edge_label(type, attr); });
}

std::string NamingResolver::edge_label(const FieldInfo& field) const {
    const DataTypePtr& owner = field.reverse_data_type ? field.reverse_data_type : field.data_type;
    TYPEGRAPH_CHECK_POINTER(owner.get(), "field.data_type");
    return edge_label(*owner, field.attr_info);
}

std::string NamingResolver::trait_label(const DataType& type, const std::string& trait_name) const {
    return guarded("trait_label", [&] { return policy_->trait_label(type, trait_name); });
}

std::string NamingResolver::field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const {
    return guarded("field_name_in_vertex", [&] { return policy_->field_name_in_vertex(type, attr); });
}

std::vector<std::string> NamingResolver::trait_names(const GraphVertex& vertex) const {
    return graph_helper::get_trait_names(vertex);
}

Id NamingResolver::id_from_vertex(const std::string& type_name, const GraphVertex& vertex) const {
    return graph_helper::get_id_from_vertex(type_name, vertex);
}

} // namespace typegraph
