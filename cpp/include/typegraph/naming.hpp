#pragma once

#include <memory>
#include <string>
#include <vector>

#include "typegraph/graph/graph.hpp"
#include "typegraph/types.hpp"

namespace typegraph {

/**
 * Storage naming conventions of the repository. Implementations may throw
 * RepositoryError when a (type, attribute) pair cannot be named.
 */
class NamingPolicy {
public:
    virtual ~NamingPolicy() = default;

    virtual std::string type_attribute_name() const = 0;
    virtual std::string super_type_attribute_name() const = 0;
    virtual std::string id_attribute_name() const = 0;
    virtual std::string state_attribute_name() const = 0;
    virtual std::string version_attribute_name() const = 0;

    virtual std::string edge_label(const DataType& type, const AttributeInfo& attr) const = 0;
    virtual std::string trait_label(const DataType& type, const std::string& trait_name) const = 0;
    virtual std::string field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const = 0;
};

/**
 * Reserved "__"-prefixed property keys; attributes are qualified by their
 * declaring type ("Table.name"), attribute edges are "__Table.columns" and
 * trait edges are "Table.PII".
 */
class DefaultNamingPolicy final : public NamingPolicy {
public:
    std::string type_attribute_name() const override;
    std::string super_type_attribute_name() const override;
    std::string id_attribute_name() const override;
    std::string state_attribute_name() const override;
    std::string version_attribute_name() const override;

    std::string edge_label(const DataType& type, const AttributeInfo& attr) const override;
    std::string trait_label(const DataType& type, const std::string& trait_name) const override;
    std::string field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const override;

private:
    std::string qualified_name(const DataType& type, const std::string& attr_name) const;
};

// A field as seen by the query compiler. For reverse references the edge is
// labelled by the type on the other end.
struct FieldInfo {
    DataTypePtr data_type;
    AttributeInfo attr_info;
    DataTypePtr reverse_data_type;
};

/**
 * Pure lookup of the property and edge names used to encode a type on the
 * graph. Any RepositoryError from the policy is re-raised as NamingError.
 */
class NamingResolver {
public:
    explicit NamingResolver(std::shared_ptr<const NamingPolicy> policy);

    std::string type_attribute_name() const;
    std::string super_type_attribute_name() const;
    std::string id_attribute_name() const;
    std::string state_attribute_name() const;
    std::string version_attribute_name() const;

    std::string edge_label(const DataType& type, const AttributeInfo& attr) const;
    std::string edge_label(const FieldInfo& field) const;
    std::string trait_label(const DataType& type, const std::string& trait_name) const;
    std::string field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const;

    std::vector<std::string> trait_names(const GraphVertex& vertex) const;
    Id id_from_vertex(const std::string& type_name, const GraphVertex& vertex) const;

    const NamingPolicy& policy() const { return *policy_; }

private:
    std::shared_ptr<const NamingPolicy> policy_;
};

} // namespace typegraph
