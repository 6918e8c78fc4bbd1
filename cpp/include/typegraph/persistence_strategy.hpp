#pragma once

#include <memory>
#include <string>
#include <vector>

#include "typegraph/graph/graph.hpp"
#include "typegraph/instance_mapper.hpp"
#include "typegraph/materializer.hpp"
#include "typegraph/naming.hpp"
#include "typegraph/query_policy.hpp"
#include "typegraph/request_context.hpp"
#include "typegraph/type_registry.hpp"

namespace typegraph {

class Config;

/**
 * Single entry point used by the traversal compiler and the query executor:
 * storage naming, materialization of query results, and graph capability
 * questions.
 *
 * The strategy holds no per-request state; each operation passes its own
 * RequestContext.
 */
class PersistenceStrategy {
public:
    PersistenceStrategy(std::shared_ptr<const Graph> graph,
                        const TypeRegistry& types,
                        std::shared_ptr<const NamingPolicy> naming,
                        std::shared_ptr<InstanceMapper> mapper,
                        std::shared_ptr<const QueryPolicy> query_policy);

    PersistenceStrategy(const PersistenceStrategy&) = delete;
    PersistenceStrategy& operator=(const PersistenceStrategy&) = delete;

    // Default naming, GraphInstanceMapper and DefaultQueryPolicy with default options.
    static std::unique_ptr<PersistenceStrategy> create_default(std::shared_ptr<const Graph> graph,
                                                               const TypeRegistry& types);
    // Same, with query options read from `config`.
    static std::unique_ptr<PersistenceStrategy> create_from_config(std::shared_ptr<const Graph> graph,
                                                                   const TypeRegistry& types,
                                                                   const Config& config);

    // =========================================================================
    // Naming
    // =========================================================================

    std::string type_attribute_name() const { return naming_.type_attribute_name(); }
    std::string super_type_attribute_name() const { return naming_.super_type_attribute_name(); }
    std::string id_attribute_name() const { return naming_.id_attribute_name(); }
    std::string state_attribute_name() const { return naming_.state_attribute_name(); }
    std::string version_attribute_name() const { return naming_.version_attribute_name(); }

    std::string edge_label(const DataType& type, const AttributeInfo& attr) const {
        return naming_.edge_label(type, attr);
    }
    std::string edge_label(const FieldInfo& field) const { return naming_.edge_label(field); }
    std::string trait_label(const DataType& type, const std::string& trait_name) const {
        return naming_.trait_label(type, trait_name);
    }
    std::string field_name_in_vertex(const DataType& type, const AttributeInfo& attr) const {
        return naming_.field_name_in_vertex(type, attr);
    }

    std::vector<std::string> trait_names(const GraphVertex& vertex) const { return naming_.trait_names(vertex); }
    Id id_from_vertex(const std::string& type_name, const GraphVertex& vertex) const {
        return naming_.id_from_vertex(type_name, vertex);
    }

    // =========================================================================
    // Materialization
    // =========================================================================

    Value construct_instance(RequestContext& ctx, const DataType& type, const PersistedValue& value);
    MaterializeResult materialize(RequestContext& ctx, const DataType& type, const PersistedValue& value);
    Value construct_collection_entry(RequestContext& ctx, const DataType& element_type, const Scalar& entry);
    std::shared_ptr<ReferenceableInstance> construct_class_instance_id(const ClassType& type,
                                                                       const PersistedValue& value) const;

    // =========================================================================
    // Graph and traversal capabilities
    // =========================================================================

    const std::shared_ptr<const Graph>& graph() const { return graph_; }

    bool collect_type_instances_into_var() const { return query_policy_->collect_type_instances_into_var(); }
    bool filter_by_sub_types() const { return query_policy_->filter_by_sub_types(); }
    bool add_graph_vertex_prefix(const std::string& pre_statements) const {
        return query_policy_->add_graph_vertex_prefix(pre_statements);
    }
    GremlinVersion supported_gremlin_version() const { return query_policy_->supported_gremlin_version(); }
    bool is_property_value_conversion_needed(const DataType& type) const {
        return query_policy_->is_property_value_conversion_needed(type);
    }
    TraversalExpression generate_persistent_to_logical_conversion_expression(
        const TraversalExpression& expr, const DataType& type) const {
        return query_policy_->generate_persistent_to_logical_conversion_expression(expr, type);
    }
    TraversalExpression add_initial_query_condition(const TraversalExpression& expr) const {
        return query_policy_->add_initial_query_condition(expr);
    }

    // Traits hang off their instance on outbound edges.
    EdgeDirection instance_to_trait_edge_direction() const { return EdgeDirection::Out; }
    EdgeDirection trait_to_instance_edge_direction() const { return EdgeDirection::In; }

    const TypeRegistry& types() const { return types_; }

private:
    std::shared_ptr<const Graph> graph_;
    const TypeRegistry& types_;
    NamingResolver naming_;
    std::shared_ptr<InstanceMapper> mapper_;
    std::shared_ptr<const QueryPolicy> query_policy_;
    InstanceMaterializer materializer_;
    IdentityConstructor identity_constructor_;
};

} // namespace typegraph
