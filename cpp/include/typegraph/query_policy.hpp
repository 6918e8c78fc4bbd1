#pragma once

#include <memory>
#include <string>

#include "typegraph/graph/graph.hpp"
#include "typegraph/traversal_expression.hpp"

namespace typegraph {

class Config;
class DataType;

/**
 * Capability questions the traversal compiler asks about the graph store.
 */
class QueryPolicy {
public:
    virtual ~QueryPolicy() = default;

    virtual bool collect_type_instances_into_var() const = 0;
    virtual bool filter_by_sub_types() const = 0;
    virtual GremlinVersion supported_gremlin_version() const = 0;

    virtual bool is_property_value_conversion_needed(const DataType& type) const = 0;
    virtual TraversalExpression generate_persistent_to_logical_conversion_expression(
        const TraversalExpression& expr, const DataType& type) const = 0;

    virtual TraversalExpression add_initial_query_condition(const TraversalExpression& expr) const = 0;

    // A vertex prefix is needed unless type instances are collected into a variable.
    virtual bool add_graph_vertex_prefix(const std::string& pre_statements) const {
        (void)pre_statements;
        return !collect_type_instances_into_var();
    }
};

// Answers from fixed options and the graph's own capability hooks.
class DefaultQueryPolicy final : public QueryPolicy {
public:
    struct Options {
        bool collect_type_instances = true;
        bool filter_by_subtypes = true;
    };

    explicit DefaultQueryPolicy(std::shared_ptr<const Graph> graph);
    DefaultQueryPolicy(std::shared_ptr<const Graph> graph, Options options);

    // Reads query.collect_type_instances and query.filter_by_subtypes.
    static std::shared_ptr<DefaultQueryPolicy> from_config(std::shared_ptr<const Graph> graph,
                                                           const Config& config);

    bool collect_type_instances_into_var() const override { return options_.collect_type_instances; }
    bool filter_by_sub_types() const override { return options_.filter_by_subtypes; }
    GremlinVersion supported_gremlin_version() const override;

    bool is_property_value_conversion_needed(const DataType& type) const override;
    TraversalExpression generate_persistent_to_logical_conversion_expression(
        const TraversalExpression& expr, const DataType& type) const override;

    TraversalExpression add_initial_query_condition(const TraversalExpression& expr) const override;

    const Options& options() const { return options_; }

private:
    std::shared_ptr<const Graph> graph_;
    Options options_;
};

} // namespace typegraph
