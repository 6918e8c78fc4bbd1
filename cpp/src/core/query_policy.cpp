#include "typegraph/query_policy.hpp"
#include "typegraph/config.hpp"
#include "typegraph/error.hpp"

namespace typegraph {

// =============================================================================
// TraversalExpression
// =============================================================================

TraversalExpression TraversalExpression::literal(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (char ch : value) {
        if (ch == '\'' || ch == '\\') quoted += '\\';
        quoted += ch;
    }
    quoted += '\'';
    return TraversalExpression(std::move(quoted));
}

TraversalExpression TraversalExpression::call(const std::string& function,
                                              const std::vector<TraversalExpression>& args) const {
    std::string out = text_;
    if (!out.empty()) out += '.';
    out += function;
    out += '(';
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ", ";
        out += args[i].text();
    }
    out += ')';
    return TraversalExpression(std::move(out));
}

// =============================================================================
// DefaultQueryPolicy
// =============================================================================

DefaultQueryPolicy::DefaultQueryPolicy(std::shared_ptr<const Graph> graph)
    : DefaultQueryPolicy(std::move(graph), Options{}) {}

DefaultQueryPolicy::DefaultQueryPolicy(std::shared_ptr<const Graph> graph, Options options)
    : graph_(std::move(graph)), options_(options) {
    TYPEGRAPH_CHECK_POINTER(graph_.get(), "graph");
}

std::shared_ptr<DefaultQueryPolicy> DefaultQueryPolicy::from_config(std::shared_ptr<const Graph> graph,
                                                                    const Config& config) {
    Options options;
    options.collect_type_instances = config.get<bool>("query.collect_type_instances", true);
    options.filter_by_subtypes = config.get<bool>("query.filter_by_subtypes", true);
    return std::make_shared<DefaultQueryPolicy>(std::move(graph), options);
}

GremlinVersion DefaultQueryPolicy::supported_gremlin_version() const {
    return graph_->supported_gremlin_version();
}

bool DefaultQueryPolicy::is_property_value_conversion_needed(const DataType& type) const {
    return graph_->is_property_value_conversion_needed(type);
}

TraversalExpression DefaultQueryPolicy::generate_persistent_to_logical_conversion_expression(
    const TraversalExpression& expr, const DataType& type) const {
    return graph_->generate_persistent_to_logical_conversion_expression(expr, type);
}

TraversalExpression DefaultQueryPolicy::add_initial_query_condition(const TraversalExpression& expr) const {
    if (graph_->requires_initial_indexed_predicate()) {
        return graph_->initial_indexed_predicate(expr);
    }
    return expr;
}

} // namespace typegraph
