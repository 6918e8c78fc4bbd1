#include "typegraph/persistence_strategy.hpp"
#include "typegraph/config.hpp"
#include "typegraph/error.hpp"
#include "typegraph/logging.hpp"

namespace typegraph {

namespace {

// mapper_ owns the mapper the materializer refers to.
InstanceMapper& checked_mapper(const std::shared_ptr<InstanceMapper>& mapper) {
    TYPEGRAPH_CHECK_POINTER(mapper.get(), "mapper");
    return *mapper;
}

} // namespace

PersistenceStrategy::PersistenceStrategy(std::shared_ptr<const Graph> graph,
                                         const TypeRegistry& types,
                                         std::shared_ptr<const NamingPolicy> naming,
                                         std::shared_ptr<InstanceMapper> mapper,
                                         std::shared_ptr<const QueryPolicy> query_policy)
    : graph_(std::move(graph))
    , types_(types)
    , naming_(std::move(naming))
    , mapper_(std::move(mapper))
    , query_policy_(std::move(query_policy))
    , materializer_(types_, checked_mapper(mapper_)) {
    TYPEGRAPH_CHECK_POINTER(graph_.get(), "graph");
    TYPEGRAPH_CHECK_POINTER(query_policy_.get(), "query_policy");
}

std::unique_ptr<PersistenceStrategy> PersistenceStrategy::create_default(std::shared_ptr<const Graph> graph,
                                                                         const TypeRegistry& types) {
    auto naming = std::make_shared<DefaultNamingPolicy>();
    auto mapper = std::make_shared<GraphInstanceMapper>(graph, types, naming);
    auto query_policy = std::make_shared<DefaultQueryPolicy>(graph);
    return std::make_unique<PersistenceStrategy>(std::move(graph), types, std::move(naming),
                                                 std::move(mapper), std::move(query_policy));
}

std::unique_ptr<PersistenceStrategy> PersistenceStrategy::create_from_config(std::shared_ptr<const Graph> graph,
                                                                             const TypeRegistry& types,
                                                                             const Config& config) {
    auto naming = std::make_shared<DefaultNamingPolicy>();
    auto mapper = std::make_shared<GraphInstanceMapper>(graph, types, naming);
    auto query_policy = DefaultQueryPolicy::from_config(graph, config);
    TYPEGRAPH_LOG_DEBUG("Query policy: collect_type_instances=", query_policy->collect_type_instances_into_var(),
                        " filter_by_subtypes=", query_policy->filter_by_sub_types());
    return std::make_unique<PersistenceStrategy>(std::move(graph), types, std::move(naming),
                                                 std::move(mapper), std::move(query_policy));
}

Value PersistenceStrategy::construct_instance(RequestContext& ctx, const DataType& type,
                                              const PersistedValue& value) {
    return materializer_.construct_instance(ctx, type, value);
}

MaterializeResult PersistenceStrategy::materialize(RequestContext& ctx, const DataType& type,
                                                   const PersistedValue& value) {
    return materializer_.materialize(ctx, type, value);
}

Value PersistenceStrategy::construct_collection_entry(RequestContext& ctx, const DataType& element_type,
                                                      const Scalar& entry) {
    return materializer_.collection_entry_resolver().construct_collection_entry(ctx, element_type, entry);
}

std::shared_ptr<ReferenceableInstance> PersistenceStrategy::construct_class_instance_id(
    const ClassType& type, const PersistedValue& value) const {
    return identity_constructor_.construct_class_instance_id(type, value);
}

} // namespace typegraph
