#pragma once

#include <memory>
#include <string>

#include "typegraph/graph/graph.hpp"
#include "typegraph/naming.hpp"
#include "typegraph/request_context.hpp"
#include "typegraph/type_registry.hpp"

namespace typegraph {

/**
 * Maps graph vertices onto typed instances field by field.
 *
 * All operations may throw DataError subclasses on malformed data; callers
 * in the materializer treat those as "absent".
 */
class InstanceMapper {
public:
    virtual ~InstanceMapper() = default;

    // Populate `instance` in place from `vertex` using the given declared fields.
    virtual void map_vertex_to_instance(RequestContext& ctx, const GraphVertex& vertex,
                                        StructInstance& instance, const FieldMapping& fields) = 0;

    /**
     * Fully materialize the class instance stored on `vertex`, including its
     * traits. The instance is placed in `ctx` before any field is mapped;
     * if mapping fails, it and everything cached after it are removed again.
     */
    virtual std::shared_ptr<ReferenceableInstance> map_graph_to_typed_instance(
        RequestContext& ctx, const std::string& guid, const VertexPtr& vertex) = 0;

    // Resolve the struct or class referenced by an edge id; null if the edge is gone.
    virtual Value get_referred_entity(RequestContext& ctx, const std::string& edge_id,
                                      const DataType& type) = 0;
};

/**
 * Default mapper over the repository's naming conventions: scalar
 * attributes are vertex properties, struct/class attributes and traits are
 * outbound edges.
 */
class GraphInstanceMapper final : public InstanceMapper {
public:
    GraphInstanceMapper(std::shared_ptr<const Graph> graph, const TypeRegistry& types,
                        std::shared_ptr<const NamingPolicy> naming);

    void map_vertex_to_instance(RequestContext& ctx, const GraphVertex& vertex,
                                StructInstance& instance, const FieldMapping& fields) override;

    std::shared_ptr<ReferenceableInstance> map_graph_to_typed_instance(
        RequestContext& ctx, const std::string& guid, const VertexPtr& vertex) override;

    Value get_referred_entity(RequestContext& ctx, const std::string& edge_id,
                              const DataType& type) override;

    const NamingResolver& naming() const { return naming_; }

private:
    void map_attribute(RequestContext& ctx, const GraphVertex& vertex, StructInstance& instance,
                       const AttributeInfo& attr, const DataType& attr_type);

    Value map_array(RequestContext& ctx, const PersistedValue& raw, const AttributeInfo& attr,
                    const ArrayType& array_type);
    Value map_collection_entry(RequestContext& ctx, const Scalar& entry, const DataType& element_type);

    std::shared_ptr<StructInstance> map_struct_vertex(RequestContext& ctx, const GraphVertex& vertex,
                                                      const StructType& type);
    std::shared_ptr<ReferenceableInstance> resolve_class_vertex(RequestContext& ctx,
                                                                const VertexPtr& vertex);

    void map_traits(RequestContext& ctx, const GraphVertex& vertex, const ClassType& type,
                    ReferenceableInstance& instance);

    // In-vertex of the first outbound edge with `label`; nullptr when there is none.
    VertexPtr follow_out_edge(const GraphVertex& vertex, const std::string& label) const;
    VertexPtr edge_target(const GraphEdge& edge) const;

    std::shared_ptr<const Graph> graph_;
    const TypeRegistry& types_;
    NamingResolver naming_;
};

} // namespace typegraph
