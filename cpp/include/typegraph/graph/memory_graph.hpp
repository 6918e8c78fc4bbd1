#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "typegraph/graph/graph.hpp"

namespace typegraph {

/**
 * In-process property graph. Vertices are mutable through the returned
 * PropertyVertex handle until they are read by a materialization.
 */
class MemoryGraph : public Graph {
public:
    explicit MemoryGraph(GremlinVersion version = GremlinVersion::Three) : version_(version) {}

    std::shared_ptr<PropertyVertex> add_vertex(const std::string& id);
    EdgePtr add_edge(const std::string& id, const std::string& out_vertex_id,
                     const std::string& in_vertex_id, const std::string& label);

    std::shared_ptr<PropertyVertex> mutable_vertex(const std::string& id) const;

    VertexPtr vertex(const std::string& id) const override;
    EdgePtr edge(const std::string& id) const override;
    std::vector<EdgePtr> edges(const GraphVertex& vertex, EdgeDirection direction,
                               const std::string& label) const override;

    GremlinVersion supported_gremlin_version() const override { return version_; }

    size_t vertex_count() const { return vertices_.size(); }
    size_t edge_count() const { return edges_.size(); }

private:
    GremlinVersion version_;
    std::map<std::string, std::shared_ptr<PropertyVertex>> vertices_;
    std::map<std::string, EdgePtr> edges_;
    std::vector<EdgePtr> edge_order_;  // insertion order for deterministic traversal
};

} // namespace typegraph
