#include "typegraph/graph/memory_graph.hpp"
#include "typegraph/error.hpp"

namespace typegraph {

std::shared_ptr<PropertyVertex> MemoryGraph::add_vertex(const std::string& id) {
    TYPEGRAPH_CHECK_ARGUMENT(!id.empty(), "Vertex id must not be empty");
    TYPEGRAPH_CHECK_ARGUMENT(vertices_.count(id) == 0, "Duplicate vertex id: " + id);
    auto vertex = std::make_shared<PropertyVertex>(id);
    vertices_.emplace(id, vertex);
    return vertex;
}

EdgePtr MemoryGraph::add_edge(const std::string& id, const std::string& out_vertex_id,
                              const std::string& in_vertex_id, const std::string& label) {
    TYPEGRAPH_CHECK_ARGUMENT(!id.empty(), "Edge id must not be empty");
    TYPEGRAPH_CHECK_ARGUMENT(edges_.count(id) == 0, "Duplicate edge id: " + id);
    TYPEGRAPH_CHECK_ARGUMENT(vertices_.count(out_vertex_id) > 0, "Unknown out vertex: " + out_vertex_id);
    TYPEGRAPH_CHECK_ARGUMENT(vertices_.count(in_vertex_id) > 0, "Unknown in vertex: " + in_vertex_id);

    auto edge = std::make_shared<const GraphEdge>(GraphEdge{id, label, out_vertex_id, in_vertex_id});
    edges_.emplace(id, edge);
    edge_order_.push_back(edge);
    return edge;
}

std::shared_ptr<PropertyVertex> MemoryGraph::mutable_vertex(const std::string& id) const {
    auto it = vertices_.find(id);
    return it == vertices_.end() ? nullptr : it->second;
}

VertexPtr MemoryGraph::vertex(const std::string& id) const {
    return mutable_vertex(id);
}

EdgePtr MemoryGraph::edge(const std::string& id) const {
    auto it = edges_.find(id);
    return it == edges_.end() ? nullptr : it->second;
}

std::vector<EdgePtr> MemoryGraph::edges(const GraphVertex& vertex, EdgeDirection direction,
                                        const std::string& label) const {
    std::vector<EdgePtr> result;
    for (const auto& edge : edge_order_) {
        if (!label.empty() && edge->label != label) continue;
        bool outgoing = edge->out_vertex_id == vertex.id();
        bool incoming = edge->in_vertex_id == vertex.id();
        if ((direction == EdgeDirection::Out && outgoing) ||
            (direction == EdgeDirection::In && incoming) ||
            (direction == EdgeDirection::Both && (outgoing || incoming))) {
            result.push_back(edge);
        }
    }
    return result;
}

} // namespace typegraph
