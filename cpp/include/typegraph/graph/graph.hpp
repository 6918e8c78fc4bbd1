#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "typegraph/traversal_expression.hpp"

namespace typegraph {

class DataType;
class GraphVertex;

enum class EdgeDirection {
    Out,
    In,
    Both
};

enum class GremlinVersion {
    Two,
    Three
};

const char* edge_direction_name(EdgeDirection direction);

// =============================================================================
// Persisted values
// =============================================================================

using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string>;
using ScalarList = std::vector<Scalar>;
using VertexPtr = std::shared_ptr<const GraphVertex>;

/**
 * Raw value as read from the graph: a scalar property, a multi-valued
 * property (ordered), or a vertex handle. Which shape is expected is decided
 * by the type being materialized, not by inspecting the value.
 */
using PersistedValue = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                    ScalarList, VertexPtr>;

PersistedValue to_persisted(const Scalar& scalar);

inline bool is_null(const PersistedValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

// =============================================================================
// Vertices and edges
// =============================================================================

class GraphVertex {
public:
    virtual ~GraphVertex() = default;

    virtual const std::string& id() const = 0;

    // Null when the property is not set.
    virtual PersistedValue property(const std::string& key) const = 0;
    virtual std::vector<std::string> property_keys() const = 0;
};

// Vertex backed by an in-memory property map. Used by both graph backends.
class PropertyVertex final : public GraphVertex {
public:
    explicit PropertyVertex(std::string id) : id_(std::move(id)) {}

    const std::string& id() const override { return id_; }
    PersistedValue property(const std::string& key) const override;
    std::vector<std::string> property_keys() const override;

    void set_property(const std::string& key, PersistedValue value);
    void add_property_value(const std::string& key, Scalar value);
    void remove_property(const std::string& key) { properties_.erase(key); }

private:
    std::string id_;
    std::map<std::string, PersistedValue> properties_;
};

struct GraphEdge {
    std::string id;
    std::string label;
    std::string out_vertex_id;  // tail: the owning vertex
    std::string in_vertex_id;   // head: the referenced vertex
};

using EdgePtr = std::shared_ptr<const GraphEdge>;

// =============================================================================
// Graph
// =============================================================================

/**
 * Read access to the property graph for one operation.
 *
 * The traversal capability hooks default to a store that keeps values in
 * their logical form and needs no indexed start predicate.
 */
class Graph {
public:
    virtual ~Graph() = default;

    // nullptr when no such vertex/edge exists.
    virtual VertexPtr vertex(const std::string& id) const = 0;
    virtual EdgePtr edge(const std::string& id) const = 0;

    virtual std::vector<EdgePtr> edges(const GraphVertex& vertex, EdgeDirection direction,
                                       const std::string& label) const = 0;

    virtual GremlinVersion supported_gremlin_version() const = 0;

    virtual bool is_property_value_conversion_needed(const DataType& type) const;
    virtual TraversalExpression generate_persistent_to_logical_conversion_expression(
        const TraversalExpression& expr, const DataType& type) const;

    virtual bool requires_initial_indexed_predicate() const { return false; }
    virtual TraversalExpression initial_indexed_predicate(const TraversalExpression& parent) const {
        return parent;
    }
};

} // namespace typegraph
