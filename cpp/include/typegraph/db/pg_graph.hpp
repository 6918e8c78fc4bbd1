/**
 * @file pg_graph.hpp
 * @brief Property graph stored in PostgreSQL
 *
 * Layout:
 *   tg_vertex(id)
 *   tg_property(vertex_id, key, position, kind, value)
 *       position -1 is a single-valued property, 0..n-1 the entries of a
 *       multi-valued one; kind is one of PropertyKind.
 *   tg_edge(seq, id, label, out_id, in_id)
 *       seq keeps insertion order for traversal.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "typegraph/db/connection.hpp"
#include "typegraph/graph/graph.hpp"

namespace typegraph::db {

class PgGraphSchema {
public:
    // Idempotent: existing tables are kept.
    static void create(Connection& conn);
    static void drop(Connection& conn);
};

/**
 * Read-only graph over the tg_* tables. Each vertex() call loads a fresh
 * snapshot of the vertex's properties.
 *
 * @throws DatabaseError on query failure, ConversionError on a malformed
 *         stored value.
 */
class PgGraph final : public Graph {
public:
    explicit PgGraph(std::shared_ptr<Connection> conn, GremlinVersion version = GremlinVersion::Three);

    VertexPtr vertex(const std::string& id) const override;
    EdgePtr edge(const std::string& id) const override;
    std::vector<EdgePtr> edges(const GraphVertex& vertex, EdgeDirection direction,
                               const std::string& label) const override;

    GremlinVersion supported_gremlin_version() const override { return version_; }

private:
    std::shared_ptr<Connection> conn_;
    GremlinVersion version_;
};

// Loads vertices, properties and edges; used for seeding and imports.
class PgGraphWriter {
public:
    explicit PgGraphWriter(std::shared_ptr<Connection> conn);

    void add_vertex(const std::string& id);
    // Replaces the property; null removes it. Vertex handles cannot be stored.
    void set_property(const std::string& vertex_id, const std::string& key, const PersistedValue& value);
    void add_edge(const std::string& id, const std::string& out_vertex_id,
                  const std::string& in_vertex_id, const std::string& label);

private:
    void insert_scalar(const std::string& vertex_id, const std::string& key, int position,
                       const Scalar& value);

    std::shared_ptr<Connection> conn_;
};

} // namespace typegraph::db
