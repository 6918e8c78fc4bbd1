#include "typegraph/db/pg_graph.hpp"
#include "typegraph/db/helpers.hpp"
#include "typegraph/error.hpp"
#include "typegraph/logging.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <type_traits>
#include <variant>

namespace typegraph::db {

namespace {

const char* SCHEMA_SQL = R"SQL(
    CREATE TABLE IF NOT EXISTS tg_vertex (
        id TEXT PRIMARY KEY
    );
    CREATE TABLE IF NOT EXISTS tg_property (
        vertex_id TEXT NOT NULL REFERENCES tg_vertex(id) ON DELETE CASCADE,
        key TEXT NOT NULL,
        position INT NOT NULL DEFAULT -1,
        kind CHAR(1) NOT NULL,
        value TEXT NOT NULL,
        PRIMARY KEY (vertex_id, key, position)
    );
    CREATE TABLE IF NOT EXISTS tg_edge (
        seq BIGSERIAL,
        id TEXT PRIMARY KEY,
        label TEXT NOT NULL,
        out_id TEXT NOT NULL REFERENCES tg_vertex(id) ON DELETE CASCADE,
        in_id TEXT NOT NULL REFERENCES tg_vertex(id) ON DELETE CASCADE
    );
    CREATE INDEX IF NOT EXISTS tg_edge_out_idx ON tg_edge (out_id, label);
    CREATE INDEX IF NOT EXISTS tg_edge_in_idx ON tg_edge (in_id, label);
)SQL";

Scalar decode_scalar(PropertyKind kind, const std::string& text, const std::string& key) {
    try {
        switch (kind) {
            case PropertyKind::Bool:
                return text == "t" || text == "true" || text == "1";
            case PropertyKind::Int:
                return static_cast<std::int64_t>(std::stoll(text));
            case PropertyKind::Double:
                return std::stod(text);
            case PropertyKind::String:
                return text;
            case PropertyKind::Unknown:
                break;
        }
    } catch (const std::exception& e) {
        throw ConversionError("Malformed stored value '" + text + "' for property " + key, e.what());
    }
    throw ConversionError("Unknown stored kind for property " + key, "decode_scalar");
}

std::pair<PropertyKind, std::string> encode_scalar(const Scalar& value) {
    return std::visit([](const auto& v) -> std::pair<PropertyKind, std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return {PropertyKind::Bool, v ? "t" : "f"};
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return {PropertyKind::Int, std::to_string(v)};
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            return {PropertyKind::Double, out.str()};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return {PropertyKind::String, v};
        } else {
            throw InvalidArgumentError("Null cannot be stored as a property value", "encode_scalar");
        }
    }, value);
}

EdgePtr edge_from_row(const Result& res, int row) {
    return std::make_shared<const GraphEdge>(
        GraphEdge{res.str(row, 0), res.str(row, 1), res.str(row, 2), res.str(row, 3)});
}

} // namespace

// =============================================================================
// PgGraphSchema
// =============================================================================

void PgGraphSchema::create(Connection& conn) {
    exec_checked(conn, SCHEMA_SQL);
    TYPEGRAPH_LOG_INFO("Graph schema ready");
}

void PgGraphSchema::drop(Connection& conn) {
    exec_checked(conn, "DROP TABLE IF EXISTS tg_edge, tg_property, tg_vertex");
}

// =============================================================================
// PgGraph
// =============================================================================

PgGraph::PgGraph(std::shared_ptr<Connection> conn, GremlinVersion version)
    : conn_(std::move(conn)), version_(version) {
    TYPEGRAPH_CHECK_POINTER(conn_.get(), "conn");
    if (!conn_->ok()) {
        throw DatabaseError(std::string("Connection is not open: ") + conn_->error(), "PgGraph",
                            "Check the db.* settings", ErrorCode::CONNECTION_FAILED);
    }
}

VertexPtr PgGraph::vertex(const std::string& id) const {
    Result exists = exec_checked(*conn_, "SELECT 1 FROM tg_vertex WHERE id = $1", {id});
    if (!exists.has_rows()) {
        return nullptr;
    }

    auto vertex = std::make_shared<PropertyVertex>(id);
    Result props = exec_checked(*conn_,
        "SELECT key, position, kind, value FROM tg_property WHERE vertex_id = $1 ORDER BY key, position",
        {id});
    for (int row = 0; row < props.ntuples(); ++row) {
        std::string key = props.str(row, 0);
        int position = props.integer(row, 1, -1);
        PropertyKind kind = parse_property_kind(PQgetvalue(props, row, 2));
        Scalar value = decode_scalar(kind, props.str(row, 3), key);
        if (position < 0) {
            vertex->set_property(key, to_persisted(value));
        } else {
            vertex->add_property_value(key, std::move(value));
        }
    }
    TYPEGRAPH_LOG_DEBUG("Loaded vertex ", id, " with ", props.ntuples(), " property rows");
    return vertex;
}

EdgePtr PgGraph::edge(const std::string& id) const {
    Result res = exec_checked(*conn_, "SELECT id, label, out_id, in_id FROM tg_edge WHERE id = $1", {id});
    if (!res.has_rows()) {
        return nullptr;
    }
    return edge_from_row(res, 0);
}

std::vector<EdgePtr> PgGraph::edges(const GraphVertex& vertex, EdgeDirection direction,
                                    const std::string& label) const {
    std::string sql = "SELECT id, label, out_id, in_id FROM tg_edge WHERE ";
    switch (direction) {
        case EdgeDirection::Out: sql += "out_id = $1"; break;
        case EdgeDirection::In: sql += "in_id = $1"; break;
        case EdgeDirection::Both: sql += "(out_id = $1 OR in_id = $1)"; break;
    }

    std::vector<std::string> params = {vertex.id()};
    if (!label.empty()) {
        sql += " AND label = $2";
        params.push_back(label);
    }
    sql += " ORDER BY seq";

    Result res = exec_checked(*conn_, sql, params);
    std::vector<EdgePtr> result;
    result.reserve(res.ntuples());
    for (int row = 0; row < res.ntuples(); ++row) {
        result.push_back(edge_from_row(res, row));
    }
    return result;
}

// =============================================================================
// PgGraphWriter
// =============================================================================

PgGraphWriter::PgGraphWriter(std::shared_ptr<Connection> conn) : conn_(std::move(conn)) {
    TYPEGRAPH_CHECK_POINTER(conn_.get(), "conn");
}

void PgGraphWriter::add_vertex(const std::string& id) {
    exec_checked(*conn_, "INSERT INTO tg_vertex (id) VALUES ($1)", {id});
}

void PgGraphWriter::set_property(const std::string& vertex_id, const std::string& key,
                                 const PersistedValue& value) {
    exec_checked(*conn_, "DELETE FROM tg_property WHERE vertex_id = $1 AND key = $2", {vertex_id, key});

    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return;
        } else if constexpr (std::is_same_v<T, ScalarList>) {
            for (size_t i = 0; i < v.size(); ++i) {
                insert_scalar(vertex_id, key, static_cast<int>(i), v[i]);
            }
        } else if constexpr (std::is_same_v<T, VertexPtr>) {
            throw InvalidArgumentError("Vertex handles cannot be stored as property " + key, "set_property");
        } else {
            insert_scalar(vertex_id, key, -1, Scalar(v));
        }
    }, value);
}

void PgGraphWriter::insert_scalar(const std::string& vertex_id, const std::string& key, int position,
                                  const Scalar& value) {
    auto [kind, text] = encode_scalar(value);
    exec_checked(*conn_,
        "INSERT INTO tg_property (vertex_id, key, position, kind, value) VALUES ($1, $2, $3, $4, $5)",
        {vertex_id, key, std::to_string(position), std::string(1, property_kind_char(kind)), text});
}

void PgGraphWriter::add_edge(const std::string& id, const std::string& out_vertex_id,
                             const std::string& in_vertex_id, const std::string& label) {
    exec_checked(*conn_, "INSERT INTO tg_edge (id, label, out_id, in_id) VALUES ($1, $2, $3, $4)",
                 {id, label, out_vertex_id, in_vertex_id});
}

} // namespace typegraph::db
