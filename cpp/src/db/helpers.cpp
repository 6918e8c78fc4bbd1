#include "typegraph/db/helpers.hpp"
#include "typegraph/error.hpp"
#include "typegraph/logging.hpp"

namespace typegraph::db {

Result exec_checked(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    if (!conn) {
        throw DatabaseError("No database connection", "exec_checked", "Open a Connection first",
                            ErrorCode::CONNECTION_FAILED);
    }
    Result res = params.empty() ? exec(conn, sql) : exec_params(conn, sql, params);
    if (!res.ok()) {
        std::string message = res.get() ? res.error_message() : PQerrorMessage(conn);
        TYPEGRAPH_LOG_ERROR("Query failed: ", message);
        throw DatabaseError(message, sql);
    }
    return res;
}

} // namespace typegraph::db
