/**
 * @file helpers.hpp
 * @brief PostgreSQL helper functions for consistent data access
 *
 * Result value extraction with null handling, RAII results, and checked
 * query execution that reports failures as DatabaseError.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <libpq-fe.h>

namespace typegraph::db {

// =============================================================================
// Result Value Extraction Helpers
// =============================================================================

/**
 * Safe extraction of string value from PGresult.
 * Returns empty string if null or out of bounds.
 */
inline std::string get_string(PGresult* res, int row, int col) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return {};
    }
    if (PQgetisnull(res, row, col)) {
        return {};
    }
    const char* val = PQgetvalue(res, row, col);
    return val ? val : "";
}

/**
 * Safe extraction of int64 value from PGresult.
 * Returns default_val if null, empty, or parse error.
 */
inline int64_t get_int64(PGresult* res, int row, int col, int64_t default_val = 0) {
    if (!res || row >= PQntuples(res) || col >= PQnfields(res)) {
        return default_val;
    }
    if (PQgetisnull(res, row, col)) {
        return default_val;
    }
    const char* val = PQgetvalue(res, row, col);
    if (!val || *val == '\0') {
        return default_val;
    }
    try {
        return std::stoll(val);
    } catch (const std::exception&) {
        return default_val;
    }
}

inline int get_int(PGresult* res, int row, int col, int default_val = 0) {
    return static_cast<int>(get_int64(res, row, col, default_val));
}

// =============================================================================
// Query Execution Helpers
// =============================================================================

/**
 * RAII wrapper for PGresult.
 */
class Result {
public:
    Result() : res_(nullptr) {}
    explicit Result(PGresult* res) : res_(res) {}
    ~Result() { if (res_) PQclear(res_); }

    // Move only
    Result(Result&& other) noexcept : res_(other.res_) { other.res_ = nullptr; }
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            if (res_) PQclear(res_);
            res_ = other.res_;
            other.res_ = nullptr;
        }
        return *this;
    }
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    PGresult* get() const { return res_; }
    operator PGresult*() const { return res_; }

    bool ok() const {
        ExecStatusType status = PQresultStatus(res_);
        return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
    }

    bool has_rows() const {
        return res_ && PQresultStatus(res_) == PGRES_TUPLES_OK && PQntuples(res_) > 0;
    }

    int ntuples() const { return res_ ? PQntuples(res_) : 0; }

    std::string error_message() const {
        return res_ ? PQresultErrorMessage(res_) : "null result";
    }

    std::string str(int row, int col) const { return get_string(res_, row, col); }
    int integer(int row, int col, int def = 0) const { return get_int(res_, row, col, def); }

private:
    PGresult* res_;
};

/**
 * Execute query and return RAII Result wrapper. Status is not checked.
 */
inline Result exec(PGconn* conn, const char* sql) {
    return Result(PQexec(conn, sql));
}

inline Result exec(PGconn* conn, const std::string& sql) {
    return exec(conn, sql.c_str());
}

/**
 * Execute a parameterized query with text-format parameters.
 */
inline Result exec_params(PGconn* conn, const std::string& sql, const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }
    return Result(PQexecParams(conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                               values.empty() ? nullptr : values.data(), nullptr, nullptr, 0));
}

// Execute and throw DatabaseError unless the status is COMMAND_OK or TUPLES_OK.
Result exec_checked(PGconn* conn, const std::string& sql, const std::vector<std::string>& params = {});

// =============================================================================
// Property Kind Helpers (avoid string comparisons)
// =============================================================================

/**
 * Scalar kind of a stored property value.
 * Stored as char in DB: 'b', 'i', 'd', 's'.
 */
enum class PropertyKind : char {
    Bool = 'b',
    Int = 'i',
    Double = 'd',
    String = 's',
    Unknown = '?'
};

inline PropertyKind parse_property_kind(const char* val) {
    if (!val || *val == '\0') return PropertyKind::Unknown;
    switch (val[0]) {
        case 'b': return PropertyKind::Bool;
        case 'i': return PropertyKind::Int;
        case 'd': return PropertyKind::Double;
        case 's': return PropertyKind::String;
        default: return PropertyKind::Unknown;
    }
}

inline char property_kind_char(PropertyKind k) {
    return static_cast<char>(k);
}

} // namespace typegraph::db
