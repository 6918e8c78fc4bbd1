#pragma once

#include <cstdlib>
#include <string>
#include <libpq-fe.h>

namespace typegraph {
class Config;
}

namespace typegraph::db {

// Database connection configuration
struct ConnectionConfig {
    std::string dbname;
    std::string host;
    std::string port;
    std::string user;
    std::string password;

    ConnectionConfig() {
        // Read from TG_DB_* env vars with defaults
        auto get_env = [](const char* name, const char* def) -> std::string {
            const char* val = std::getenv(name);
            return val ? val : def;
        };
        dbname = get_env("TG_DB_NAME", "typegraph");
        host = get_env("TG_DB_HOST", "localhost");
        port = get_env("TG_DB_PORT", "5432");
        user = get_env("TG_DB_USER", "postgres");
        password = get_env("TG_DB_PASS", "");
    }

    // db.* keys of a loaded Config; unset keys keep the environment defaults.
    static ConnectionConfig from_config(const Config& config);

    // Build libpq connection string
    std::string to_conninfo() const {
        std::string conninfo = "dbname=" + dbname;
        if (!host.empty()) conninfo += " host=" + host;
        if (!port.empty()) conninfo += " port=" + port;
        if (!user.empty()) conninfo += " user=" + user;
        if (!password.empty()) conninfo += " password=" + password;
        return conninfo;
    }
};

// RAII wrapper for PGconn
class Connection {
public:
    Connection() : conn_(nullptr) {}

    explicit Connection(const std::string& conninfo) {
        conn_ = PQconnectdb(conninfo.c_str());
    }

    explicit Connection(const ConnectionConfig& config)
        : Connection(config.to_conninfo()) {}

    ~Connection() {
        if (conn_) {
            PQfinish(conn_);
        }
    }

    // Move only
    Connection(Connection&& other) noexcept : conn_(other.conn_) {
        other.conn_ = nullptr;
    }

    Connection& operator=(Connection&& other) noexcept {
        if (this != &other) {
            if (conn_) PQfinish(conn_);
            conn_ = other.conn_;
            other.conn_ = nullptr;
        }
        return *this;
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    PGconn* get() const { return conn_; }
    operator PGconn*() const { return conn_; }

    bool ok() const {
        return conn_ && PQstatus(conn_) == CONNECTION_OK;
    }

    const char* error() const {
        return conn_ ? PQerrorMessage(conn_) : "No connection";
    }

private:
    PGconn* conn_;
};

} // namespace typegraph::db
