#include "typegraph/db/connection.hpp"
#include "typegraph/config.hpp"

namespace typegraph::db {

ConnectionConfig ConnectionConfig::from_config(const Config& config) {
    ConnectionConfig cfg;
    cfg.dbname = config.get<std::string>("db.name", cfg.dbname);
    cfg.host = config.get<std::string>("db.host", cfg.host);
    cfg.port = config.get<std::string>("db.port", cfg.port);
    cfg.user = config.get<std::string>("db.user", cfg.user);
    cfg.password = config.get<std::string>("db.password", cfg.password);
    return cfg;
}

} // namespace typegraph::db
