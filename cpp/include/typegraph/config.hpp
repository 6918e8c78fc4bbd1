#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include "logging.hpp"

namespace typegraph {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.erase(key);
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        TYPEGRAPH_LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            if (key == "db.password") {
                TYPEGRAPH_LOG_INFO("  ", key, " = ****");
            } else {
                TYPEGRAPH_LOG_INFO("  ", key, " = ", value);
            }
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            TYPEGRAPH_LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        // Graph store (PostgreSQL)
        set_if_env("db.host", "TG_DB_HOST", "localhost");
        set_if_env("db.port", "TG_DB_PORT", "5432");
        set_if_env("db.user", "TG_DB_USER", "postgres");
        set_if_env("db.password", "TG_DB_PASS", "");
        set_if_env("db.name", "TG_DB_NAME", "typegraph");

        // Logging
        set_if_env("log.level", "TG_LOG_LEVEL", "info");
        set_if_env("log.file", "TG_LOG_FILE", "");

        // Traversal compilation capabilities
        set_if_env("query.collect_type_instances", "TG_COLLECT_TYPE_INSTANCES", "true");
        set_if_env("query.filter_by_subtypes", "TG_FILTER_BY_SUBTYPES", "true");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    static void trim(std::string& s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            TYPEGRAPH_LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);
                trim(key);
                trim(value);

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        TYPEGRAPH_LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Called with mutex_ held.
    bool validate() {
        bool valid = true;

        if (get_unlocked<std::string>("db.host", "").empty()) {
            TYPEGRAPH_LOG_ERROR("Database host not configured");
            valid = false;
        }

        int port = get_unlocked<int>("db.port", 0);
        if (port <= 0 || port > 65535) {
            TYPEGRAPH_LOG_ERROR("Invalid database port: ", port);
            valid = false;
        }

        if (get_unlocked<std::string>("db.user", "").empty()) {
            TYPEGRAPH_LOG_ERROR("Database user not configured");
            valid = false;
        }

        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (!parse_log_level(log_level)) {
            TYPEGRAPH_LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "typegraph.env") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        TYPEGRAPH_LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (auto level = parse_log_level(config.get<std::string>("log.level"))) {
        set_log_level(*level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            TYPEGRAPH_LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    TYPEGRAPH_LOG_INFO("Configuration loaded successfully");
    return true;
}

} // namespace typegraph
