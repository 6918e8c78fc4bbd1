#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace typegraph {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

// Parses "debug", "info", "warn", "error" or "fatal".
std::optional<LogLevel> parse_log_level(const std::string& name);

// Four-letter tag written into every line: DEBG, INFO, WARN, EROR, FATL.
const char* log_level_tag(LogLevel level);

// "[2026-01-31 12:00:00.123] EROR materializer.cpp:42 materialize() - "
std::string format_log_prefix(LogLevel level, const char* file, int line, const char* func);

/**
 * Process-wide logger. Lines below the configured level are dropped before
 * their arguments are formatted. A FATAL line is flushed and aborts.
 */
class Logger {
public:
    static Logger& getInstance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    // Returns the stream that was active before.
    std::ostream& set_output(std::ostream& stream);

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream msg;
        msg << format_log_prefix(level, file, line, func);
        (msg << ... << args);
        write(level, msg.str());
    }

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const std::string& line);

    LogLevel level_ = LogLevel::INFO;
    std::ostream* output_ = &std::cout;
    mutable std::mutex mutex_;
};

// Sends log output to `stream` until the guard goes out of scope.
class ScopedLogOutput {
public:
    explicit ScopedLogOutput(std::ostream& stream)
        : previous_(Logger::getInstance().set_output(stream)) {}
    ~ScopedLogOutput() { Logger::getInstance().set_output(previous_); }

    ScopedLogOutput(const ScopedLogOutput&) = delete;
    ScopedLogOutput& operator=(const ScopedLogOutput&) = delete;

private:
    std::ostream& previous_;
};

#define TYPEGRAPH_LOG(level, ...) \
    ::typegraph::Logger::getInstance().log(level, __FILE__, __LINE__, __func__, __VA_ARGS__)

#define TYPEGRAPH_LOG_DEBUG(...) TYPEGRAPH_LOG(::typegraph::LogLevel::DEBUG, __VA_ARGS__)
#define TYPEGRAPH_LOG_INFO(...)  TYPEGRAPH_LOG(::typegraph::LogLevel::INFO, __VA_ARGS__)
#define TYPEGRAPH_LOG_WARN(...)  TYPEGRAPH_LOG(::typegraph::LogLevel::WARN, __VA_ARGS__)
#define TYPEGRAPH_LOG_ERROR(...) TYPEGRAPH_LOG(::typegraph::LogLevel::ERROR, __VA_ARGS__)
#define TYPEGRAPH_LOG_FATAL(...) TYPEGRAPH_LOG(::typegraph::LogLevel::FATAL, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().set_level(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().set_output(stream);
}

} // namespace typegraph
