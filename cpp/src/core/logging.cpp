#include "typegraph/logging.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>

namespace typegraph {

std::optional<LogLevel> parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warn") return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    if (name == "fatal") return LogLevel::FATAL;
    return std::nullopt;
}

const char* log_level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "EROR";
        case LogLevel::FATAL: return "FATL";
    }
    return "UNKN";
}

std::string format_log_prefix(LogLevel level, const char* file, int line, const char* func) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    const char* filename = std::strrchr(file, '/');
    filename = filename ? filename + 1 : file;

    std::ostringstream out;
    out << '[' << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << "] "
        << log_level_tag(level) << ' ' << filename << ':' << line << ' ' << func << "() - ";
    return out.str();
}

// =============================================================================
// Logger
// =============================================================================

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

std::ostream& Logger::set_output(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostream* previous = output_;
    output_ = &stream;
    return *previous;
}

void Logger::write(LogLevel level, const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    *output_ << line << '\n';
    if (level >= LogLevel::WARN) {
        output_->flush();
    }
    if (level == LogLevel::FATAL) {
        std::abort();
    }
}

} // namespace typegraph
