#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace spdlog {
class logger;
}

namespace redactor {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
bool parse_log_level(const std::string& name, LogLevel& out);

/**
 * Process-wide logger backed by spdlog (console sink plus optional file sink).
 *
 * Pipeline code must never pass extracted document text or finding text to
 * the logger; log counts, entity types and block indices only.
 */
class Logger {
public:
    static Logger& getInstance();

    void log(LogLevel level, const std::string& message);

    template<typename... Args>
    void logv(LogLevel level, Args&&... args) {
        if (!should_log(level)) return;
        std::ostringstream ss;
        (ss << ... << std::forward<Args>(args));
        log(level, ss.str());
    }

    bool should_log(LogLevel level) const;
    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds a file sink; throws IOError if the file cannot be opened
    void set_output_file(const std::string& filename);

    void flush();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger();

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Configure level and optional log file in one call
void init_logging(LogLevel level, const std::string& log_file = "");

// Convenience macros
#define LOG_TRACE(...)    redactor::Logger::getInstance().logv(redactor::LogLevel::TRACE, __VA_ARGS__)
#define LOG_DEBUG(...)    redactor::Logger::getInstance().logv(redactor::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)     redactor::Logger::getInstance().logv(redactor::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)     redactor::Logger::getInstance().logv(redactor::LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...)    redactor::Logger::getInstance().logv(redactor::LogLevel::ERROR, __VA_ARGS__)
#define LOG_CRITICAL(...) redactor::Logger::getInstance().logv(redactor::LogLevel::CRITICAL, __VA_ARGS__)

} // namespace redactor
