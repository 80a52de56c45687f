#include "redactor/logging.hpp"
#include "redactor/error.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace redactor {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:    return spdlog::level::trace;
        case LogLevel::DEBUG:    return spdlog::level::debug;
        case LogLevel::INFO:     return spdlog::level::info;
        case LogLevel::WARNING:  return spdlog::level::warn;
        case LogLevel::ERROR:    return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // namespace

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "trace") out = LogLevel::TRACE;
    else if (key == "debug") out = LogLevel::DEBUG;
    else if (key == "info") out = LogLevel::INFO;
    else if (key == "warn" || key == "warning") out = LogLevel::WARNING;
    else if (key == "error") out = LogLevel::ERROR;
    else if (key == "critical" || key == "fatal") out = LogLevel::CRITICAL;
    else if (key == "off") out = LogLevel::OFF;
    else return false;
    return true;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;
    LogLevel level = LogLevel::INFO;

    Impl() {
        // Logs go to stderr so stdout stays clean for JSON reports
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("redactor", console_sink);
        logger->set_level(to_spdlog(level));
        logger->set_pattern(LOG_PATTERN);
        logger->flush_on(spdlog::level::warn);
    }

    void add_file_sink(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern(LOG_PATTERN);
            logger->sinks().push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            throw IOError(ErrorCode::WRITE_FAILED, "Could not open log file", filename, e.what());
        }
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::log(LogLevel level, const std::string& message) {
    pImpl->logger->log(to_spdlog(level), message);
}

bool Logger::should_log(LogLevel level) const {
    return pImpl->logger->should_log(to_spdlog(level));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->level = level;
    pImpl->logger->set_level(to_spdlog(level));
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->add_file_sink(filename);
}

void Logger::flush() {
    pImpl->logger->flush();
}

void init_logging(LogLevel level, const std::string& log_file) {
    Logger& logger = Logger::getInstance();
    logger.set_level(level);
    if (!log_file.empty()) {
        logger.set_output_file(log_file);
    }
}

} // namespace redactor
