#include "engram/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <mutex>

namespace engram {

namespace {

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARNING: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        case LogLevel::OFF: return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::TRACE;
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "info") return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARNING;
    if (lowered == "error") return LogLevel::ERROR;
    if (lowered == "critical") return LogLevel::CRITICAL;
    if (lowered == "off") return LogLevel::OFF;
    return LogLevel::INFO;
}

class Logger::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;
    std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink;
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink;
    LogLevel level = LogLevel::INFO;
    std::mutex mutex;

    Impl() {
        console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::trace);

        logger = std::make_shared<spdlog::logger>("engram", console_sink);
        logger->set_level(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger->flush_on(spdlog::level::warn);
    }

    void set_level(LogLevel new_level) {
        std::lock_guard<std::mutex> lock(mutex);
        level = new_level;
        logger->set_level(to_spdlog(new_level));
    }

    void set_output_file(const std::string& filename) {
        std::lock_guard<std::mutex> lock(mutex);

        auto& sinks = logger->sinks();
        if (file_sink) {
            sinks.erase(std::remove(sinks.begin(), sinks.end(), file_sink), sinks.end());
            file_sink.reset();
        }
        if (filename.empty()) {
            return;
        }

        file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }
};

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

void Logger::trace(const std::string& message) {
    pImpl->logger->trace(message);
}

void Logger::debug(const std::string& message) {
    pImpl->logger->debug(message);
}

void Logger::info(const std::string& message) {
    pImpl->logger->info(message);
}

void Logger::warning(const std::string& message) {
    pImpl->logger->warn(message);
}

void Logger::error(const std::string& message) {
    pImpl->logger->error(message);
}

void Logger::critical(const std::string& message) {
    pImpl->logger->critical(message);
}

void Logger::set_level(LogLevel level) {
    pImpl->set_level(level);
}

LogLevel Logger::level() const {
    return pImpl->level;
}

void Logger::set_output_file(const std::string& filename) {
    pImpl->set_output_file(filename);
}

void initialize_logging(const std::string& level, const std::string& log_file) {
    Logger& logger = Logger::getInstance();
    logger.set_level(parse_log_level(level));
    logger.set_output_file(log_file);
}

} // namespace engram
