#pragma once

#include <memory>
#include <string>

namespace engram {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARNING = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6
};

// Parses "trace", "debug", "info", "warn"/"warning", "error", "critical", "off".
// Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

class Logger {
public:
    static Logger& getInstance();

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void critical(const std::string& message);

    void set_level(LogLevel level);
    LogLevel level() const;

    // Adds (or replaces) a file sink next to the console sink.
    void set_output_file(const std::string& filename);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Applies level and optional file sink in one call, used by the CLI and tests.
void initialize_logging(const std::string& level, const std::string& log_file = "");

} // namespace engram

#define ENGRAM_LOG_TRACE(msg) engram::Logger::getInstance().trace(msg)
#define ENGRAM_LOG_DEBUG(msg) engram::Logger::getInstance().debug(msg)
#define ENGRAM_LOG_INFO(msg) engram::Logger::getInstance().info(msg)
#define ENGRAM_LOG_WARNING(msg) engram::Logger::getInstance().warning(msg)
#define ENGRAM_LOG_ERROR(msg) engram::Logger::getInstance().error(msg)
#define ENGRAM_LOG_CRITICAL(msg) engram::Logger::getInstance().critical(msg)
