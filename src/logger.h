#pragma once

#include <sstream>
#include <mutex>
#include <string>
#include <cstdint>

#ifdef _WIN32
    // windows.h defines ERROR, which collides with LogLevel::ERROR
    #ifdef ERROR
        #undef ERROR
    #endif
#endif

namespace peerdrop {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Where log lines go.
 * SPLIT writes ERROR to stderr and everything else to stdout. STDERR keeps
 * stdout free for an interactive console.
 */
enum class LogDestination {
    SPLIT,
    STDERR
};

/**
 * Parse a level name ("debug", "info", "warn", "error", case-insensitive)
 * @param name Level name from configuration
 * @param fallback Level returned when the name is not recognized
 * @return Parsed level
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

const char* log_level_to_string(LogLevel level);

/**
 * Process-wide logger. Every line is formatted and written under one mutex,
 * so lines from the relay's reader threads never interleave.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;

    /**
     * Cheap check used by the LOG_* macros before the message is formatted.
     */
    bool is_enabled(LogLevel level) const;

    void set_destination(LogDestination destination);
    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string format_line(LogLevel level, const std::string& module, const std::string& message) const;
    bool use_colors(LogLevel level) const;

    mutable std::mutex mutex_;
    LogLevel min_level_;
    LogDestination destination_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool stdout_is_terminal_;
    bool stderr_is_terminal_;
};

} // namespace peerdrop

#define PEERDROP_LOG(level, module, message) \
    do { \
        if (peerdrop::Logger::getInstance().is_enabled(level)) { \
            std::ostringstream peerdrop_log_stream_; \
            peerdrop_log_stream_ << message; \
            peerdrop::Logger::getInstance().log(level, module, peerdrop_log_stream_.str()); \
        } \
    } while (0)

#define LOG_DEBUG(module, message) PEERDROP_LOG(peerdrop::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message)  PEERDROP_LOG(peerdrop::LogLevel::INFO, module, message)
#define LOG_WARN(module, message)  PEERDROP_LOG(peerdrop::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) PEERDROP_LOG(peerdrop::LogLevel::ERROR, module, message)
