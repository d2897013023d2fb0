#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
    #include <windows.h>
    #include <io.h>
    #ifdef ERROR
        #undef ERROR
    #endif
    #define isatty _isatty
    #define fileno _fileno
#else
    #include <unistd.h>
#endif

namespace peerdrop {

namespace {

const char* RESET = "\033[0m";

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
    }
    return "";
}

// Same module, same color on every run
const char* module_color(const std::string& module) {
    static const char* const colors[] = {
        "\033[35m", "\033[94m", "\033[95m", "\033[96m",
        "\033[93m", "\033[92m", "\033[34m", "\033[38;5;208m"
    };

    uint32_t hash = 5381;
    for (unsigned char c : module) {
        hash = hash * 33 + c;
    }
    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

void write_timestamp(std::ostringstream& out) {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local_time;
#ifdef _WIN32
    localtime_s(&local_time, &seconds);
#else
    localtime_r(&seconds, &local_time);
#endif
    out << "[" << std::put_time(&local_time, "%H:%M:%S") << "."
        << std::setfill('0') << std::setw(3) << millis.count() << "] ";
}

} // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "?????";
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO),
      destination_(LogDestination::SPLIT),
      colors_enabled_(true),
      timestamps_enabled_(true),
      stdout_is_terminal_(isatty(fileno(stdout)) != 0),
      stderr_is_terminal_(isatty(fileno(stderr)) != 0) {
#ifdef _WIN32
    // ANSI sequences need virtual terminal processing on Windows consoles
    for (DWORD handle_id : {STD_OUTPUT_HANDLE, STD_ERROR_HANDLE}) {
        HANDLE handle = GetStdHandle(handle_id);
        DWORD mode = 0;
        if (GetConsoleMode(handle, &mode)) {
            SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
        }
    }
#endif
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

bool Logger::is_enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::set_destination(LogDestination destination) {
    std::lock_guard<std::mutex> lock(mutex_);
    destination_ = destination;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }

    std::string line = format_line(level, module, message);
    if (destination_ == LogDestination::STDERR || level == LogLevel::ERROR) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}

bool Logger::use_colors(LogLevel level) const {
    if (!colors_enabled_) {
        return false;
    }
    bool to_stderr = destination_ == LogDestination::STDERR || level == LogLevel::ERROR;
    return to_stderr ? stderr_is_terminal_ : stdout_is_terminal_;
}

std::string Logger::format_line(LogLevel level, const std::string& module, const std::string& message) const {
    std::ostringstream out;
    if (timestamps_enabled_) {
        write_timestamp(out);
    }

    bool colors = use_colors(level);
    if (colors) {
        out << level_color(level) << "[" << log_level_to_string(level) << "]" << RESET;
    } else {
        out << "[" << log_level_to_string(level) << "]";
    }

    if (!module.empty()) {
        if (colors) {
            out << " " << module_color(module) << "[" << module << "]" << RESET;
        } else {
            out << " [" << module << "]";
        }
    }

    out << " " << message << "\n";
    return out.str();
}

} // namespace peerdrop
