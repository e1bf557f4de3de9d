#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <cstdint>

namespace peerwire {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Process-wide leveled logger with module tags
 *
 * ERROR goes to stderr, everything else to stdout. Colors are only
 * emitted when stdout is a terminal.
 */
class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level);
    LogLevel get_log_level();

    void set_colors_enabled(bool enabled);
    void set_timestamps_enabled(bool enabled);

    bool is_enabled(LogLevel level);

    void log(LogLevel level, const std::string& module, const std::string& message);

    /**
     * @brief Parse a level name ("debug", "info", "warn", "error")
     * @param name Level name, case insensitive
     * @param level Output level
     * @return false if the name is not a known level
     */
    static bool parse_level(const std::string& name, LogLevel& level);

private:
    Logger();

    const char* get_level_string(LogLevel level) const;
    const char* get_color_code(LogLevel level) const;
    const char* get_module_color(const std::string& module) const;
    const char* get_reset_code() const;

    std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool is_terminal_;
};

} // namespace peerwire

// Convenience macros for easy logging
#define PEERWIRE_LOG(level, module, message) \
    do { \
        if (peerwire::Logger::getInstance().is_enabled(level)) { \
            std::ostringstream pw_log_oss_; \
            pw_log_oss_ << message; \
            peerwire::Logger::getInstance().log(level, module, pw_log_oss_.str()); \
        } \
    } while(0)

#define LOG_DEBUG(module, message) PEERWIRE_LOG(peerwire::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message)  PEERWIRE_LOG(peerwire::LogLevel::INFO, module, message)
#define LOG_WARN(module, message)  PEERWIRE_LOG(peerwire::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) PEERWIRE_LOG(peerwire::LogLevel::ERROR, module, message)
