#include "logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace peerwire {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO),
      colors_enabled_(true),
      timestamps_enabled_(true) {
    is_terminal_ = isatty(fileno(stdout));
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::get_log_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::set_colors_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    colors_enabled_ = enabled;
}

void Logger::set_timestamps_enabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    timestamps_enabled_ = enabled;
}

bool Logger::is_enabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();

    if (!module.empty()) {
        oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
    }

    oss << " " << message << "\n";

    if (level >= LogLevel::ERROR) {
        std::cerr << oss.str();
        std::cerr.flush();
    } else {
        std::cout << oss.str();
        std::cout.flush();
    }
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

const char* Logger::get_level_string(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

const char* Logger::get_color_code(LogLevel level) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
    }
    return "";
}

const char* Logger::get_module_color(const std::string& module) const {
    if (!colors_enabled_ || !is_terminal_) return "";

    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m", // Purple
    };

    // djb2
    uint32_t hash = 5381;
    for (char c : module) {
        hash = ((hash << 5) + hash) + static_cast<uint8_t>(c);
    }

    return colors[hash % (sizeof(colors) / sizeof(colors[0]))];
}

const char* Logger::get_reset_code() const {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

} // namespace peerwire
