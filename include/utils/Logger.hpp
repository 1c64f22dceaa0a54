#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>

#include "core/Types.hpp"

namespace AgpAssembler {
namespace Utils {

/**
 * @brief Singleton Logger for diagnostics.
 *
 * Console messages go to stderr because stdout carries the FASTA stream.
 * Colours are used only when stderr is a terminal.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    void set_log_file(const std::string& filename);

    // Core logging function
    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    // Static helpers for cleaner syntax
    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    std::ofstream log_file_;
    std::mutex mutex_;
    bool use_color_ = false;

    static const char* level_to_string(LogLevel level);
    static const char* get_color_code(LogLevel level);
};

/**
 * @brief Maps "error", "warn", "info" or "debug" (any case) to a LogLevel.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief RAII helper to log start and end of a scope/action.
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace AgpAssembler

// Macros to automatically capture file and line number
#define LOG_DEBUG(msg) AgpAssembler::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) AgpAssembler::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) AgpAssembler::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) AgpAssembler::Utils::Logger::error(msg, __FILE__, __LINE__)
