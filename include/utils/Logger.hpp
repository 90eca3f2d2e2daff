#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include "core/Types.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace PolyCore {
namespace Utils {

/**
 * @brief Process-wide logger writing timestamped lines to stdout and, optionally, a file.
 *
 * Messages above the current level are dropped before the lock is taken.
 * Warnings are counted so the run can report them at exit.
 */
class Logger {
public:
    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel log_level() const { return current_level_; }

    /**
     * @brief Mirror output to a file (appended, no colors).
     * @throws std::runtime_error if the file cannot be opened.
     */
    void set_log_file(const std::string& filename);
    void close_log_file();

    void log(LogLevel level, const std::string& message, const char* file = nullptr, int line = -1);

    /// Warnings emitted since start.
    size_t warning_count() const { return warnings_.load(); }

    static void debug(const std::string& msg, const char* file = nullptr, int line = -1);
    static void info(const std::string& msg, const char* file = nullptr, int line = -1);
    static void warning(const std::string& msg, const char* file = nullptr, int line = -1);
    static void error(const std::string& msg, const char* file = nullptr, int line = -1);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel current_level_ = LogLevel::LOG_INFO;
    std::ofstream log_file_;
    std::mutex mutex_;
    std::atomic<size_t> warnings_{0};

    static const char* level_to_string(LogLevel level);
    static const char* color_code(LogLevel level);
};

/**
 * @brief Logs "START: action" on construction and "DONE : action (N ms)" on destruction.
 */
class ScopedLogger {
public:
    explicit ScopedLogger(const std::string& action_name, LogLevel level = LogLevel::LOG_INFO);
    ~ScopedLogger();

private:
    std::string action_name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_time_;
};

}  // namespace Utils
}  // namespace PolyCore

#define LOG_DEBUG(msg) PolyCore::Utils::Logger::debug(msg, __FILE__, __LINE__)
#define LOG_INFO(msg) PolyCore::Utils::Logger::info(msg, __FILE__, __LINE__)
#define LOG_WARNING(msg) PolyCore::Utils::Logger::warning(msg, __FILE__, __LINE__)
#define LOG_ERROR(msg) PolyCore::Utils::Logger::error(msg, __FILE__, __LINE__)
