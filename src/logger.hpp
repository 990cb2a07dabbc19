#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <cstddef>

namespace filemover {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

/**
 * Process-wide logger.
 *
 * The console honours the configured level; the log file (if any) always
 * receives DEBUG and above and is rotated once it grows past max_bytes.
 */
class Logger {
public:
    static void init(LogLevel level, const std::string& log_file_path = "",
                     size_t max_bytes = 5 * 1024 * 1024, int backups = 5);
    static void shutdown();
    static void log(LogLevel level, const std::string& message);

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warn(const std::string& message) { log(LogLevel::WARN, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }


private:
    static void rotate_locked();

    static LogLevel current_level;
    static std::ofstream log_file;
    static std::string log_path;
    static size_t max_bytes_;
    static int backups_;
    static std::mutex log_mutex;
};

} // namespace filemover
