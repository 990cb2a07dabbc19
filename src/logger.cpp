#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace filemover {

LogLevel Logger::current_level = LogLevel::INFO;
std::ofstream Logger::log_file;
std::string Logger::log_path;
size_t Logger::max_bytes_ = 5 * 1024 * 1024;
int Logger::backups_ = 5;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level, const std::string& log_file_path,
                  size_t max_bytes, int backups) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
    max_bytes_ = max_bytes;
    backups_ = backups;
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = log_file_path;
    if (!log_path.empty()) {
        std::error_code ec;
        fs::path parent = fs::path(log_path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
        }
        log_file.open(log_path, std::ios::app);
        if (!log_file.is_open()) {
            std::cerr << "[Logger] Cannot open log file " << log_path << ", logging to console only" << std::endl;
            log_path.clear();
        }
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.flush();
        log_file.close();
    }
}

// Shifts filemover.log.N -> .N+1, dropping the oldest, then reopens a fresh file.
void Logger::rotate_locked() {
    log_file.close();

    std::error_code ec;
    if (backups_ > 0) {
        fs::remove(log_path + "." + std::to_string(backups_), ec);
        for (int i = backups_ - 1; i >= 1; --i) {
            std::string from = log_path + "." + std::to_string(i);
            if (fs::exists(from, ec)) {
                fs::rename(from, log_path + "." + std::to_string(i + 1), ec);
            }
        }
        fs::rename(log_path, log_path + ".1", ec);
    } else {
        fs::remove(log_path, ec);
    }

    log_file.open(log_path, std::ios::app);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);

    bool to_console = level >= current_level;
    bool to_file = log_file.is_open();
    if (!to_console && !to_file) return;

    // Timestamp
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
        case LogLevel::INFO:  level_str = "[INFO] "; break;
        case LogLevel::WARN:  level_str = "[WARN] "; break;
        case LogLevel::ERROR: level_str = "[ERROR]"; break;
    }

    if (to_file) {
        log_file << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
                 << " " << level_str << " " << message << std::endl;
        std::streamoff written = log_file.tellp();
        if (max_bytes_ > 0 && written > 0 && static_cast<size_t>(written) >= max_bytes_) {
            rotate_locked();
        }
    }

    if (to_console) {
        std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
        out << std::put_time(&local_tm, "%H:%M:%S")
            << " " << level_str << " " << message << std::endl;
    }
}

} // namespace filemover
