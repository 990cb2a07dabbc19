#include "file_helpers.hpp"
#include "logger.hpp"

#include <filesystem>
#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace filemover {
namespace FileHelpers {

bool safe_exists(const std::string& path) {
    std::error_code ec;
    bool result = fs::exists(path, ec);
    if (ec) {
        Logger::debug("[Files] exists() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_is_directory(const std::string& path) {
    std::error_code ec;
    bool result = fs::is_directory(path, ec);
    if (ec) {
        Logger::debug("[Files] is_directory() I/O error for " + path + ": " + ec.message());
        return false;
    }
    return result;
}

bool safe_remove(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        Logger::warn("[Files] remove() failed for " + path + ": " + ec.message());
        return false;
    }
    return true;
}

bool directory_accessible(const std::string& path, std::string* reason) {
    auto fail = [reason](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (path.empty()) {
        return fail("Directory not configured");
    }
    if (!safe_exists(path)) {
        return fail("Directory does not exist: " + path);
    }
    if (!safe_is_directory(path)) {
        return fail("Path is not a directory: " + path);
    }
    if (access(path.c_str(), R_OK | W_OK) != 0) {
        return fail("Directory is not readable/writable: " + path);
    }
    return true;
}

std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string format_speed(double bytes_per_second) {
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bytes_per_second;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<int>(speed) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    }
    return oss.str();
}

std::string format_duration(std::chrono::seconds duration) {
    long long total = duration.count();
    if (total < 0) total = 0;

    long long days = total / 86400;
    long long hours = (total % 86400) / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (days > 0 || hours > 0) oss << hours << "h ";
    if (days > 0 || hours > 0 || minutes > 0) oss << minutes << "m ";
    oss << seconds << "s";
    return oss.str();
}

} // namespace FileHelpers
} // namespace filemover
