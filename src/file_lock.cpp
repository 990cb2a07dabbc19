#include "file_lock.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace filemover {

std::string FileLock::marker_path_for(const std::string& path) {
    return path + ".lock";
}

std::unique_ptr<FileLock> FileLock::acquire(const std::string& path) {
    std::string marker = marker_path_for(path);

    int fd = ::open(marker.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) {
        if (errno == EEXIST) {
            Logger::info("[Lock] Lock already exists for " + path);
        } else {
            Logger::warn("[Lock] Cannot create lock marker " + marker + ": " + std::string(strerror(errno)));
        }
        return nullptr;
    }

    // Record the owner for operators inspecting stale markers
    std::string pid = std::to_string(getpid()) + "\n";
    if (::write(fd, pid.c_str(), pid.size()) < 0) {
        Logger::debug("[Lock] Failed to write PID to " + marker);
    }
    ::close(fd);

    return std::unique_ptr<FileLock>(new FileLock(marker));
}

FileLock::~FileLock() {
    if (::unlink(marker_path_.c_str()) != 0 && errno != ENOENT) {
        Logger::error("[Lock] Failed to release lock " + marker_path_ + ": " + std::string(strerror(errno)));
    }
}

} // namespace filemover
