#pragma once

#include <memory>
#include <string>

namespace filemover {

/**
 * Sidecar lock marker for one source file.
 *
 * acquire() creates "<path>.lock" with O_CREAT|O_EXCL, so at most one
 * holder exists across threads and cooperating processes. The marker is
 * removed when the FileLock is destroyed. Markers left behind by a crashed
 * process are not expired automatically.
 */
class FileLock {
public:
    // Returns nullptr if the marker already exists or cannot be created.
    static std::unique_ptr<FileLock> acquire(const std::string& path);

    static std::string marker_path_for(const std::string& path);

    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    explicit FileLock(std::string marker_path) : marker_path_(std::move(marker_path)) {}

    std::string marker_path_;
};

} // namespace filemover
