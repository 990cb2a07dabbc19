#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <chrono>

namespace filemover {
namespace FileHelpers {

/**
 * Safe filesystem operations that never throw exceptions.
 * These wrappers use std::error_code to handle I/O errors gracefully.
 */

/**
 * Safely check if a path exists (returns false on I/O errors)
 */
bool safe_exists(const std::string& path);

/**
 * Safely check if a path is a directory (returns false on I/O errors)
 */
bool safe_is_directory(const std::string& path);

/**
 * Remove a file, logging instead of throwing. Returns true if the path is gone afterwards.
 */
bool safe_remove(const std::string& path);

/**
 * Directory usable as a transfer endpoint: exists, is a directory, readable and writable.
 * On failure, reason receives a human readable explanation.
 */
bool directory_accessible(const std::string& path, std::string* reason = nullptr);

/**
 * Expand a leading "~/" using $HOME
 */
std::string expand_home(const std::string& path);

/**
 * Format bytes to human readable string (e.g. "1.5 MB")
 */
std::string format_bytes(uint64_t bytes);

/**
 * Format speed to human readable string (e.g. "1.5 MB/s")
 */
std::string format_speed(double bytes_per_second);

/**
 * Format a duration as "2d 3h 4m 5s", omitting leading zero units
 */
std::string format_duration(std::chrono::seconds duration);

} // namespace FileHelpers
} // namespace filemover
