#include "transfer_engine.hpp"
#include "admission_gate.hpp"
#include "cancellation.hpp"
#include "checksum.hpp"
#include "file_helpers.hpp"
#include "file_lock.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <future>
#include <iomanip>
#include <sstream>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace filemover {

namespace {

// Closes the descriptor on scope exit
class ScopedFd {
public:
    explicit ScopedFd(int fd = -1) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    // Returns the close() result so write errors reported at close are not lost
    int reset() {
        int rc = 0;
        if (fd_ >= 0) {
            rc = ::close(fd_);
            fd_ = -1;
        }
        return rc;
    }

private:
    int fd_;
};

std::string errno_message(const std::string& what, const std::string& path) {
    return what + " " + path + ": " + std::strerror(errno);
}

std::string parent_directory(const std::string& path) {
    auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string base_name(const std::string& path) {
    auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool fsync_directory(const std::string& dir) {
    ScopedFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd) {
        Logger::warn("[Engine] " + errno_message("Cannot open directory for fsync", dir));
        return false;
    }
    if (::fsync(fd.get()) != 0) {
        Logger::warn("[Engine] " + errno_message("fsync failed for directory", dir));
        return false;
    }
    return true;
}

int system_rename_noreplace(const std::string& from, const std::string& to) {
#if defined(SYS_renameat2) && defined(RENAME_NOREPLACE)
    return static_cast<int>(
        ::syscall(SYS_renameat2, AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE));
#else
    errno = ENOSYS;
    return -1;
#endif
}

// Rename that fails with EEXIST instead of replacing an existing target.
// Returns 0 or -1 with errno set; a failure leaves no new destination entry.
int rename_noreplace(const std::string& from, const std::string& to, const CommitCalls& calls) {
    if (calls.rename_noreplace(from, to) == 0) {
        return 0;
    }
    if (errno != ENOSYS && errno != EINVAL) {
        return -1;
    }

    // No renameat2 support: link() refuses an existing target too
    if (calls.link(from, to) == 0) {
        if (calls.unlink(from) == 0) {
            return 0;
        }
        int saved = errno;
        Logger::error("[Engine] Cannot remove temp file " + from + " after link: " + std::strerror(saved));
        // Both names share one inode, so dropping the new one restores the old state
        if (calls.unlink(to) != 0) {
            Logger::error("[Engine] " + errno_message("Cannot roll back", to));
        }
        errno = saved;
        return -1;
    }
    if (errno != EPERM && errno != EOPNOTSUPP && errno != ENOSYS) {
        return -1;
    }

    // No hard links either (FAT, some FUSE mounts): check, then plain rename
    struct stat st;
    if (::lstat(to.c_str(), &st) == 0) {
        errno = EEXIST;
        return -1;
    }
    if (errno != ENOENT) {
        return -1;
    }
    Logger::debug("[Engine] Hard links unsupported, committing " + to + " with rename()");
    return calls.rename(from, to);
}

bool write_all(int fd, const char* data, size_t length) {
    while (length > 0) {
        ssize_t written = ::write(fd, data, length);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        length -= static_cast<size_t>(written);
    }
    return true;
}

bool is_retryable(TransferOutcome outcome) {
    return outcome == TransferOutcome::IoError || outcome == TransferOutcome::ChecksumMismatch;
}

} // namespace

std::string to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Success: return "success";
        case TransferOutcome::DryRun: return "dry run";
        case TransferOutcome::LockContention: return "lock contention";
        case TransferOutcome::DestinationExists: return "destination exists";
        case TransferOutcome::IoError: return "I/O error";
        case TransferOutcome::ChecksumMismatch: return "checksum mismatch";
        case TransferOutcome::RetriesExhausted: return "retries exhausted";
        case TransferOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

TransferEngine::TransferEngine(TransferOptions options, std::shared_ptr<AdmissionGate> gate)
    : options_(std::move(options))
    , gate_(std::move(gate))
    , rng_(std::random_device{}()) {
    if (!options_.hasher) {
        options_.hasher = &checksum::sha256_file;
    }
    CommitCalls& calls = options_.commit_calls;
    if (!calls.rename_noreplace) {
        calls.rename_noreplace = &system_rename_noreplace;
    }
    if (!calls.link) {
        calls.link = [](const std::string& from, const std::string& to) {
            return ::link(from.c_str(), to.c_str());
        };
    }
    if (!calls.rename) {
        calls.rename = [](const std::string& from, const std::string& to) {
            return std::rename(from.c_str(), to.c_str());
        };
    }
    if (!calls.unlink) {
        calls.unlink = [](const std::string& path) { return ::unlink(path.c_str()); };
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = checksum::CHUNK_SIZE;
    }
    options_.retry_attempts = std::max(1, options_.retry_attempts);
}

std::string TransferEngine::temp_path_for(const std::string& destination) {
    return destination + ".tmp";
}

std::chrono::duration<double> TransferEngine::backoff_delay(int failed_attempt,
                                                            double base_seconds,
                                                            double multiplier,
                                                            std::mt19937& rng) {
    std::uniform_real_distribution<double> jitter(0.8, 1.2);
    double nominal = base_seconds * std::pow(multiplier, failed_attempt);
    return std::chrono::duration<double>(nominal * jitter(rng));
}

std::chrono::duration<double> TransferEngine::next_backoff(int failed_attempt) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return backoff_delay(failed_attempt, options_.backoff_base_seconds, options_.backoff_multiplier, rng_);
}

TransferResult TransferEngine::transfer(const std::string& source,
                                        const std::string& destination,
                                        CancellationToken& token) {
    const std::string name = base_name(source);
    TransferResult result;

    for (int attempt_no = 1; attempt_no <= options_.retry_attempts; ++attempt_no) {
        if (token.is_cancelled()) {
            result.outcome = TransferOutcome::Cancelled;
            result.error = "cancelled before attempt " + std::to_string(attempt_no);
            return result;
        }

        TransferResult current = attempt(source, destination, token);
        current.attempts = attempt_no;

        if (!is_retryable(current.outcome)) {
            return current;
        }

        result = current;
        Logger::warn("[Engine] " + name + ": attempt " + std::to_string(attempt_no) + "/" +
                     std::to_string(options_.retry_attempts) + " failed (" +
                     to_string(current.outcome) + "): " + current.error);

        if (attempt_no == options_.retry_attempts) {
            break;
        }

        auto delay = next_backoff(attempt_no);
        Logger::debug("[Engine] " + name + ": retrying in " +
                      std::to_string(static_cast<int>(delay.count() * 1000)) + " ms");
        if (!token.sleep_for(std::chrono::duration_cast<std::chrono::steady_clock::duration>(delay))) {
            result.outcome = TransferOutcome::Cancelled;
            result.error = "cancelled during backoff";
            return result;
        }
    }

    result.cause = result.outcome;
    result.outcome = TransferOutcome::RetriesExhausted;
    result.attempts = options_.retry_attempts;
    Logger::error("[Engine] " + name + ": giving up after " + std::to_string(result.attempts) +
                  " attempts, last error: " + result.error);
    return result;
}

TransferResult TransferEngine::attempt(const std::string& source,
                                       const std::string& destination,
                                       CancellationToken& token) {
    TransferResult result;
    const std::string name = base_name(source);

    auto lock = FileLock::acquire(source);
    if (!lock) {
        result.outcome = TransferOutcome::LockContention;
        result.error = "lock held by another mover: " + FileLock::marker_path_for(source);
        return result;
    }

    if (options_.dry_run) {
        Logger::info("[Engine] DRY RUN: would move " + source + " -> " + destination);
        result.outcome = TransferOutcome::DryRun;
        return result;
    }

    if (FileHelpers::safe_exists(destination)) {
        result.outcome = TransferOutcome::DestinationExists;
        result.error = "destination already exists: " + destination;
        Logger::warn("[Engine] " + name + ": " + result.error);
        return result;
    }

    AdmissionGate::Permit permit;
    if (gate_) {
        permit = gate_->acquire(token);
        if (!permit) {
            result.outcome = TransferOutcome::Cancelled;
            result.error = "cancelled while waiting for admission";
            return result;
        }
    }

    const std::string temp_path = temp_path_for(destination);
    auto started = std::chrono::steady_clock::now();

    TransferOutcome step = copy_to_temp(source, temp_path, token, result.bytes, result.error);
    if (step == TransferOutcome::Success && options_.verify_checksum) {
        step = verify(source, temp_path, result.error);
    }
    if (step == TransferOutcome::Success) {
        step = commit(temp_path, destination, result.error);
    }

    if (step != TransferOutcome::Success) {
        FileHelpers::safe_remove(temp_path);
        result.outcome = step;
        return result;
    }

    // Destination is committed; only now may the source go
    if (::unlink(source.c_str()) != 0) {
        // The move itself is complete; the leftover source shows up as a collision next cycle
        result.outcome = TransferOutcome::Success;
        result.error = errno_message("Committed but cannot remove source", source);
        Logger::error("[Engine] " + result.error);
        return result;
    }

    double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    std::ostringstream took;
    took << std::fixed << std::setprecision(2) << seconds;
    Logger::info("[Engine] Moved " + name + " (" + FileHelpers::format_bytes(result.bytes) + ") in " +
                 took.str() + "s");
    result.outcome = TransferOutcome::Success;
    return result;
}

TransferOutcome TransferEngine::copy_to_temp(const std::string& source,
                                             const std::string& temp_path,
                                             CancellationToken& token,
                                             uint64_t& bytes_copied,
                                             std::string& error) {
    bytes_copied = 0;

    ScopedFd in(::open(source.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in) {
        error = errno_message("Cannot open source", source);
        return TransferOutcome::IoError;
    }

    struct stat st;
    if (::fstat(in.get(), &st) != 0) {
        error = errno_message("Cannot stat source", source);
        return TransferOutcome::IoError;
    }
    const uint64_t total = static_cast<uint64_t>(st.st_size);

    ScopedFd out(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 0777));
    if (!out) {
        error = errno_message("Cannot create temp file", temp_path);
        return TransferOutcome::IoError;
    }

    const bool track_progress = options_.progress_threshold_bytes > 0 && total >= options_.progress_threshold_bytes;
    int next_progress_step = 1;
    const std::string name = base_name(source);

    std::vector<char> buffer(options_.chunk_size);
    auto started = std::chrono::steady_clock::now();

    while (true) {
        if (token.is_cancelled()) {
            error = "cancelled during copy";
            return TransferOutcome::Cancelled;
        }

        ssize_t got = ::read(in.get(), buffer.data(), buffer.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            error = errno_message("Read failed on", source);
            return TransferOutcome::IoError;
        }
        if (got == 0) break;

        if (!write_all(out.get(), buffer.data(), static_cast<size_t>(got))) {
            error = errno_message("Write failed on", temp_path);
            return TransferOutcome::IoError;
        }
        bytes_copied += static_cast<uint64_t>(got);

        if (track_progress) {
            while (next_progress_step < 10 && bytes_copied * 10 >= total * next_progress_step) {
                Logger::info("[Engine] " + name + ": " + std::to_string(next_progress_step * 10) + "% (" +
                             FileHelpers::format_bytes(bytes_copied) + " / " +
                             FileHelpers::format_bytes(total) + ")");
                ++next_progress_step;
            }
        }

        if (options_.max_bandwidth > 0) {
            double expected = static_cast<double>(bytes_copied) / static_cast<double>(options_.max_bandwidth);
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            if (expected > elapsed) {
                auto pause = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                    std::chrono::duration<double>(expected - elapsed));
                if (!token.sleep_for(pause)) {
                    error = "cancelled during throttle pause";
                    return TransferOutcome::Cancelled;
                }
            }
        }
    }

    if (::fsync(out.get()) != 0) {
        error = errno_message("fsync failed on", temp_path);
        return TransferOutcome::IoError;
    }
    if (out.reset() != 0) {
        error = errno_message("Close failed on", temp_path);
        return TransferOutcome::IoError;
    }

    if (bytes_copied != total) {
        error = "source size changed during copy (" + std::to_string(total) + " -> " +
                std::to_string(bytes_copied) + " bytes)";
        return TransferOutcome::IoError;
    }
    return TransferOutcome::Success;
}

TransferOutcome TransferEngine::verify(const std::string& source,
                                       const std::string& temp_path,
                                       std::string& error) {
    auto hasher = options_.hasher;
    auto source_hash = std::async(std::launch::async, hasher, source);
    auto temp_hash = std::async(std::launch::async, hasher, temp_path);

    std::optional<std::string> expected;
    std::optional<std::string> actual;
    try {
        expected = source_hash.get();
        actual = temp_hash.get();
    } catch (const std::exception& e) {
        error = std::string("checksum computation failed: ") + e.what();
        return TransferOutcome::IoError;
    }

    if (!expected || !actual) {
        error = "checksum computation failed for " + (expected ? temp_path : source);
        return TransferOutcome::IoError;
    }
    if (*expected != *actual) {
        error = "checksum mismatch (source " + expected->substr(0, 12) + ", copy " + actual->substr(0, 12) + ")";
        return TransferOutcome::ChecksumMismatch;
    }
    Logger::debug("[Engine] Checksum verified for " + base_name(source) + ": " + *expected);
    return TransferOutcome::Success;
}

TransferOutcome TransferEngine::commit(const std::string& temp_path,
                                       const std::string& destination,
                                       std::string& error) {
    if (rename_noreplace(temp_path, destination, options_.commit_calls) != 0) {
        if (errno == EEXIST) {
            error = "destination appeared during transfer: " + destination;
            return TransferOutcome::DestinationExists;
        }
        error = errno_message("Cannot commit", destination);
        return TransferOutcome::IoError;
    }

    if (!fsync_directory(parent_directory(destination))) {
        // The new entry may not survive a crash, so undo it and keep the source
        error = "destination directory not durable: " + parent_directory(destination);
        if (::unlink(destination.c_str()) != 0) {
            Logger::error("[Engine] " + errno_message("Cannot roll back", destination));
        }
        return TransferOutcome::IoError;
    }
    return TransferOutcome::Success;
}

} // namespace filemover
