#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace filemover {

class AdmissionGate;
class CancellationToken;

enum class TransferOutcome {
    Success,
    DryRun,
    LockContention,
    DestinationExists,
    IoError,
    ChecksumMismatch,
    RetriesExhausted,
    Cancelled
};

std::string to_string(TransferOutcome outcome);

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::IoError;
    // For RetriesExhausted: the outcome of the final attempt
    TransferOutcome cause = TransferOutcome::IoError;
    int attempts = 0;
    uint64_t bytes = 0;
    std::string error;

    // DryRun counts as success
    bool succeeded() const {
        return outcome == TransferOutcome::Success || outcome == TransferOutcome::DryRun;
    }
};

// Filesystem calls used to commit the temp file. Each returns 0, or -1 with
// errno set. Empty members use the system call of the same name.
struct CommitCalls {
    std::function<int(const std::string&, const std::string&)> rename_noreplace;  // renameat2
    std::function<int(const std::string&, const std::string&)> link;
    std::function<int(const std::string&, const std::string&)> rename;
    std::function<int(const std::string&)> unlink;
};

struct TransferOptions {
    bool dry_run = false;
    bool verify_checksum = false;
    uint64_t max_bandwidth = 0;             // bytes/s, 0 = unlimited
    int retry_attempts = 5;
    double backoff_base_seconds = 1.0;
    double backoff_multiplier = 2.0;
    uint64_t progress_threshold_bytes = 50ull * 1024 * 1024;  // 0 disables progress logging
    size_t chunk_size = 64 * 1024;

    // Hex digest of a file, nullopt on read failure. Defaults to SHA-256.
    std::function<std::optional<std::string>(const std::string&)> hasher;
    CommitCalls commit_calls;
};

/**
 * Transfer Engine
 *
 * Moves one file from source to destination:
 *   lock -> copy to "<destination>.tmp" -> verify -> commit -> unlock
 *
 * The source is deleted only once the destination has been committed without
 * replacing an existing file and its directory entry is durable. Failed copy
 * and verify attempts are retried with jittered exponential backoff; lock
 * contention and an existing destination end the operation immediately.
 */
class TransferEngine {
public:
    TransferEngine(TransferOptions options, std::shared_ptr<AdmissionGate> gate);

    TransferResult transfer(const std::string& source,
                            const std::string& destination,
                            CancellationToken& token);

    // base * multiplier^failed_attempt * U(0.8, 1.2), failed_attempt counted from 1
    static std::chrono::duration<double> backoff_delay(int failed_attempt,
                                                       double base_seconds,
                                                       double multiplier,
                                                       std::mt19937& rng);

    static std::string temp_path_for(const std::string& destination);


private:
    TransferResult attempt(const std::string& source,
                           const std::string& destination,
                           CancellationToken& token);

    TransferOutcome copy_to_temp(const std::string& source,
                                 const std::string& temp_path,
                                 CancellationToken& token,
                                 uint64_t& bytes_copied,
                                 std::string& error);

    TransferOutcome verify(const std::string& source,
                           const std::string& temp_path,
                           std::string& error);

    TransferOutcome commit(const std::string& temp_path,
                           const std::string& destination,
                           std::string& error);

    std::chrono::duration<double> next_backoff(int failed_attempt);

    TransferOptions options_;
    std::shared_ptr<AdmissionGate> gate_;

    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

} // namespace filemover
