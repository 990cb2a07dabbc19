#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <string>

namespace filemover {

/**
 * Completed transfer as kept in the recent history
 */
struct TransferRecord {
    std::string filename;
    uint64_t bytes = 0;
    double duration_seconds = 0.0;
    bool success = false;
    std::string error;
    std::chrono::system_clock::time_point finished;
};

/**
 * Run Statistics
 *
 * Totals for the lifetime of the process. Only the orchestrator thread
 * touches an instance, and only between cycles.
 */
class RunStatistics {
public:
    RunStatistics();

    void record_success(const std::string& filename, uint64_t bytes, double duration_seconds);
    void record_failure(const std::string& filename, const std::string& error);

    // Restarts the inactivity timer without counting a transfer
    void reset_activity_timer();

    uint64_t total_moved() const { return total_moved_; }
    uint64_t total_errors() const { return total_errors_; }
    uint64_t total_bytes() const { return total_bytes_; }

    std::chrono::seconds uptime() const;
    std::chrono::steady_clock::duration since_last_success() const;

    // Average over the time spent copying, 0 when nothing was moved
    double average_speed() const;

    const std::deque<TransferRecord>& recent() const { return recent_; }

    std::string health_summary() const;
    std::string final_summary() const;

private:
    void remember(TransferRecord record);

    static constexpr size_t MAX_HISTORY = 100;

    uint64_t total_moved_ = 0;
    uint64_t total_errors_ = 0;
    uint64_t total_bytes_ = 0;
    double total_seconds_ = 0.0;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_success_;
    std::deque<TransferRecord> recent_;
};

} // namespace filemover
