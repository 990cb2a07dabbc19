#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filemover {

class MetricsStore;

/**
 * Outcome of one transfer operation
 */
struct FileOperationMetric {
    std::chrono::system_clock::time_point timestamp;
    std::string filename;
    uint64_t file_size_bytes = 0;
    double duration_seconds = 0.0;
    bool success = false;
    std::string error;
};

/**
 * Periodic system resource sample
 */
struct SystemMetric {
    std::chrono::system_clock::time_point timestamp;
    double cpu_percent = 0.0;
    double memory_percent = -1.0;
    double disk_free_gb = -1.0;
    int concurrent_operations = 0;
    int concurrency_limit = 0;
};

/**
 * Receiver of metrics records. Implementations must be thread-safe.
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record_file_operation(const FileOperationMetric& metric) = 0;
    virtual void record_system_metrics(const SystemMetric& metric) = 0;

    // Persists buffered records, if the sink persists at all
    virtual bool flush() { return true; }
};

struct PerformanceSummary {
    int hours = 0;
    int total_operations = 0;
    int successful_operations = 0;
    int failed_operations = 0;
    double success_rate_percent = 0.0;
    uint64_t total_bytes = 0;
    double average_speed_bytes_per_second = 0.0;
    double average_duration_seconds = 0.0;

    std::string to_string() const;
};

/**
 * In-memory metrics with age-based pruning and optional SQLite persistence.
 */
class MetricsCollector : public MetricsSink {
public:
    explicit MetricsCollector(std::shared_ptr<MetricsStore> store = nullptr);

    MetricsCollector(const MetricsCollector&) = delete;
    MetricsCollector& operator=(const MetricsCollector&) = delete;

    void record_file_operation(const FileOperationMetric& metric) override;
    void record_system_metrics(const SystemMetric& metric) override;

    // Summary over operations newer than now - hours. total_operations == 0
    // means nothing happened in that period.
    PerformanceSummary performance_summary(int hours = 24) const;

    std::vector<FileOperationMetric> file_operations() const;
    std::vector<SystemMetric> system_metrics() const;

    // Writes records not yet persisted to the store; returns false on store error.
    bool flush() override;

    // Pulls previously persisted records (within the retention window) into memory.
    bool load();


private:
    void prune_locked();

    mutable std::mutex mutex_;
    std::deque<FileOperationMetric> file_operations_;
    std::deque<SystemMetric> system_metrics_;
    std::vector<FileOperationMetric> pending_operations_;
    std::vector<SystemMetric> pending_system_;
    std::shared_ptr<MetricsStore> store_;
    std::chrono::hours max_age_{24 * 30};
};

} // namespace filemover
