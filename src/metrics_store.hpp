#ifndef FILEMOVER_METRICS_STORE_HPP
#define FILEMOVER_METRICS_STORE_HPP

#include "metrics.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace filemover {

/**
 * MetricsStore - SQLite persistence for file operation and system metrics
 *
 * Records are appended in batches by MetricsCollector::flush() and
 * pruned by age. Timestamps are stored as milliseconds since the epoch.
 * Default location: ~/.cache/filemover/metrics.db
 */
class MetricsStore {
public:
    explicit MetricsStore(std::string db_path);
    ~MetricsStore();

    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    // Opens (creating if needed) the database and its tables
    bool initialize();
    void close();

    bool append(const std::vector<FileOperationMetric>& operations,
                const std::vector<SystemMetric>& samples);

    bool load_since(std::chrono::system_clock::time_point since,
                    std::vector<FileOperationMetric>& operations,
                    std::vector<SystemMetric>& samples);

    // Returns the number of rows removed, or -1 on error
    int prune_older_than(std::chrono::system_clock::time_point cutoff);

private:
    bool create_tables();

    std::string db_path_;
    void* db_ = nullptr;  // sqlite3*
    std::mutex mutex_;
};

} // namespace filemover

#endif // FILEMOVER_METRICS_STORE_HPP
