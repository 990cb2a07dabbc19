#include "metrics.hpp"
#include "metrics_store.hpp"
#include "file_helpers.hpp"
#include "logger.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace filemover {

std::string PerformanceSummary::to_string() const {
    if (total_operations == 0) {
        return "No operations in the last " + std::to_string(hours) + "h";
    }
    std::ostringstream oss;
    oss << total_operations << " operations in the last " << hours << "h: "
        << successful_operations << " ok, " << failed_operations << " failed ("
        << std::fixed << std::setprecision(1) << success_rate_percent << "% success), "
        << FileHelpers::format_bytes(total_bytes) << " moved at "
        << FileHelpers::format_speed(average_speed_bytes_per_second)
        << ", avg " << std::setprecision(2) << average_duration_seconds << "s per file";
    return oss.str();
}

MetricsCollector::MetricsCollector(std::shared_ptr<MetricsStore> store)
    : store_(std::move(store)) {
}

void MetricsCollector::record_file_operation(const FileOperationMetric& metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_operations_.push_back(metric);
    if (store_) {
        pending_operations_.push_back(metric);
    }
    prune_locked();
}

void MetricsCollector::record_system_metrics(const SystemMetric& metric) {
    std::lock_guard<std::mutex> lock(mutex_);
    system_metrics_.push_back(metric);
    if (store_) {
        pending_system_.push_back(metric);
    }
    prune_locked();
}

void MetricsCollector::prune_locked() {
    // Records are not guaranteed to arrive in timestamp order
    auto cutoff = std::chrono::system_clock::now() - max_age_;
    file_operations_.erase(
        std::remove_if(file_operations_.begin(), file_operations_.end(),
                       [&](const FileOperationMetric& m) { return m.timestamp < cutoff; }),
        file_operations_.end());
    system_metrics_.erase(
        std::remove_if(system_metrics_.begin(), system_metrics_.end(),
                       [&](const SystemMetric& m) { return m.timestamp < cutoff; }),
        system_metrics_.end());
}

PerformanceSummary MetricsCollector::performance_summary(int hours) const {
    std::lock_guard<std::mutex> lock(mutex_);

    PerformanceSummary summary;
    summary.hours = hours;
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(hours);

    double total_duration = 0.0;
    for (const auto& op : file_operations_) {
        if (op.timestamp < cutoff) continue;
        summary.total_operations++;
        if (op.success) {
            summary.successful_operations++;
            summary.total_bytes += op.file_size_bytes;
            total_duration += op.duration_seconds;
        } else {
            summary.failed_operations++;
        }
    }

    if (summary.total_operations > 0) {
        summary.success_rate_percent = 100.0 * summary.successful_operations / summary.total_operations;
    }
    if (total_duration > 0.0) {
        summary.average_speed_bytes_per_second = summary.total_bytes / total_duration;
    }
    if (summary.successful_operations > 0) {
        summary.average_duration_seconds = total_duration / summary.successful_operations;
    }
    return summary;
}

std::vector<FileOperationMetric> MetricsCollector::file_operations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {file_operations_.begin(), file_operations_.end()};
}

std::vector<SystemMetric> MetricsCollector::system_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {system_metrics_.begin(), system_metrics_.end()};
}

bool MetricsCollector::flush() {
    std::vector<FileOperationMetric> ops;
    std::vector<SystemMetric> sys;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!store_) return true;
        ops.swap(pending_operations_);
        sys.swap(pending_system_);
    }
    if (ops.empty() && sys.empty()) return true;

    bool ok = store_->append(ops, sys);
    if (ok) {
        store_->prune_older_than(std::chrono::system_clock::now() - max_age_);
        Logger::debug("[Metrics] Persisted " + std::to_string(ops.size()) + " operations, " +
                      std::to_string(sys.size()) + " system samples");
    } else {
        // Keep them for the next attempt
        std::lock_guard<std::mutex> lock(mutex_);
        pending_operations_.insert(pending_operations_.begin(), ops.begin(), ops.end());
        pending_system_.insert(pending_system_.begin(), sys.begin(), sys.end());
    }
    return ok;
}

bool MetricsCollector::load() {
    if (!store_) return true;

    auto since = std::chrono::system_clock::now() - max_age_;
    std::vector<FileOperationMetric> ops;
    std::vector<SystemMetric> sys;
    if (!store_->load_since(since, ops, sys)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    file_operations_.insert(file_operations_.begin(), ops.begin(), ops.end());
    system_metrics_.insert(system_metrics_.begin(), sys.begin(), sys.end());
    Logger::info("[Metrics] Loaded " + std::to_string(ops.size()) + " file operations and " +
                 std::to_string(sys.size()) + " system samples");
    return true;
}

} // namespace filemover
