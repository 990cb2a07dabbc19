#pragma once

#include "cancellation.hpp"
#include "load_sampler.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace filemover {

class AdmissionGate;
class MetricsSink;

/**
 * Concurrency Governor
 *
 * Keeps the admission gate's capacity in line with system load:
 * - initial limit from one load reading at construction
 * - background sampling every interval: CPU above 80% steps the limit down
 *   by one (never below 1), CPU below 50% restores the configured maximum
 * - each reading is forwarded to the metrics sink as a system sample
 *
 * With a sampler that reports no signal the limit stays at the configured
 * maximum and no thread is started.
 */
class ConcurrencyGovernor {
public:
    static constexpr double HIGH_CPU_PERCENT = 80.0;
    static constexpr double LOW_CPU_PERCENT = 50.0;

    ConcurrencyGovernor(size_t configured_max,
                        AdmissionGate& gate,
                        std::shared_ptr<LoadSampler> sampler,
                        std::shared_ptr<MetricsSink> metrics,
                        std::chrono::milliseconds sample_interval);
    ~ConcurrencyGovernor();

    ConcurrencyGovernor(const ConcurrencyGovernor&) = delete;
    ConcurrencyGovernor& operator=(const ConcurrencyGovernor&) = delete;

    // Limit to start with, given one load reading
    static size_t initial_limit(size_t configured_max, const std::optional<LoadSample>& sample);

    void start();
    void stop();

    // Applies one reading: adjusts the limit and resizes the gate.
    // Returns the resulting limit.
    size_t adjust(const LoadSample& sample);

    size_t current_limit() const { return current_limit_.load(); }
    size_t configured_max() const { return configured_max_; }
    std::optional<LoadSample> last_sample() const;

private:
    void monitor_loop();
    void record_sample(const LoadSample& sample);

    const size_t configured_max_;
    AdmissionGate& gate_;
    std::shared_ptr<LoadSampler> sampler_;
    std::shared_ptr<MetricsSink> metrics_;
    std::chrono::milliseconds sample_interval_;

    std::atomic<size_t> current_limit_;
    mutable std::mutex sample_mutex_;
    std::optional<LoadSample> last_sample_;

    CancellationToken stop_token_;
    std::atomic<bool> running_{false};
    std::thread monitor_thread_;
};

} // namespace filemover
