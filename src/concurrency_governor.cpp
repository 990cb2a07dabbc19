#include "concurrency_governor.hpp"
#include "admission_gate.hpp"
#include "logger.hpp"
#include "metrics.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace filemover {

static std::string describe(const LoadSample& sample) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "cpu " << sample.cpu_percent << "%";
    if (sample.load_average >= 0) {
        oss << ", load " << std::setprecision(2) << sample.load_average;
    }
    return oss.str();
}

size_t ConcurrencyGovernor::initial_limit(size_t configured_max, const std::optional<LoadSample>& sample) {
    size_t configured = std::max<size_t>(1, configured_max);
    if (!sample) {
        return configured;
    }

    if (sample->load_average > 1.0) {
        size_t busy = static_cast<size_t>(std::floor(sample->load_average));
        return busy >= configured ? 1 : configured - busy;
    }
    if (sample->cpu_percent > HIGH_CPU_PERCENT) {
        return std::max<size_t>(1, configured - 1);
    }
    return configured;
}

ConcurrencyGovernor::ConcurrencyGovernor(size_t configured_max,
                                         AdmissionGate& gate,
                                         std::shared_ptr<LoadSampler> sampler,
                                         std::shared_ptr<MetricsSink> metrics,
                                         std::chrono::milliseconds sample_interval)
    : configured_max_(std::max<size_t>(1, configured_max))
    , gate_(gate)
    , sampler_(sampler ? std::move(sampler) : std::make_shared<NullLoadSampler>())
    , metrics_(std::move(metrics))
    , sample_interval_(sample_interval)
    , current_limit_(configured_max_) {

    std::optional<LoadSample> first;
    if (sampler_->available()) {
        first = sampler_->sample();
    }
    current_limit_ = initial_limit(configured_max_, first);
    if (first) {
        std::lock_guard<std::mutex> lock(sample_mutex_);
        last_sample_ = first;
        Logger::info("[Governor] Initial concurrency " + std::to_string(current_limit_.load()) + "/" +
                     std::to_string(configured_max_) + " (" + describe(*first) + ")");
    } else {
        Logger::info("[Governor] No load signal, concurrency fixed at " + std::to_string(configured_max_));
    }
    gate_.set_capacity(current_limit_);
}

ConcurrencyGovernor::~ConcurrencyGovernor() {
    stop();
}

void ConcurrencyGovernor::start() {
    if (running_) return;
    if (!sampler_->available()) {
        Logger::debug("[Governor] Load sampler unavailable, not starting monitor thread");
        return;
    }

    running_ = true;
    try {
        monitor_thread_ = std::thread(&ConcurrencyGovernor::monitor_loop, this);
        Logger::info("[Governor] Started load monitoring every " +
                     std::to_string(sample_interval_.count()) + " ms");
    } catch (const std::system_error& e) {
        Logger::error("[Governor] Failed to create monitor thread: " + std::string(e.what()));
        running_ = false;
    }
}

void ConcurrencyGovernor::stop() {
    if (!running_) return;
    running_ = false;
    stop_token_.cancel();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    Logger::info("[Governor] Stopped load monitoring");
}

std::optional<LoadSample> ConcurrencyGovernor::last_sample() const {
    std::lock_guard<std::mutex> lock(sample_mutex_);
    return last_sample_;
}

size_t ConcurrencyGovernor::adjust(const LoadSample& sample) {
    {
        std::lock_guard<std::mutex> lock(sample_mutex_);
        last_sample_ = sample;
    }

    size_t previous = current_limit_.load();
    size_t next = previous;
    if (sample.cpu_percent > HIGH_CPU_PERCENT) {
        next = previous > 1 ? previous - 1 : 1;
    } else if (sample.cpu_percent < LOW_CPU_PERCENT) {
        next = configured_max_;
    }

    if (next != previous) {
        current_limit_ = next;
        gate_.set_capacity(next);
        if (next < previous) {
            Logger::info("[Governor] High load (" + describe(sample) + "), concurrency " +
                         std::to_string(previous) + " -> " + std::to_string(next));
        } else {
            Logger::info("[Governor] Load eased (" + describe(sample) + "), concurrency restored to " +
                         std::to_string(next));
        }
    }
    return next;
}

void ConcurrencyGovernor::record_sample(const LoadSample& sample) {
    if (!metrics_) return;
    SystemMetric metric;
    metric.timestamp = std::chrono::system_clock::now();
    metric.cpu_percent = sample.cpu_percent;
    metric.memory_percent = sample.memory_percent;
    metric.disk_free_gb = sample.disk_free_gb;
    metric.concurrent_operations = static_cast<int>(gate_.in_use());
    metric.concurrency_limit = static_cast<int>(current_limit_.load());
    metrics_->record_system_metrics(metric);
}

void ConcurrencyGovernor::monitor_loop() {
    while (running_) {
        if (!stop_token_.sleep_for(sample_interval_)) {
            break;
        }

        try {
            auto sample = sampler_->sample();
            if (!sample) {
                Logger::debug("[Governor] Load sample failed, holding at " +
                              std::to_string(current_limit_.load()));
                continue;
            }
            adjust(*sample);
            record_sample(*sample);
        } catch (const std::exception& e) {
            Logger::error("[Governor] Monitor iteration failed: " + std::string(e.what()));
        }
    }
}

} // namespace filemover
