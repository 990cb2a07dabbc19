#pragma once

#include "run_statistics.hpp"
#include "settings.hpp"
#include "stability_detector.hpp"
#include "transfer_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace filemover {

class AdmissionGate;
class CancellationToken;
class ConcurrencyGovernor;
class LoadSampler;
class MetricsSink;
class NotificationSink;
enum class NotificationType;

/**
 * Everything the orchestrator needs from the outside, built once at startup
 */
struct EngineContext {
    MoverConfig config;
    std::shared_ptr<NotificationSink> notifier;
    std::shared_ptr<MetricsSink> metrics;
    std::shared_ptr<LoadSampler> load_sampler;  // null: no load signal
};

enum class OrchestratorState {
    Running,
    ShuttingDown,
    Stopped
};

std::string to_string(OrchestratorState state);

/**
 * Orchestrator
 *
 * Runs discrete cycles until shutdown is requested:
 *   health check -> directory check -> detect stable files ->
 *   one transfer task per file -> wait for all -> fold results ->
 *   inactivity check -> sleep
 *
 * Cycles never overlap. One file's failure does not affect the other files
 * of the cycle. After request_shutdown() running transfers unwind at their
 * next cancellation point; tasks still running after the shutdown grace
 * period are abandoned.
 */
class Orchestrator {
public:
    explicit Orchestrator(EngineContext context);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Blocks until shutdown completes; state is Stopped afterwards
    void run();

    // Exactly one cycle, without startup or shutdown notifications
    void run_once();

    // Thread-safe; may be called from any thread, any number of times
    void request_shutdown();

    OrchestratorState state() const { return state_.load(); }
    bool disconnected() const { return disconnected_; }

    const RunStatistics& statistics() const { return stats_; }

    // Transfers still running when their cycle gave up waiting at shutdown
    size_t abandoned_transfers() const { return abandoned_transfers_; }

private:
    struct TransferSlot;

    void ensure_destination();
    void notify(const std::string& message, const std::string& title, NotificationType type);

    void run_cycle();
    bool check_directories();
    void check_health();
    void check_inactivity();
    void fold_result(const TransferSlot& slot);
    void finish();

    EngineContext context_;
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<AdmissionGate> gate_;
    std::shared_ptr<TransferEngine> engine_;
    std::unique_ptr<ConcurrencyGovernor> governor_;
    StabilityDetector detector_;

    std::atomic<OrchestratorState> state_{OrchestratorState::Running};
    std::atomic<bool> shutdown_requested_{false};

    RunStatistics stats_;
    std::chrono::steady_clock::time_point last_health_check_;
    bool inactivity_notified_ = false;
    bool disconnected_ = false;
    int reconnect_attempts_ = 0;
    bool destination_ready_ = false;
    bool metrics_dirty_ = false;
    size_t abandoned_transfers_ = 0;
};

} // namespace filemover
