#include "orchestrator.hpp"
#include "admission_gate.hpp"
#include "cancellation.hpp"
#include "concurrency_governor.hpp"
#include "file_helpers.hpp"
#include "load_sampler.hpp"
#include "logger.hpp"
#include "metrics.hpp"
#include "notifications.hpp"
#include "task_group.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace filemover {

// How often the cycle wait re-checks for shutdown
static constexpr auto WAIT_SLICE = std::chrono::milliseconds(200);

// "Still Disconnected" is sent every this many reconnect attempts
static constexpr int RECONNECT_NOTIFY_EVERY = 10;

/**
 * One dispatched transfer. Shared with its task thread, which may outlive
 * the cycle if it is abandoned at shutdown.
 */
struct Orchestrator::TransferSlot {
    CandidateFile file;
    std::string destination;
    TransferResult result;
    double seconds = 0.0;
    std::atomic<bool> done{false};
};

std::string to_string(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::Running: return "running";
        case OrchestratorState::ShuttingDown: return "shutting down";
        case OrchestratorState::Stopped: return "stopped";
    }
    return "unknown";
}

static StabilityDetector::Options detector_options(const MoverConfig& config) {
    StabilityDetector::Options options;
    options.source_dir = config.source_dir;
    options.filter = config.file_filter;
    options.window = config.stability_window;
    options.poll_interval = config.stability_poll_interval;
    return options;
}

static TransferOptions transfer_options(const MoverConfig& config) {
    TransferOptions options;
    options.dry_run = config.dry_run;
    options.verify_checksum = config.verify_checksum;
    options.max_bandwidth = config.max_bandwidth;
    options.retry_attempts = config.retry_attempts;
    options.backoff_base_seconds = config.backoff_base_seconds;
    options.backoff_multiplier = config.backoff_multiplier;
    options.progress_threshold_bytes = config.progress_threshold_bytes;
    return options;
}

static std::string join_path(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

Orchestrator::Orchestrator(EngineContext context)
    : context_(std::move(context))
    , token_(std::make_shared<CancellationToken>())
    , gate_(std::make_shared<AdmissionGate>(static_cast<size_t>(std::max(1, context_.config.max_workers))))
    , engine_(std::make_shared<TransferEngine>(transfer_options(context_.config), gate_))
    , detector_(detector_options(context_.config))
    , last_health_check_(std::chrono::steady_clock::now()) {

    governor_ = std::make_unique<ConcurrencyGovernor>(
        static_cast<size_t>(std::max(1, context_.config.max_workers)),
        *gate_,
        context_.load_sampler,
        context_.metrics,
        context_.config.load_sample_interval);
}

Orchestrator::~Orchestrator() {
    token_->cancel();
    governor_->stop();
}

void Orchestrator::notify(const std::string& message, const std::string& title, NotificationType type) {
    if (!context_.notifier) return;
    try {
        context_.notifier->notify(message, title, type);
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] Notification '" + title + "' failed: " + e.what());
    }
}

void Orchestrator::ensure_destination() {
    if (destination_ready_) return;
    std::error_code ec;
    std::filesystem::create_directories(context_.config.destination_dir, ec);
    if (ec) {
        Logger::error("[Orchestrator] Cannot create destination " + context_.config.destination_dir + ": " +
                      ec.message());
        return;
    }
    destination_ready_ = true;
}

void Orchestrator::request_shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }
    OrchestratorState expected = OrchestratorState::Running;
    state_.compare_exchange_strong(expected, OrchestratorState::ShuttingDown);
    Logger::info("[Orchestrator] Shutdown requested (" + to_string(state_.load()) + ")");
    token_->cancel();
}

void Orchestrator::run() {
    const auto& config = context_.config;
    Logger::info("[Orchestrator] Starting: " + config.source_dir + " -> " + config.destination_dir +
                 (config.dry_run ? " (dry run)" : ""));
    ensure_destination();

    notify("File Mover started.\nMonitoring: " + config.source_dir + "\nDestination: " + config.destination_dir,
           "File Mover Started", NotificationType::INFO);

    governor_->start();

    while (!shutdown_requested_) {
        run_once();
        if (!token_->sleep_for(config.scan_interval)) {
            break;
        }
    }

    finish();
}

void Orchestrator::run_once() {
    if (shutdown_requested_) return;
    try {
        ensure_destination();
        run_cycle();
    } catch (const std::exception& e) {
        Logger::error("[Orchestrator] Cycle failed: " + std::string(e.what()));
    }
}

bool Orchestrator::check_directories() {
    const auto& config = context_.config;
    std::string source_reason;
    std::string destination_reason;
    bool source_ok = FileHelpers::directory_accessible(config.source_dir, &source_reason);
    bool destination_ok = FileHelpers::directory_accessible(config.destination_dir, &destination_reason);

    if (!disconnected_) {
        if (!source_ok) {
            std::string message = "Error: Local directory (" + config.source_dir +
                                  ") is no longer accessible: " + source_reason;
            Logger::error("[Orchestrator] " + message);
            notify(message, "Local Disconnect", NotificationType::ERROR);
        } else if (!destination_ok) {
            std::string message = "Error: Remote directory (" + config.destination_dir +
                                  ") is no longer accessible: " + destination_reason;
            Logger::error("[Orchestrator] " + message);
            notify(message, "Remote Disconnect", NotificationType::ERROR);
        } else {
            return true;
        }
        disconnected_ = true;
        reconnect_attempts_ = 0;
        return false;
    }

    reconnect_attempts_++;
    if (source_ok && destination_ok) {
        std::string message = "Directories reconnected after " + std::to_string(reconnect_attempts_) + " attempts.";
        Logger::info("[Orchestrator] " + message);
        notify(message, "Reconnection", NotificationType::INFO);
        disconnected_ = false;
        stats_.reset_activity_timer();
        inactivity_notified_ = false;
        return true;
    }

    if (reconnect_attempts_ % RECONNECT_NOTIFY_EVERY == 0) {
        std::string message = "Still disconnected after " + std::to_string(reconnect_attempts_) + " attempts.";
        Logger::warn("[Orchestrator] " + message);
        notify(message, "Still Disconnected", NotificationType::WARNING);
    }
    return false;
}

void Orchestrator::check_health() {
    auto now = std::chrono::steady_clock::now();
    if (now - last_health_check_ < context_.config.health_check_interval) {
        return;
    }
    last_health_check_ = now;

    std::string summary = stats_.health_summary();
    summary += "\nConcurrency: " + std::to_string(governor_->current_limit()) + "/" +
               std::to_string(governor_->configured_max());
    Logger::info("[Orchestrator] Health check:\n" + summary);
    notify(summary, "Health Check", NotificationType::INFO);
}

void Orchestrator::check_inactivity() {
    if (inactivity_notified_) return;

    auto idle = stats_.since_last_success();
    if (idle < context_.config.inactivity_threshold) return;

    double minutes = std::chrono::duration<double>(idle).count() / 60.0;
    std::ostringstream message;
    message << "No files moved in over " << std::fixed << std::setprecision(1) << minutes << " minutes.";
    Logger::warn("[Orchestrator] " + message.str());
    notify(message.str(), "Inactivity Alert", NotificationType::WARNING);
    inactivity_notified_ = true;
}

void Orchestrator::run_cycle() {
    check_health();

    if (!check_directories()) {
        return;
    }

    std::vector<CandidateFile> ready = detector_.detect(*token_);
    if (token_->is_cancelled()) {
        return;
    }

    TaskGroup group("transfers");
    std::vector<std::shared_ptr<TransferSlot>> slots;
    slots.reserve(ready.size());

    for (auto& file : ready) {
        auto slot = std::make_shared<TransferSlot>();
        slot->destination = join_path(context_.config.destination_dir, file.name);
        slot->file = std::move(file);

        auto engine = engine_;
        auto token = token_;
        bool spawned = group.spawn([slot, engine, token]() {
            auto started = std::chrono::steady_clock::now();
            try {
                slot->result = engine->transfer(slot->file.path, slot->destination, *token);
            } catch (const std::exception& e) {
                slot->result.outcome = TransferOutcome::IoError;
                slot->result.error = std::string("unexpected exception: ") + e.what();
            }
            slot->seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            slot->done.store(true, std::memory_order_release);
        });
        if (spawned) {
            slots.push_back(std::move(slot));
        }
    }

    if (!slots.empty()) {
        Logger::info("[Orchestrator] Dispatched " + std::to_string(slots.size()) + " transfer(s)");
    }

    while (!group.wait_all_for(WAIT_SLICE)) {
        if (token_->is_cancelled()) {
            Logger::info("[Orchestrator] Waiting up to " +
                         std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                             context_.config.shutdown_grace).count()) +
                         "s for " + std::to_string(group.pending()) + " transfer(s) to unwind");
            if (!group.wait_all_for(context_.config.shutdown_grace)) {
                abandoned_transfers_ += group.abandon();
            }
            break;
        }
    }

    for (const auto& slot : slots) {
        if (!slot->done.load(std::memory_order_acquire)) {
            Logger::warn("[Orchestrator] Abandoned transfer of " + slot->file.name);
            continue;
        }
        fold_result(*slot);
    }

    if (metrics_dirty_ && context_.metrics) {
        if (context_.metrics->flush()) {
            metrics_dirty_ = false;
        } else {
            Logger::warn("[Orchestrator] Metrics flush failed, will retry next cycle");
        }
    }

    check_inactivity();
}

void Orchestrator::fold_result(const TransferSlot& slot) {
    const TransferResult& result = slot.result;
    const std::string& name = slot.file.name;

    switch (result.outcome) {
        case TransferOutcome::Cancelled:
            Logger::info("[Orchestrator] Transfer of " + name + " cancelled");
            return;
        case TransferOutcome::LockContention:
            Logger::info("[Orchestrator] " + name + " is locked by another mover, skipping this cycle");
            return;
        default:
            break;
    }

    FileOperationMetric metric;
    metric.timestamp = std::chrono::system_clock::now();
    metric.filename = name;
    metric.file_size_bytes = result.bytes > 0 ? result.bytes : slot.file.size;
    metric.duration_seconds = slot.seconds;
    metric.success = result.succeeded();
    metric.error = result.succeeded() ? "" : result.error;

    if (result.succeeded()) {
        stats_.record_success(name, result.bytes, slot.seconds);
        inactivity_notified_ = false;
        Logger::info("[Orchestrator] File " + name + " moved successfully");
    } else {
        stats_.record_failure(name, result.error);
        Logger::error("[Orchestrator] Failed to move " + name + " (" + to_string(result.outcome) + "): " +
                      result.error);
        if (result.outcome == TransferOutcome::DestinationExists) {
            notify("File " + name + " already exists in " + context_.config.destination_dir +
                   ". The source was left in place.",
                   "File Already Exists", NotificationType::WARNING);
        } else {
            std::string message = "Failed to move " + name + " after " + std::to_string(result.attempts) +
                                  " attempt(s): " + result.error;
            notify(message, "File Move Error", NotificationType::ERROR);
        }
    }

    if (context_.metrics) {
        context_.metrics->record_file_operation(metric);
        metrics_dirty_ = true;
    }
}

void Orchestrator::finish() {
    OrchestratorState expected = OrchestratorState::Running;
    state_.compare_exchange_strong(expected, OrchestratorState::ShuttingDown);
    Logger::info("[Orchestrator] Shutting down");

    token_->cancel();
    governor_->stop();

    if (context_.metrics && !context_.metrics->flush()) {
        Logger::warn("[Orchestrator] Final metrics flush failed");
    }

    std::string summary = stats_.final_summary();
    Logger::info("[Orchestrator] " + summary);
    notify(summary, "Shutdown Notification", NotificationType::INFO);

    state_ = OrchestratorState::Stopped;
    Logger::info("[Orchestrator] Shutdown complete");
}

} // namespace filemover
