#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace filemover {

/**
 * Shared cancellation flag.
 *
 * Every blocking wait in the pipeline (stability polling, throttle pauses,
 * retry backoff, inter-cycle sleep) goes through sleep_for() so that a
 * cancel() wakes it immediately.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    // Returns false if cancelled before (or while) sleeping.
    bool sleep_for(std::chrono::steady_clock::duration duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace filemover
