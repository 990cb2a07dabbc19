#include "cancellation.hpp"

namespace filemover {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}

bool CancellationToken::sleep_for(std::chrono::steady_clock::duration duration) {
    if (duration <= std::chrono::steady_clock::duration::zero()) {
        return !cancelled_.load();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    return !cancelled_.load();
}

} // namespace filemover
