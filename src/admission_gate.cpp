#include "admission_gate.hpp"
#include "cancellation.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>

namespace filemover {

// How often a blocked acquirer re-checks the cancellation token
static constexpr auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(100);

AdmissionGate::Permit& AdmissionGate::Permit::operator=(Permit&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void AdmissionGate::Permit::release() {
    if (gate_) {
        gate_->release_one();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {
}

AdmissionGate::Permit AdmissionGate::acquire(CancellationToken& token) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (in_use_ >= capacity_) {
        if (token.is_cancelled()) {
            return Permit();
        }
        cv_.wait_for(lock, CANCEL_POLL_INTERVAL);
    }
    if (token.is_cancelled()) {
        return Permit();
    }
    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return Permit(this);
}

AdmissionGate::Permit AdmissionGate::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ >= capacity_) {
        return Permit();
    }
    ++in_use_;
    peak_in_use_ = std::max(peak_in_use_, in_use_);
    return Permit(this);
}

void AdmissionGate::release_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

void AdmissionGate::set_capacity(size_t capacity) {
    size_t clamped = std::max<size_t>(1, capacity);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (clamped == capacity_) return;
        Logger::debug("[Gate] Capacity " + std::to_string(capacity_) + " -> " + std::to_string(clamped) +
                      " (" + std::to_string(in_use_) + " in use)");
        capacity_ = clamped;
    }
    cv_.notify_all();
}

size_t AdmissionGate::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t AdmissionGate::peak_in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_in_use_;
}

} // namespace filemover
