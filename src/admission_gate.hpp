#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace filemover {

class CancellationToken;

/**
 * Counting admission gate with adjustable capacity.
 *
 * Capacity changes only affect new acquirers: a holder keeps its permit
 * until it releases it, even if capacity drops below the number in use.
 */
class AdmissionGate {
public:
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept;

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        explicit operator bool() const { return gate_ != nullptr; }
        void release();

    private:
        friend class AdmissionGate;
        explicit Permit(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a permit is free. Returns an empty Permit if the token is
    // cancelled first.
    Permit acquire(CancellationToken& token);

    // Non-blocking variant
    Permit try_acquire();

    void set_capacity(size_t capacity);

    size_t capacity() const;
    size_t in_use() const;
    size_t peak_in_use() const;

private:
    void release_one();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t capacity_;
    size_t in_use_ = 0;
    size_t peak_in_use_ = 0;
};

} // namespace filemover
