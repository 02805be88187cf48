#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace zs::concurrency {

// Counting gate bounding how many transfers are in flight at once.
class AdmissionGate {
public:
    explicit AdmissionGate(size_t limit);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    void acquire();
    void release();

    // Blocks until every acquired slot has been released.
    void drain();

    [[nodiscard]] size_t limit() const noexcept { return limit_; }
    [[nodiscard]] size_t inFlight() const;

    // Releases its slot on destruction unless moved-from.
    class Slot {
    public:
        explicit Slot(AdmissionGate& gate) : gate_(&gate) {}
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&&) = delete;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { if (gate_) gate_->release(); }

    private:
        AdmissionGate* gate_;
    };

    // acquire() + a Slot that releases it
    [[nodiscard]] Slot enter();

private:
    const size_t limit_;
    size_t inFlight_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}
