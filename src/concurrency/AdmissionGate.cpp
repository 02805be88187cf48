#include "concurrency/AdmissionGate.hpp"

#include <stdexcept>

using namespace zs::concurrency;

AdmissionGate::AdmissionGate(const size_t limit) : limit_(limit) {
    if (limit_ == 0) throw std::invalid_argument("AdmissionGate limit must be at least 1");
}

void AdmissionGate::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return inFlight_ < limit_; });
    ++inFlight_;
}

void AdmissionGate::release() {
    {
        std::scoped_lock lock(mutex_);
        if (inFlight_ == 0) throw std::logic_error("AdmissionGate released more often than acquired");
        --inFlight_;
    }
    cv_.notify_all();
}

void AdmissionGate::drain() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return inFlight_ == 0; });
}

size_t AdmissionGate::inFlight() const {
    std::scoped_lock lock(mutex_);
    return inFlight_;
}

AdmissionGate::Slot AdmissionGate::enter() {
    acquire();
    return Slot(*this);
}
