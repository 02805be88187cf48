#pragma once

#include "concurrency/Task.hpp"
#include "concurrency/AdmissionGate.hpp"
#include "util/objectKey.hpp"

#include <atomic>
#include <memory>
#include <optional>

namespace zs::storage { class Client; }

namespace zs::sync {
class Progress;
}

namespace zs::sync::tasks {

// Shared by every task of one executor invocation.
struct Context {
    std::shared_ptr<storage::Client> client;
    std::shared_ptr<Progress> progress;
    bool dry_run = false;
    std::atomic<bool> failure_seen{false};
};

// One single-object transfer holding an admission slot. The slot is released
// before the promise is fulfilled, so a resolved future means the slot is free.
struct Transfer : concurrency::PromisedTask {
    Context& ctx;
    std::optional<concurrency::AdmissionGate::Slot> slot;

    Transfer(Context& ctx, concurrency::AdmissionGate::Slot slot);

    void operator()() final;

    [[nodiscard]] virtual const util::ObjectKey& key() const = 0;

protected:
    virtual void transfer() = 0;
    [[nodiscard]] virtual const char* label() const = 0;

    void reportProgress(uintmax_t bytes) const;
};

}
