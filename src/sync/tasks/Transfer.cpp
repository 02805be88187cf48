#include "sync/tasks/Transfer.hpp"
#include "sync/Progress.hpp"
#include "log/Registry.hpp"

using namespace zs;
using namespace zs::sync::tasks;

Transfer::Transfer(Context& ctx, concurrency::AdmissionGate::Slot slot)
    : ctx(ctx), slot(std::move(slot)) {}

void Transfer::operator()() {
    std::exception_ptr error;

    try {
        transfer();
    } catch (const std::exception& e) {
        ctx.failure_seen.store(true, std::memory_order_release);
        log::Registry::sync()->error("[{}] Failed: {} - {}", label(), key(), e.what());
        error = std::current_exception();
    }

    slot.reset();

    if (error) promise.set_exception(error);
    else promise.set_value(true);
}

void Transfer::reportProgress(const uintmax_t bytes) const {
    ctx.progress->updateFileProgress(key(), bytes);
}
