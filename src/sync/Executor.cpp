#include "sync/Executor.hpp"
#include "sync/Progress.hpp"
#include "sync/TransferFailed.hpp"
#include "sync/tasks/Upload.hpp"
#include "sync/tasks/Download.hpp"
#include "storage/Client.hpp"
#include "storage/errors.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <future>

using namespace zs;
using namespace zs::sync;
using namespace zs::sync::model;

namespace fs = std::filesystem;

namespace {
unsigned int clampParallel(const unsigned int n) {
    return std::clamp(n, config::MIN_PARALLEL, config::MAX_PARALLEL);
}

uintmax_t itemBytes(const UploadItem& item) { return item.local.size_bytes; }
uintmax_t itemBytes(const DownloadItem& item) { return item.remote.size_bytes; }

[[noreturn]] void raiseTransferFailed(const util::ObjectKey& key, const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const storage::StorageError& e) {
        throw TransferFailed(key, e.kind(), e.what());
    } catch (const std::exception& e) {
        throw TransferFailed(key, storage::ErrorKind::Unknown, e.what());
    }
}
}

Executor::Result& Executor::Result::operator+=(const Result& other) {
    succeeded += other.succeeded;
    skipped += other.skipped;
    failed += other.failed;
    bytes += other.bytes;
    return *this;
}

Executor::Executor(std::shared_ptr<storage::Client> client, std::shared_ptr<Progress> progress, ExecutorOptions options)
    : client_(std::move(client)),
      progress_(std::move(progress)),
      options_(options),
      gate_(clampParallel(options.parallel)),
      pool_(clampParallel(options.parallel)) {
    if (!client_) throw std::invalid_argument("Executor requires a storage client");
    if (!progress_) throw std::invalid_argument("Executor requires a progress aggregator");
    options_.parallel = clampParallel(options_.parallel);
}

// ##########################################################################
// ############################## TRANSFERS #################################
// ##########################################################################

Executor::Result Executor::run(const std::vector<UploadItem>& items) {
    return dispatch(items, [](tasks::Context& ctx, concurrency::AdmissionGate::Slot slot, const UploadItem& item) {
        return std::make_shared<tasks::Upload>(ctx, std::move(slot), item);
    });
}

Executor::Result Executor::run(const std::vector<DownloadItem>& items) {
    return dispatch(items, [](tasks::Context& ctx, concurrency::AdmissionGate::Slot slot, const DownloadItem& item) {
        return std::make_shared<tasks::Download>(ctx, std::move(slot), item);
    });
}

template <class Item, class MakeTask>
Executor::Result Executor::dispatch(const std::vector<Item>& items, MakeTask&& make) {
    Result result;
    tasks::Context ctx{client_, progress_, options_.dry_run};

    const bool failFast = options_.failure_policy == FailurePolicy::FailFast;
    const auto stopAdmitting = [&] { return failFast && ctx.failure_seen.load(std::memory_order_acquire); };

    struct Pending {
        util::ObjectKey key;
        uintmax_t bytes;
        std::future<ExpectedFuture> future;
    };

    std::vector<Pending> pending;
    pending.reserve(items.size());

    for (const auto& item : items) {
        if (stopAdmitting()) {
            ++result.skipped;
            continue;
        }

        auto slot = gate_.enter();
        if (stopAdmitting()) {
            ++result.skipped;
            continue;
        }

        auto task = make(ctx, std::move(slot), item);
        auto future = task->getFuture();
        const auto key = task->key();
        pool_.submit(task);
        pending.push_back({key, itemBytes(item), std::move(*future)});
    }

    util::ObjectKey firstKey;
    std::exception_ptr firstError;

    for (auto& p : pending) {
        try {
            p.future.get();
            ++result.succeeded;
            result.bytes += p.bytes;
        } catch (const std::exception&) {
            ++result.failed;
            if (!firstError) {
                firstError = std::current_exception();
                firstKey = p.key;
            }
        }
    }

    gate_.drain(); // barrier: nothing from this invocation is still holding a slot

    if (result.skipped)
        log::Registry::sync()->warn("[Executor] {} items not started after an earlier failure", result.skipped);

    if (firstError && failFast) raiseTransferFailed(firstKey, firstError);
    return result;
}

// ##########################################################################
// ############################### DELETES ##################################
// ##########################################################################

Executor::DeleteResult Executor::remove(const std::vector<DeleteItem>& items,
                                        const DeletionPolicy policy,
                                        const fs::path& localRoot) {
    DeleteResult result;

    for (const auto& item : items) {
        if (options_.dry_run) {
            log::Registry::sync()->info("[DRY RUN] Would delete {}", item.key);
            ++result.deleted;
            continue;
        }

        try {
            if (item.local_path) {
                removeLocal(*item.local_path, localRoot);
                log::Registry::audit()->info("DELETE local {}", item.local_path->string());
            } else {
                client_->remove(item.key);
            }
            log::Registry::sync()->info("[DELETE] {}", item.key);
            ++result.deleted;
        } catch (const std::exception& e) {
            ++result.failed;
            log::Registry::sync()->error("[DELETE] Failed to delete {}: {}", item.key, e.what());
            if (policy == DeletionPolicy::Abort) throw;
        }
    }

    return result;
}

void Executor::removeLocal(const fs::path& path, const fs::path& localRoot) const {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) throw storage::LocalIOError(path.string(), "Cannot remove " + path.string() + ": " + ec.message());

    const auto root = localRoot.lexically_normal();
    for (auto dir = path.parent_path().lexically_normal(); ; dir = dir.parent_path()) {
        const auto rel = dir.lexically_relative(root);
        if (rel.empty() || rel == "." || *rel.begin() == "..") break;
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) break;
        if (!fs::remove(dir, ec) || ec) break;
        log::Registry::storage()->debug("[Executor] Pruned empty directory {}", dir.string());
    }
}
