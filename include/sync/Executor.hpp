#pragma once

#include "concurrency/AdmissionGate.hpp"
#include "concurrency/ThreadPool.hpp"
#include "sync/model/Plan.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace zs::storage { class Client; }

namespace zs::sync {

class Progress;

namespace tasks { struct Context; struct Transfer; }

struct ExecutorOptions {
    unsigned int parallel = 16;
    model::FailurePolicy failure_policy = model::FailurePolicy::FailFast;
    bool dry_run = false;
};

class Executor {
public:
    struct Result {
        uint64_t succeeded{0};
        uint64_t skipped{0};   // never admitted because an earlier item failed
        uint64_t failed{0};
        uintmax_t bytes{0};

        Result& operator+=(const Result& other);
    };

    struct DeleteResult {
        uint64_t deleted{0};
        uint64_t failed{0};
    };

    Executor(std::shared_ptr<storage::Client> client, std::shared_ptr<Progress> progress, ExecutorOptions options);

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    // Returns once every admitted item has finished. Under FailFast the first
    // failure is rethrown as TransferFailed after the in-flight items drain.
    Result run(const std::vector<model::UploadItem>& items);
    Result run(const std::vector<model::DownloadItem>& items);

    // Sequential. Local targets are removed from disk with their emptied parents up to localRoot.
    DeleteResult remove(const std::vector<model::DeleteItem>& items,
                        model::DeletionPolicy policy,
                        const std::filesystem::path& localRoot);

    [[nodiscard]] const ExecutorOptions& options() const { return options_; }

private:
    template <class Item, class MakeTask>
    Result dispatch(const std::vector<Item>& items, MakeTask&& make);

    void removeLocal(const std::filesystem::path& path, const std::filesystem::path& localRoot) const;

    std::shared_ptr<storage::Client> client_;
    std::shared_ptr<Progress> progress_;
    ExecutorOptions options_;

    // Destroyed after the pool so that dropped tasks can still release their slots.
    concurrency::AdmissionGate gate_;
    concurrency::ThreadPool pool_;
};

}
