#pragma once

#include "util/objectKey.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace zs::sync {

struct FileSnapshot {
    util::ObjectKey key;
    uintmax_t total_bytes{0};
    uintmax_t transferred_bytes{0};
    bool completed{false};
    double bytes_per_second{0.0};
};

struct ProgressSnapshot {
    uint64_t completed_files{0};
    uint64_t total_files{0};
    uintmax_t completed_bytes{0};   // full size of completed files plus bytes moved by in-flight ones
    uintmax_t total_bytes{0};
    std::chrono::milliseconds elapsed{0};
    double percent{0.0};
    double bytes_per_second{0.0};
    std::vector<FileSnapshot> files;   // completed first, then by transferred bytes
};

// Concurrently updated transfer accounting. Records are sharded by key so that
// tasks working on different files never contend on one lock.
class Progress {
public:
    using Clock = std::chrono::steady_clock;

    explicit Progress(size_t shards = 16);

    Progress(const Progress&) = delete;
    Progress& operator=(const Progress&) = delete;

    // Creates or replaces the record for key.
    void startFile(const util::ObjectKey& key, uintmax_t totalBytes);

    // Monotonic: smaller values than already recorded are ignored. Clamped to the file's total.
    void updateFileProgress(const util::ObjectKey& key, uintmax_t transferredBytes);

    // Returns false when key was never started or was already completed.
    bool completeFile(const util::ObjectKey& key);

    void addToTotalBytes(uintmax_t delta);
    void addToTotalFiles(uint64_t delta);

    [[nodiscard]] ProgressSnapshot snapshot() const;

    // Drops completed records whose completion is older than grace. Returns the number removed.
    size_t evictExpired(std::chrono::milliseconds grace, Clock::time_point now = Clock::now());

    [[nodiscard]] size_t trackedFiles() const;

    // Periodically hands snapshot() to a callback on its own thread.
    class Sampler {
    public:
        using Callback = std::function<void(const ProgressSnapshot&)>;

        Sampler(Progress& progress,
                Callback callback,
                std::chrono::milliseconds interval = std::chrono::milliseconds(100),
                std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

        ~Sampler();

        Sampler(const Sampler&) = delete;
        Sampler& operator=(const Sampler&) = delete;

        // Joins the thread and delivers one last snapshot. Idempotent.
        void stop();

    private:
        void loop();
        void deliver(const ProgressSnapshot& snap) const;

        Progress& progress_;
        Callback callback_;
        const std::chrono::milliseconds interval_;
        const std::chrono::milliseconds grace_;

        std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_ = false;
        bool stopped_ = false;
        std::thread thread_;
    };

private:
    struct FileProgress {
        util::ObjectKey key;
        uintmax_t total{0};
        Clock::time_point started_at{};
        std::atomic<uintmax_t> transferred{0};
        std::atomic<bool> completed{false};
        std::atomic<Clock::rep> completed_at{0};
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<util::ObjectKey, std::shared_ptr<FileProgress>> files;
    };

    [[nodiscard]] Shard& shardFor(const util::ObjectKey& key) const;
    [[nodiscard]] std::shared_ptr<FileProgress> find(const util::ObjectKey& key) const;

    std::vector<std::unique_ptr<Shard>> shards_;
    const Clock::time_point started_;

    std::atomic<uint64_t> completedFiles_{0};
    std::atomic<uint64_t> totalFiles_{0};
    std::atomic<uintmax_t> completedBytes_{0};
    std::atomic<uintmax_t> totalBytes_{0};
};

}
