#include "sync/Progress.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

using namespace zs;
using namespace zs::sync;
using namespace std::chrono;

namespace {
double secondsBetween(const Progress::Clock::time_point from, const Progress::Clock::time_point to) {
    return duration_cast<duration<double>>(to - from).count();
}
}

Progress::Progress(const size_t shards) : started_(Clock::now()) {
    const auto n = std::max<size_t>(shards, 1);
    shards_.reserve(n);
    for (size_t i = 0; i < n; ++i) shards_.push_back(std::make_unique<Shard>());
}

Progress::Shard& Progress::shardFor(const util::ObjectKey& key) const {
    return *shards_[std::hash<util::ObjectKey>{}(key) % shards_.size()];
}

std::shared_ptr<Progress::FileProgress> Progress::find(const util::ObjectKey& key) const {
    auto& shard = shardFor(key);
    std::shared_lock lock(shard.mutex);
    const auto it = shard.files.find(key);
    return it == shard.files.end() ? nullptr : it->second;
}

// ##########################################################################
// ############################### EVENTS ###################################
// ##########################################################################

void Progress::startFile(const util::ObjectKey& key, const uintmax_t totalBytes) {
    auto rec = std::make_shared<FileProgress>();
    rec->key = key;
    rec->total = totalBytes;
    rec->started_at = Clock::now();

    auto& shard = shardFor(key);
    std::unique_lock lock(shard.mutex);
    shard.files.insert_or_assign(key, std::move(rec));
}

void Progress::updateFileProgress(const util::ObjectKey& key, const uintmax_t transferredBytes) {
    const auto rec = find(key);
    if (!rec || rec->completed.load(std::memory_order_acquire)) return;

    const auto value = std::min(transferredBytes, rec->total);
    auto current = rec->transferred.load(std::memory_order_relaxed);
    while (value > current && !rec->transferred.compare_exchange_weak(current, value, std::memory_order_relaxed)) {}
}

bool Progress::completeFile(const util::ObjectKey& key) {
    const auto rec = find(key);
    if (!rec) {
        log::Registry::progress()->debug("[Progress] completeFile for unknown key {}", key);
        return false;
    }
    if (rec->completed.exchange(true, std::memory_order_acq_rel)) return false;

    rec->transferred.store(rec->total, std::memory_order_relaxed);
    rec->completed_at.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);

    // The flag is published before the byte count so a snapshot never counts a file twice.
    completedBytes_.fetch_add(rec->total, std::memory_order_acq_rel);
    completedFiles_.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

void Progress::addToTotalBytes(const uintmax_t delta) {
    totalBytes_.fetch_add(delta, std::memory_order_acq_rel);
}

void Progress::addToTotalFiles(const uint64_t delta) {
    totalFiles_.fetch_add(delta, std::memory_order_acq_rel);
}

// ##########################################################################
// ############################## SNAPSHOT ##################################
// ##########################################################################

ProgressSnapshot Progress::snapshot() const {
    ProgressSnapshot snap;
    const auto now = Clock::now();

    snap.completed_files = completedFiles_.load(std::memory_order_acquire);
    uintmax_t bytes = completedBytes_.load(std::memory_order_acquire);

    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        for (const auto& rec : shard->files | std::views::values) {
            const bool done = rec->completed.load(std::memory_order_acquire);
            const auto moved = rec->transferred.load(std::memory_order_relaxed);
            if (!done) bytes += moved;

            const auto secs = secondsBetween(rec->started_at, now);
            snap.files.push_back({
                .key = rec->key,
                .total_bytes = rec->total,
                .transferred_bytes = done ? rec->total : moved,
                .completed = done,
                .bytes_per_second = secs > 0.0 ? static_cast<double>(moved) / secs : 0.0
            });
        }
    }

    // Totals are read last: every byte counted above was added to them first.
    snap.total_files = totalFiles_.load(std::memory_order_acquire);
    snap.total_bytes = totalBytes_.load(std::memory_order_acquire);
    snap.completed_bytes = std::min(bytes, snap.total_bytes);

    snap.elapsed = duration_cast<milliseconds>(now - started_);
    const auto secs = secondsBetween(started_, now);
    snap.bytes_per_second = secs > 0.0 ? static_cast<double>(snap.completed_bytes) / secs : 0.0;
    if (snap.total_bytes)
        snap.percent = 100.0 * static_cast<double>(snap.completed_bytes) / static_cast<double>(snap.total_bytes);
    else if (snap.total_files && snap.completed_files >= snap.total_files)
        snap.percent = 100.0; // only empty files were planned
    else
        snap.percent = 0.0;

    std::ranges::sort(snap.files, [](const FileSnapshot& a, const FileSnapshot& b) {
        if (a.completed != b.completed) return a.completed;
        if (a.transferred_bytes != b.transferred_bytes) return a.transferred_bytes > b.transferred_bytes;
        return a.key < b.key;
    });

    return snap;
}

size_t Progress::evictExpired(const milliseconds grace, const Clock::time_point now) {
    size_t removed = 0;
    for (const auto& shard : shards_) {
        std::unique_lock lock(shard->mutex);
        removed += std::erase_if(shard->files, [&](const auto& kv) {
            const auto& rec = kv.second;
            if (!rec->completed.load(std::memory_order_acquire)) return false;
            const Clock::time_point at{Clock::duration{rec->completed_at.load(std::memory_order_relaxed)}};
            return now - at >= grace;
        });
    }
    return removed;
}

size_t Progress::trackedFiles() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard->mutex);
        n += shard->files.size();
    }
    return n;
}

// ##########################################################################
// ############################### SAMPLER ##################################
// ##########################################################################

Progress::Sampler::Sampler(Progress& progress, Callback callback,
                           const milliseconds interval, const milliseconds grace)
    : progress_(progress), callback_(std::move(callback)), interval_(interval), grace_(grace) {
    if (!callback_) throw std::invalid_argument("Progress::Sampler requires a callback");
    if (interval_.count() <= 0) throw std::invalid_argument("Progress::Sampler interval must be positive");
    thread_ = std::thread(&Sampler::loop, this);
}

Progress::Sampler::~Sampler() {
    stop();
}

void Progress::Sampler::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopping_ = true;
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    deliver(progress_.snapshot());
}

void Progress::Sampler::loop() {
    std::unique_lock lock(mutex_);
    while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
        lock.unlock();
        progress_.evictExpired(grace_);
        deliver(progress_.snapshot());
        lock.lock();
    }
}

void Progress::Sampler::deliver(const ProgressSnapshot& snap) const {
    try {
        callback_(snap);
    } catch (const std::exception& e) {
        log::Registry::progress()->error("[Progress] Sampler callback threw: {}", e.what());
    }
}
