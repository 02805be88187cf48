#pragma once

#include "storage/Client.hpp"
#include "storage/errors.hpp"
#include "util/hash.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace zs::test {

// In-memory object store. Records call order and the peak number of concurrent transfers.
class FakeClient final : public storage::Client {
public:
    struct Stored {
        std::string data;
        std::optional<std::string> checksum;
    };

    bool publishChecksums = true;
    std::chrono::milliseconds delay{0};

    std::set<std::string> failUploads;
    std::set<std::string> failDownloads;
    std::set<std::string> failDeletes;
    std::set<std::string> failLists;

    void put(const std::string& key, const std::string& data) {
        std::scoped_lock lock(mutex_);
        objects_[key] = {data, util::sha256Hex(data)};
    }

    [[nodiscard]] bool has(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        return objects_.contains(key);
    }

    [[nodiscard]] std::string data(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        return objects_.at(key).data;
    }

    [[nodiscard]] std::optional<std::string> storedChecksum(const std::string& key) const {
        std::scoped_lock lock(mutex_);
        return objects_.at(key).checksum;
    }

    [[nodiscard]] std::vector<std::string> calls() const {
        std::scoped_lock lock(mutex_);
        return calls_;
    }

    // Keys of the given verb ("LIST", "PUT", "GET", "DELETE") in call order.
    [[nodiscard]] std::vector<std::string> callsOf(const std::string& verb) const {
        std::vector<std::string> out;
        for (const auto& c : calls())
            if (c.starts_with(verb + " ")) out.push_back(c.substr(verb.size() + 1));
        return out;
    }

    [[nodiscard]] size_t mutatingCalls() const {
        return callsOf("PUT").size() + callsOf("GET").size() + callsOf("DELETE").size();
    }

    void clearCalls() {
        std::scoped_lock lock(mutex_);
        calls_.clear();
    }

    [[nodiscard]] int peakInFlight() const { return peak_.load(); }

    std::vector<storage::model::Object> list(const std::string& dirKey) override {
        record("LIST " + dirKey);
        if (failLists.contains(dirKey)) throw storage::StorageError(storage::ErrorKind::Unknown, dirKey, "list failed");

        std::scoped_lock lock(mutex_);
        std::vector<storage::model::Object> out;
        std::set<std::string> dirs;

        for (const auto& [key, obj] : objects_) {
            if (!key.starts_with(dirKey)) continue;
            const auto rest = key.substr(dirKey.size());
            if (const auto slash = rest.find('/'); slash != std::string::npos) {
                if (dirs.insert(rest.substr(0, slash)).second)
                    out.push_back({.path = "/" + dirKey, .object_name = rest.substr(0, slash), .is_directory = true});
                continue;
            }
            out.push_back({
                .path = "/" + dirKey,
                .object_name = rest,
                .length = obj.data.size(),
                .is_directory = false,
                .checksum = publishChecksums ? obj.checksum : std::nullopt
            });
        }
        return out;
    }

    void upload(const std::string& key,
                const std::filesystem::path& source,
                const std::optional<std::string>& checksum,
                const storage::ProgressFn& progress) override {
        const InFlight guard(*this);
        record("PUT " + key);

        std::ifstream in(source, std::ios::binary);
        if (!in) throw storage::LocalIOError(key, "cannot open " + source.string());
        std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        pause();
        if (failUploads.contains(key)) throw storage::StorageError(storage::ErrorKind::Unknown, key, "upload failed");

        if (progress) {
            progress(data.size() / 2);
            progress(data.size());
        }

        std::scoped_lock lock(mutex_);
        objects_[key] = {std::move(data), checksum};
    }

    void download(const std::string& key,
                  const std::filesystem::path& destination,
                  const storage::ProgressFn& progress) override {
        const InFlight guard(*this);
        record("GET " + key);
        pause();
        if (failDownloads.contains(key)) throw storage::StorageError(storage::ErrorKind::Unknown, key, "download failed");

        std::string data;
        {
            std::scoped_lock lock(mutex_);
            const auto it = objects_.find(key);
            if (it == objects_.end()) throw storage::NotFoundError(key);
            data = it->second.data;
        }

        std::filesystem::create_directories(destination.parent_path());
        std::ofstream(destination, std::ios::binary | std::ios::trunc) << data;
        if (progress) progress(data.size());
    }

    void remove(const std::string& key) override {
        record("DELETE " + key);
        if (failDeletes.contains(key)) throw storage::StorageError(storage::ErrorKind::Unknown, key, "delete failed");
        std::scoped_lock lock(mutex_);
        objects_.erase(key);
    }

private:
    struct InFlight {
        FakeClient& c;
        explicit InFlight(FakeClient& client) : c(client) {
            const int now = ++c.inFlight_;
            int prev = c.peak_.load();
            while (now > prev && !c.peak_.compare_exchange_weak(prev, now)) {}
        }
        ~InFlight() { --c.inFlight_; }
    };

    void record(std::string call) {
        std::scoped_lock lock(mutex_);
        calls_.push_back(std::move(call));
    }

    void pause() const {
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
    }

    mutable std::mutex mutex_;
    std::map<std::string, Stored> objects_;
    std::vector<std::string> calls_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
};

}
