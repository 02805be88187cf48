#pragma once

#include "storage/model/Object.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace zs::storage {

// Cumulative byte count of the transfer in progress.
using ProgressFn = std::function<void(uintmax_t)>;

// Flat, path-keyed object API. Implementations throw StorageError subclasses.
class Client {
public:
    virtual ~Client() = default;

    // dirKey must end with '/'; returns the direct children only.
    virtual std::vector<model::Object> list(const std::string& dirKey) = 0;

    virtual void upload(const std::string& key,
                        const std::filesystem::path& source,
                        const std::optional<std::string>& checksum,
                        const ProgressFn& progress) = 0;

    virtual void download(const std::string& key,
                          const std::filesystem::path& destination,
                          const ProgressFn& progress) = 0;

    virtual void remove(const std::string& key) = 0;
};

}
