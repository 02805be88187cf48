#pragma once

#include "util/objectKey.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace zs::sync::model {

using util::ObjectKey;

struct LocalEntry {
    std::filesystem::path absolute_path;
    ObjectKey key;
    uintmax_t size_bytes{0};
};

struct RemoteEntry {
    ObjectKey key;
    uintmax_t size_bytes{0};
    bool is_directory{false};
    std::optional<std::string> checksum{};
};

// Ordered so that plans built from the same inventories are identical.
using LocalInventory = std::map<ObjectKey, LocalEntry>;
using RemoteInventory = std::map<ObjectKey, RemoteEntry>;

}
