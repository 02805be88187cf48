#include "sync/Inventory.hpp"
#include "storage/Client.hpp"
#include "storage/errors.hpp"
#include "log/Registry.hpp"

#include <deque>
#include <unordered_set>

using namespace zs;
using namespace zs::sync;
using namespace zs::sync::model;
using namespace zs::util;

namespace fs = std::filesystem;

LocalInventory Inventory::buildLocal(const fs::path& root, const ObjectKey& base) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw storage::LocalIOError(root.string(), "Local path does not exist or is not a directory: " + root.string());

    LocalInventory inv;

    try {
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (!entry.is_regular_file()) continue;

            const auto rel = fs::relative(entry.path(), root);
            auto key = keyFor(base, rel);
            inv.emplace(key, LocalEntry{
                .absolute_path = entry.path(),
                .key = key,
                .size_bytes = entry.file_size()
            });
        }
    } catch (const fs::filesystem_error& e) {
        log::Registry::storage()->error("[Inventory] Failed to walk {}: {}", root.string(), e.what());
        throw storage::LocalIOError(e.path1().string(), e.what());
    }

    log::Registry::storage()->debug("[Inventory] {} local files under {}", inv.size(), root.string());
    return inv;
}

namespace {
ObjectKey remoteKey(const storage::model::Object& obj, const bool isDirectory) {
    try {
        return normalizeKey(obj.fullPath(), isDirectory);
    } catch (const std::invalid_argument& e) {
        throw storage::StorageError(storage::ErrorKind::Unknown, obj.fullPath(),
                                    std::string("Listing returned an unusable key: ") + e.what());
    }
}
}

RemoteInventory Inventory::buildRemote(storage::Client& client, const ObjectKey& base) {
    RemoteInventory inv;

    std::deque<ObjectKey> pending{normalizeKey(base, true)};
    std::unordered_set<ObjectKey> visited;

    while (!pending.empty()) {
        const auto dir = std::move(pending.front());
        pending.pop_front();
        if (!visited.insert(dir).second) continue;

        for (const auto& obj : client.list(dir)) {
            if (obj.is_directory) {
                pending.push_back(remoteKey(obj, true));
                continue;
            }

            auto key = remoteKey(obj, false);
            inv.emplace(key, RemoteEntry{
                .key = key,
                .size_bytes = obj.length,
                .is_directory = false,
                .checksum = obj.checksum
            });
        }
    }

    log::Registry::cloud()->debug("[Inventory] {} remote objects in {} directories under {}",
                                  inv.size(), visited.size(), base);
    return inv;
}
