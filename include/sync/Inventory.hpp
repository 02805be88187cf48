#pragma once

#include "sync/model/Entry.hpp"

#include <filesystem>

namespace zs::storage { class Client; }

namespace zs::sync {

struct Inventory {
    // Regular files below root, keyed under base. Throws LocalIOError when root is not a directory.
    static model::LocalInventory buildLocal(const std::filesystem::path& root, const util::ObjectKey& base);

    // Flattened listing of every file below base, one list() call per directory.
    // Any listing failure propagates; no partial inventory is returned.
    static model::RemoteInventory buildRemote(storage::Client& client, const util::ObjectKey& base);
};

}
