#pragma once

#include "sync/TierRules.hpp"
#include "sync/model/Plan.hpp"

#include <filesystem>
#include <functional>
#include <string>

namespace zs::sync {

// Content digest of a local file as hex. Only called for keys whose counterpart carries a checksum.
using Digester = std::function<std::string(const std::filesystem::path&)>;

struct PlanOptions {
    model::Direction direction = model::Direction::Upload;
    TierRules tiers{};
    std::filesystem::path local_root{};   // download targets are resolved below this
    util::ObjectKey remote_base{};
};

struct Planner {
    // Deterministic for identical inventories; performs no I/O beyond what digest does.
    static model::TransferPlan build(const model::LocalInventory& local,
                                     const model::RemoteInventory& remote,
                                     const PlanOptions& options,
                                     const Digester& digest);

    // Checksum comparison when the remote side has one, byte length otherwise.
    static bool needsTransfer(const model::LocalEntry& local,
                              const model::RemoteEntry& remote,
                              const Digester& digest,
                              std::optional<std::string>* localDigest = nullptr);
};

}
