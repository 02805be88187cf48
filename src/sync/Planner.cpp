#include "sync/Planner.hpp"
#include "storage/errors.hpp"
#include "util/objectKey.hpp"
#include "log/Registry.hpp"

using namespace zs;
using namespace zs::sync;
using namespace zs::sync::model;
using namespace zs::util;

namespace fs = std::filesystem;

namespace {
std::string digestOf(const Digester& digest, const LocalEntry& local) {
    try {
        return digest(local.absolute_path);
    } catch (const storage::StorageError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw storage::LocalIOError(local.key, e.what());
    }
}

// The target must resolve to a path strictly below root.
fs::path targetUnder(const fs::path& root, const std::string& rel, const ObjectKey& key) {
    const auto base = root.lexically_normal();
    const auto target = (root / fs::path(rel).make_preferred()).lexically_normal();
    const auto inside = target.lexically_relative(base);
    if (inside.empty() || inside == "." || *inside.begin() == "..")
        throw storage::StorageError(storage::ErrorKind::Unknown, key,
                                    "Remote object " + key + " resolves outside " + root.string());
    return target;
}
}

bool Planner::needsTransfer(const LocalEntry& local,
                            const RemoteEntry& remote,
                            const Digester& digest,
                            std::optional<std::string>* localDigest) {
    if (remote.checksum) {
        if (!digest) throw std::invalid_argument("Planner: remote checksum present but no digester supplied");
        auto d = digestOf(digest, local);
        const bool differs = !iequals(d, *remote.checksum);
        if (localDigest) *localDigest = std::move(d);
        return differs;
    }

    // Equal length means equal content here, even when it is not.
    return local.size_bytes != remote.size_bytes;
}

TransferPlan Planner::build(const LocalInventory& local,
                            const RemoteInventory& remote,
                            const PlanOptions& options,
                            const Digester& digest) {
    TransferPlan plan;
    plan.direction = options.direction;

    const auto skip = [&](const ObjectKey& key, const bool byChecksum) {
        log::Registry::sync()->debug("[SKIP] {} ({})", key, byChecksum ? "checksum match" : "same length");
        plan.skipped.push_back({key, byChecksum ? "checksum match" : "same length"});
    };

    if (options.direction == Direction::Upload) {
        for (const auto& [key, l] : local) {
            std::optional<std::string> checksum;

            if (const auto it = remote.find(key); it != remote.end()) {
                if (!needsTransfer(l, it->second, digest, &checksum)) {
                    skip(key, it->second.checksum.has_value());
                    continue;
                }
            }

            const auto tier = options.tiers.tierFor(key);
            plan.tier(tier).push_back({l, std::move(checksum)});
        }

        for (const auto& [key, r] : remote)
            if (!local.contains(key)) plan.deletes.push_back({key, std::nullopt});

        return plan;
    }

    // ########################################################################
    // ############################## DOWNLOAD ################################
    // ########################################################################

    for (const auto& [key, r] : remote) {
        if (const auto it = local.find(key); it != local.end()) {
            if (!needsTransfer(it->second, r, digest)) {
                skip(key, r.checksum.has_value());
                continue;
            }
            plan.downloads.push_back({r, it->second});
            continue;
        }

        const auto rel = relativeTo(options.remote_base, key);
        if (!rel) throw std::runtime_error("Remote object " + key + " is outside " + options.remote_base);

        plan.downloads.push_back({r, LocalEntry{
            .absolute_path = targetUnder(options.local_root, *rel, key),
            .key = key,
            .size_bytes = 0
        }});
    }

    for (const auto& [key, l] : local)
        if (!remote.contains(key)) plan.deletes.push_back({key, l.absolute_path});

    return plan;
}
