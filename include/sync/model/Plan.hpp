#pragma once

#include "sync/model/Entry.hpp"
#include "sync/model/Policy.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace zs::sync::model {

// Execution order is the enum order.
enum class Tier : unsigned int { Default = 0, Markup = 1, Last = 2 };

constexpr std::array<Tier, 3> TIER_ORDER{Tier::Default, Tier::Markup, Tier::Last};

std::string to_string(Tier tier);

enum class Decision { Skip, Upload, Download, Delete };

std::string to_string(Decision d);

struct UploadItem {
    LocalEntry local;
    std::optional<std::string> checksum{}; // digest computed while planning, if any
};

struct DownloadItem {
    RemoteEntry remote;
    LocalEntry target;
};

struct DeleteItem {
    ObjectKey key;
    std::optional<std::filesystem::path> local_path{}; // set for download-direction deletions
};

struct SkipItem {
    ObjectKey key;
    std::string reason;
};

struct TransferPlan {
    Direction direction{Direction::Upload};
    std::array<std::vector<UploadItem>, TIER_ORDER.size()> tiers{};
    std::vector<DownloadItem> downloads;
    std::vector<DeleteItem> deletes;
    std::vector<SkipItem> skipped;

    [[nodiscard]] const std::vector<UploadItem>& tier(Tier t) const { return tiers[static_cast<size_t>(t)]; }
    [[nodiscard]] std::vector<UploadItem>& tier(Tier t) { return tiers[static_cast<size_t>(t)]; }

    [[nodiscard]] size_t uploadCount() const;
    [[nodiscard]] size_t transferCount() const;

    // Decision recorded for key, or nullopt when the key appears in neither inventory.
    [[nodiscard]] std::optional<Decision> decisionFor(const ObjectKey& key) const;
};

}
