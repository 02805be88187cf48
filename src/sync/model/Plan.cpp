#include "sync/model/Plan.hpp"

#include <algorithm>

namespace zs::sync::model {

std::string to_string(const Tier tier) {
    switch (tier) {
    case Tier::Default: return "default";
    case Tier::Markup: return "html";
    case Tier::Last: return "last";
    }
    return "unknown";
}

std::string to_string(const Decision d) {
    switch (d) {
    case Decision::Skip: return "skip";
    case Decision::Upload: return "upload";
    case Decision::Download: return "download";
    case Decision::Delete: return "delete";
    }
    return "unknown";
}

size_t TransferPlan::uploadCount() const {
    size_t n = 0;
    for (const auto& t : tiers) n += t.size();
    return n;
}

size_t TransferPlan::transferCount() const {
    return direction == Direction::Upload ? uploadCount() : downloads.size();
}

std::optional<Decision> TransferPlan::decisionFor(const ObjectKey& key) const {
    for (const auto& t : tiers)
        if (std::ranges::any_of(t, [&](const auto& i) { return i.local.key == key; })) return Decision::Upload;

    if (std::ranges::any_of(downloads, [&](const auto& i) { return i.remote.key == key; })) return Decision::Download;
    if (std::ranges::any_of(deletes, [&](const auto& i) { return i.key == key; })) return Decision::Delete;
    if (std::ranges::any_of(skipped, [&](const auto& i) { return i.key == key; })) return Decision::Skip;
    return std::nullopt;
}

}
