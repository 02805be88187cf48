#include "sync/TierRules.hpp"
#include "util/objectKey.hpp"

#include <algorithm>
#include <stdexcept>

using namespace zs::sync;
using namespace zs::util;

TierRules::TierRules() : markup_(&TierRules::isMarkup) {}

TierRules TierRules::fromPatterns(const std::vector<std::string>& uploadLast) {
    TierRules rules;
    for (const auto& p : uploadLast) {
        auto trimmed = trimSlashes(p);
        if (trimmed.empty()) continue;
        rules.addLast(matchesPattern(std::move(trimmed)));
    }
    return rules;
}

KeyPredicate TierRules::matchesPattern(std::string pattern) {
    return [pattern = std::move(pattern)](const std::string_view key) {
        return iequals(fileName(key), pattern) || iendsWith(key, "/" + pattern);
    };
}

bool TierRules::isMarkup(const std::string_view key) {
    return iendsWith(key, ".html") || iendsWith(key, ".htm") || iendsWith(key, ".xml");
}

void TierRules::addLast(KeyPredicate pred) {
    if (!pred) throw std::invalid_argument("TierRules: empty upload-last predicate");
    last_.push_back(std::move(pred));
}

void TierRules::setMarkup(KeyPredicate pred) {
    if (!pred) throw std::invalid_argument("TierRules: empty markup predicate");
    markup_ = std::move(pred);
}

zs::sync::model::Tier TierRules::tierFor(const std::string_view key) const {
    if (std::ranges::any_of(last_, [&](const auto& pred) { return pred(key); })) return model::Tier::Last;
    if (markup_(key)) return model::Tier::Markup;
    return model::Tier::Default;
}
