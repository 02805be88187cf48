#pragma once

#include "sync/model/Plan.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace zs::sync {

using KeyPredicate = std::function<bool(std::string_view key)>;

// Upload tier classification. First match wins: last, then markup, then default.
class TierRules {
public:
    TierRules();

    static TierRules fromPatterns(const std::vector<std::string>& uploadLast);

    // File name equals pattern, or key ends with "/<pattern>"; both case-insensitive.
    static KeyPredicate matchesPattern(std::string pattern);

    // .html, .htm or .xml, case-insensitive
    static bool isMarkup(std::string_view key);

    void addLast(KeyPredicate pred);
    void setMarkup(KeyPredicate pred);

    [[nodiscard]] model::Tier tierFor(std::string_view key) const;

    [[nodiscard]] size_t lastRuleCount() const { return last_.size(); }

private:
    KeyPredicate markup_;
    std::vector<KeyPredicate> last_;
};

}
