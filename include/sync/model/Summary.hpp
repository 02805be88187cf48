#pragma once

#include "sync/model/Policy.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace zs::sync::model {

struct Summary {
    Direction direction{Direction::Upload};
    uint64_t transferred{0};   // uploaded or downloaded
    uint64_t skipped{0};
    uint64_t deleted{0};
    uint64_t failed{0};
    uint64_t delete_failed{0};
    uintmax_t bytes_transferred{0};
    bool dry_run{false};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool ok() const { return failed == 0 && delete_failed == 0; }
    [[nodiscard]] std::string toString() const;
};

void to_json(nlohmann::json& j, const Summary& s);

}
