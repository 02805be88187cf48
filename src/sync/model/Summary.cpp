#include "sync/model/Summary.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace zs::sync::model {

std::string Summary::toString() const {
    auto out = fmt::format("Summary: {} {}, {} skipped, {} deleted",
                           transferred, direction == Direction::Upload ? "uploaded" : "downloaded",
                           skipped, deleted);
    if (failed) out += fmt::format(", {} failed", failed);
    if (delete_failed) out += fmt::format(", {} deletions failed", delete_failed);
    return out;
}

void to_json(nlohmann::json& j, const Summary& s) {
    j = {
        {"direction", to_string(s.direction)},
        {"transferred", s.transferred},
        {"skipped", s.skipped},
        {"deleted", s.deleted},
        {"failed", s.failed},
        {"delete_failed", s.delete_failed},
        {"bytes_transferred", s.bytes_transferred},
        {"dry_run", s.dry_run},
        {"elapsed_ms", s.elapsed.count()}
    };
}

}
