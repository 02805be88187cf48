#include "sync/model/Policy.hpp"
#include "util/objectKey.hpp"

#include <stdexcept>

namespace zs::sync::model {

std::string to_string(const Direction d) {
    return d == Direction::Upload ? "upload" : "download";
}

std::string to_string(const FailurePolicy p) {
    return p == FailurePolicy::FailFast ? "fail_fast" : "collect";
}

std::string to_string(const DeletionPolicy p) {
    return p == DeletionPolicy::Continue ? "continue" : "abort";
}

Direction directionFromString(const std::string& str) {
    if (util::iequals(str, "upload")) return Direction::Upload;
    if (util::iequals(str, "download")) return Direction::Download;
    throw std::invalid_argument("Direction must be 'upload' or 'download', got '" + str + "'");
}

FailurePolicy failurePolicyFromString(const std::string& str) {
    if (util::iequals(str, "fail_fast")) return FailurePolicy::FailFast;
    if (util::iequals(str, "collect")) return FailurePolicy::Collect;
    throw std::invalid_argument("Invalid failure policy: " + str);
}

DeletionPolicy deletionPolicyFromString(const std::string& str) {
    if (util::iequals(str, "continue")) return DeletionPolicy::Continue;
    if (util::iequals(str, "abort")) return DeletionPolicy::Abort;
    throw std::invalid_argument("Invalid deletion policy: " + str);
}

}
