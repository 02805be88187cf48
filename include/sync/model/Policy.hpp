#pragma once

#include <string>

namespace zs::sync::model {

enum class Direction { Upload, Download };

// What a failing transfer item does to the rest of its invocation.
enum class FailurePolicy {
    FailFast, // stop admitting, drain in-flight, rethrow the first error
    Collect   // run every item, count failures, keep going
};

enum class DeletionPolicy { Continue, Abort };

std::string to_string(Direction d);
std::string to_string(FailurePolicy p);
std::string to_string(DeletionPolicy p);

Direction directionFromString(const std::string& str);
FailurePolicy failurePolicyFromString(const std::string& str);
DeletionPolicy deletionPolicyFromString(const std::string& str);

}
