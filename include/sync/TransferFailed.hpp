#pragma once

#include "storage/errors.hpp"
#include "util/objectKey.hpp"

#include <stdexcept>
#include <string>

namespace zs::sync {

// First failing item of a fail-fast executor invocation.
class TransferFailed : public std::runtime_error {
public:
    TransferFailed(util::ObjectKey key, const storage::ErrorKind kind, const std::string& what)
        : std::runtime_error("Transfer of " + key + " failed: " + what), key_(std::move(key)), kind_(kind) {}

    [[nodiscard]] const util::ObjectKey& key() const noexcept { return key_; }
    [[nodiscard]] storage::ErrorKind kind() const noexcept { return kind_; }

private:
    util::ObjectKey key_;
    storage::ErrorKind kind_;
};

}
