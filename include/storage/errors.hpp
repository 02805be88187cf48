#pragma once

#include <stdexcept>
#include <string>

namespace zs::storage {

enum class ErrorKind {
    NotFound,
    AuthFailure,
    ChecksumMismatch,
    LocalIO,
    Unknown
};

std::string to_string(ErrorKind kind);

class StorageError : public std::runtime_error {
public:
    StorageError(const ErrorKind kind, std::string key, const std::string& message)
        : std::runtime_error(message), kind_(kind), key_(std::move(key)) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    ErrorKind kind_;
    std::string key_;
};

struct NotFoundError final : StorageError {
    explicit NotFoundError(const std::string& key)
        : StorageError(ErrorKind::NotFound, key, "Could not find part of the object path: " + key) {}
};

struct AuthFailureError final : StorageError {
    explicit AuthFailureError(const std::string& zone)
        : StorageError(ErrorKind::AuthFailure, zone, "Authentication failed for storage zone '" + zone + "'") {}
};

struct ChecksumMismatchError final : StorageError {
    ChecksumMismatchError(const std::string& key, const std::string& checksum)
        : StorageError(ErrorKind::ChecksumMismatch, key,
                       "Server rejected content checksum " + checksum + " for " + key) {}
};

struct LocalIOError final : StorageError {
    LocalIOError(const std::string& key, const std::string& what)
        : StorageError(ErrorKind::LocalIO, key, what) {}
};

}
