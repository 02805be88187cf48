#include "storage/errors.hpp"

namespace zs::storage {

std::string to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::AuthFailure: return "auth_failure";
    case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
    case ErrorKind::LocalIO: return "local_io";
    case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

}
