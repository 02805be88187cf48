#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace zs::util {

// Normalized forward-slash path inside the remote namespace: no leading '/',
// no "//", directories end with exactly one '/'.
using ObjectKey = std::string;

[[nodiscard]] ObjectKey normalizeKey(std::string_view raw, std::optional<bool> isDirectory = std::nullopt);

// "zone/" or "zone/<prefix>/"
[[nodiscard]] ObjectKey remoteBasePath(std::string_view zone, std::string_view remotePath = {});

[[nodiscard]] ObjectKey keyFor(std::string_view base, const std::filesystem::path& relative);

// Relative generic path of key below base, or nullopt when key is not under base.
[[nodiscard]] std::optional<std::string> relativeTo(std::string_view base, std::string_view key);

[[nodiscard]] std::string_view fileName(std::string_view key);

[[nodiscard]] bool iequals(std::string_view a, std::string_view b);
[[nodiscard]] bool iendsWith(std::string_view s, std::string_view suffix);

inline std::string trimSlashes(std::string_view s) {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return std::string(s);
}

}
