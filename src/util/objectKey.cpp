#include "util/objectKey.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace zs::util {

namespace {
std::string_view trimWhitespace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

char lower(const char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

bool hasDotSegment(const std::string_view key) {
    size_t start = 0;
    while (start <= key.size()) {
        const auto slash = key.find('/', start);
        const auto seg = key.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start);
        if (seg == "." || seg == "..") return true;
        if (slash == std::string_view::npos) break;
        start = slash + 1;
    }
    return false;
}
}

ObjectKey normalizeKey(const std::string_view raw, const std::optional<bool> isDirectory) {
    std::string out;
    out.reserve(raw.size() + 1);

    for (const char c : trimWhitespace(raw)) {
        const char ch = c == '\\' ? '/' : c;
        if (ch == '/' && (out.empty() || out.back() == '/')) continue; // leading and doubled slashes
        out.push_back(ch);
    }

    if (hasDotSegment(out))
        throw std::invalid_argument("Object key cannot contain '.' or '..' segments: " + std::string(raw));

    if (isDirectory) {
        if (*isDirectory) {
            while (!out.empty() && out.back() == '/') out.pop_back();
            out.push_back('/');
        } else if (!out.empty() && out.back() == '/') {
            throw std::invalid_argument("Object key cannot be a directory: " + std::string(raw));
        }
    }

    return out;
}

ObjectKey remoteBasePath(const std::string_view zone, const std::string_view remotePath) {
    const auto z = trimSlashes(zone);
    if (z.empty()) throw std::invalid_argument("Storage zone cannot be empty");

    const auto prefix = trimSlashes(normalizeKey(remotePath));
    if (prefix.empty()) return z + "/";
    return z + "/" + prefix + "/";
}

ObjectKey keyFor(const std::string_view base, const std::filesystem::path& relative) {
    std::string joined(base);
    if (!joined.empty() && joined.back() != '/') joined.push_back('/');
    joined += relative.generic_string();
    return normalizeKey(joined, false);
}

std::optional<std::string> relativeTo(const std::string_view base, const std::string_view key) {
    std::string b(base);
    if (!b.empty() && b.back() != '/') b.push_back('/');
    if (key.size() <= b.size() || !key.starts_with(b)) return std::nullopt;
    return std::string(key.substr(b.size()));
}

std::string_view fileName(const std::string_view key) {
    auto k = key;
    while (!k.empty() && k.back() == '/') k.remove_suffix(1);
    const auto pos = k.rfind('/');
    return pos == std::string_view::npos ? k : k.substr(pos + 1);
}

bool iequals(const std::string_view a, const std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](const char x, const char y) { return lower(x) == lower(y); });
}

bool iendsWith(const std::string_view s, const std::string_view suffix) {
    return s.size() >= suffix.size() && iequals(s.substr(s.size() - suffix.size()), suffix);
}

}
