#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace zs::storage::model {

// One entry of a directory listing, as the object API reports it.
struct Object {
    std::string path;         // parent path, "zone/dir/"
    std::string object_name;  // "file.txt" or "subdir"
    uintmax_t length{0};
    bool is_directory{false};
    std::optional<std::string> checksum{}; // SHA-256 hex, absent for directories and legacy objects
    std::string last_changed{};

    [[nodiscard]] std::string fullPath() const { return path + object_name; }
};

void from_json(const nlohmann::json& j, Object& o);
void to_json(nlohmann::json& j, const Object& o);

std::vector<Object> parseListing(const std::string& payload);

}
