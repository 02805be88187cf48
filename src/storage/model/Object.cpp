#include "storage/model/Object.hpp"

#include <nlohmann/json.hpp>

namespace zs::storage::model {

void from_json(const nlohmann::json& j, Object& o) {
    o.path = j.value("Path", std::string{});
    o.object_name = j.value("ObjectName", std::string{});
    o.length = j.value("Length", static_cast<uintmax_t>(0));
    o.is_directory = j.value("IsDirectory", false);
    o.last_changed = j.value("LastChanged", std::string{});

    if (j.contains("Checksum") && j.at("Checksum").is_string() && !j.at("Checksum").get<std::string>().empty())
        o.checksum = j.at("Checksum").get<std::string>();
    else
        o.checksum.reset();
}

void to_json(nlohmann::json& j, const Object& o) {
    j = {
        {"Path", o.path},
        {"ObjectName", o.object_name},
        {"Length", o.length},
        {"IsDirectory", o.is_directory},
        {"LastChanged", o.last_changed}
    };

    if (o.checksum) j["Checksum"] = *o.checksum;
    else j["Checksum"] = nullptr;
}

std::vector<Object> parseListing(const std::string& payload) {
    if (payload.find_first_not_of(" \t\r\n") == std::string::npos) return {};

    const auto j = nlohmann::json::parse(payload);
    if (j.is_null()) return {};
    if (!j.is_array()) throw std::runtime_error("Listing payload is not a JSON array");

    return j.get<std::vector<Object>>();
}

}
