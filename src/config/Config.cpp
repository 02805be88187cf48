#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace zs::config {

void StorageConfig::inheritFrom(const StorageConfig& other) {
    if (zone.empty()) zone = other.zone;
    if (access_key.empty()) access_key = other.access_key;
    if (region.empty()) region = other.region;
    if (endpoint.empty()) endpoint = other.endpoint;
}

void Config::applyProfile() {
    if (profile.empty()) return;

    const auto it = profiles.find(profile);
    if (it == profiles.end()) throw std::invalid_argument("Unknown profile: " + profile);

    StorageConfig merged = it->second;
    merged.inheritFrom(storage);
    storage = std::move(merged);
}

void Config::validate() {
    if (sync.local_path.empty()) throw std::invalid_argument("--local-path is required.");
    if (storage.zone.empty()) throw std::invalid_argument("--storage-zone is required.");
    if (storage.access_key.empty())
        throw std::invalid_argument("--access-key is required (or set ZONESYNC_ACCESS_KEY environment variable).");
    if (storage.timeout_seconds == 0) throw std::invalid_argument("storage.timeout_seconds must be positive");
    if (sync.progress_interval_ms == 0) throw std::invalid_argument("sync.progress_interval_ms must be positive");

    sync.parallel = std::clamp(sync.parallel, MIN_PARALLEL, MAX_PARALLEL);
}

std::filesystem::path defaultConfigPath() {
    if (const char* env = std::getenv("ZONESYNC_CONFIG"); env && *env) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "zonesync" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "zonesync" / "config.yaml";
    return "zonesync.yaml";
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["profile"]) cfg.profile = node.as<std::string>();

    if (auto node = root["profiles"]; node && node.IsMap()) {
        for (const auto& it : node) {
            StorageConfig p;
            YAML::convert<StorageConfig>::decode(it.second, p);
            cfg.profiles.emplace(it.first.as<std::string>(), std::move(p));
        }
    }

    return cfg;
}

Config loadConfigOrDefault(const std::optional<std::filesystem::path>& path) {
    if (path) return loadConfig(*path); // explicitly requested: a missing file is an error

    const auto fallback = defaultConfigPath();
    if (!std::filesystem::exists(fallback)) return {};
    return loadConfig(fallback);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"storage", c.storage},
        {"sync", c.sync},
        {"logging", c.logging},
        {"profile", c.profile}
    };

    nlohmann::json profiles = nlohmann::json::object();
    for (const auto& [name, p] : c.profiles) profiles[name] = p;
    j["profiles"] = profiles;
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {
        {"zone", c.zone},
        {"access_key", c.access_key.empty() ? "" : "********"},
        {"region", c.region},
        {"endpoint", c.endpoint},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"local_path", c.local_path.string()},
        {"remote_path", c.remote_path},
        {"direction", sync::model::to_string(c.direction)},
        {"parallel", c.parallel},
        {"dry_run", c.dry_run},
        {"verbose", c.verbose},
        {"upload_last", c.upload_last},
        {"failure_policy", sync::model::to_string(c.failure_policy)},
        {"deletion_policy", sync::model::to_string(c.deletion_policy)},
        {"progress_interval_ms", c.progress_interval_ms},
        {"progress_grace_ms", c.progress_grace_ms}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.console_log_level))},
        {"file_log_level", YAML::to_std_string(spdlog::level::to_string_view(c.file_log_level))},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"zonesync", YAML::to_std_string(spdlog::level::to_string_view(c.zonesync))},
        {"sync", YAML::to_std_string(spdlog::level::to_string_view(c.sync))},
        {"cloud", YAML::to_std_string(spdlog::level::to_string_view(c.cloud))},
        {"storage", YAML::to_std_string(spdlog::level::to_string_view(c.storage))},
        {"progress", YAML::to_std_string(spdlog::level::to_string_view(c.progress))}
    };
}

} // namespace zs::config
