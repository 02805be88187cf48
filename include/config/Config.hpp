#pragma once

#include "sync/model/Policy.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace zs::config {

constexpr static unsigned int MIN_PARALLEL = 1;
constexpr static unsigned int MAX_PARALLEL = 64;

struct StorageConfig {
    std::string zone;
    std::string access_key;
    std::string region;                 // empty or "de": main storage region
    std::string endpoint;               // overrides the region-derived base URL when set
    unsigned int timeout_seconds = 120;

    // Fills every field of *this that is empty from other.
    void inheritFrom(const StorageConfig& other);
};

struct SyncConfig {
    std::filesystem::path local_path;
    std::string remote_path;
    sync::model::Direction direction = sync::model::Direction::Upload;
    unsigned int parallel = 16;
    bool dry_run = false;
    bool verbose = false;
    std::vector<std::string> upload_last;
    sync::model::FailurePolicy failure_policy = sync::model::FailurePolicy::FailFast;
    sync::model::DeletionPolicy deletion_policy = sync::model::DeletionPolicy::Continue;
    unsigned int progress_interval_ms = 100;
    unsigned int progress_grace_ms = 2000;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum zonesync = spdlog::level::info;  // Run header, summary, fatal errors
    spdlog::level::level_enum sync     = spdlog::level::info;  // Plan decisions, failed items
    spdlog::level::level_enum cloud    = spdlog::level::warn;  // HTTP status and transport failures
    spdlog::level::level_enum storage  = spdlog::level::warn;  // Local filesystem failures
    spdlog::level::level_enum progress = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;   // empty: console only, no audit log
    LogLevelsConfig levels;
};

struct Config {
    StorageConfig storage;
    SyncConfig sync;
    LoggingConfig logging;
    std::map<std::string, StorageConfig> profiles;
    std::string profile;

    // Layers the named profile over the file's storage section; throws if it does not exist.
    void applyProfile();

    // Throws std::invalid_argument describing the first problem found.
    void validate();
};

std::filesystem::path defaultConfigPath();
Config loadConfig(const std::filesystem::path& path);
Config loadConfigOrDefault(const std::optional<std::filesystem::path>& path = std::nullopt);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

} // namespace zs::config
