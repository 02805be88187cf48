#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace zs::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["zone"] = rhs.zone;
        node["region"] = rhs.region;
        node["endpoint"] = rhs.endpoint;
        node["timeout_seconds"] = rhs.timeout_seconds;
        // access_key is never written back
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.zone = node["zone"].as<std::string>(rhs.zone);
        rhs.access_key = node["access_key"].as<std::string>(rhs.access_key);
        rhs.region = node["region"].as<std::string>(rhs.region);
        rhs.endpoint = node["endpoint"].as<std::string>(rhs.endpoint);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(rhs.timeout_seconds);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["local_path"] = rhs.local_path.string();
        node["remote_path"] = rhs.remote_path;
        node["direction"] = zs::sync::model::to_string(rhs.direction);
        node["parallel"] = rhs.parallel;
        node["dry_run"] = rhs.dry_run;
        node["verbose"] = rhs.verbose;
        node["upload_last"] = rhs.upload_last;
        node["failure_policy"] = zs::sync::model::to_string(rhs.failure_policy);
        node["deletion_policy"] = zs::sync::model::to_string(rhs.deletion_policy);
        node["progress_interval_ms"] = rhs.progress_interval_ms;
        node["progress_grace_ms"] = rhs.progress_grace_ms;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["local_path"]) rhs.local_path = node["local_path"].as<std::string>();
        rhs.remote_path = node["remote_path"].as<std::string>(rhs.remote_path);
        if (node["direction"]) rhs.direction = zs::sync::model::directionFromString(node["direction"].as<std::string>());
        rhs.parallel = node["parallel"].as<unsigned int>(rhs.parallel);
        rhs.dry_run = node["dry_run"].as<bool>(rhs.dry_run);
        rhs.verbose = node["verbose"].as<bool>(rhs.verbose);
        rhs.upload_last = node["upload_last"].as<std::vector<std::string>>(rhs.upload_last);
        if (node["failure_policy"])
            rhs.failure_policy = zs::sync::model::failurePolicyFromString(node["failure_policy"].as<std::string>());
        if (node["deletion_policy"])
            rhs.deletion_policy = zs::sync::model::deletionPolicyFromString(node["deletion_policy"].as<std::string>());
        rhs.progress_interval_ms = node["progress_interval_ms"].as<unsigned int>(rhs.progress_interval_ms);
        rhs.progress_grace_ms = node["progress_grace_ms"].as<unsigned int>(rhs.progress_grace_ms);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["zonesync"] = to_std_string(spdlog::level::to_string_view(rhs.zonesync));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["cloud"]    = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        node["storage"]  = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["progress"] = to_std_string(spdlog::level::to_string_view(rhs.progress));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.zonesync = spdlog::level::from_str(node["zonesync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.progress = spdlog::level::from_str(node["progress"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_dir"]) rhs.log_dir = node["log_dir"].as<std::string>();
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
