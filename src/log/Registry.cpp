#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace zs::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto cnf = config::ConfigRegistry::get().logging;
    log_dir_ = cnf.log_dir;

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!log_dir_.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (log_dir_ / "zonesync.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("zonesync", sub_levels.zonesync);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("cloud",    sub_levels.cloud);
    makeLogger("storage",  sub_levels.storage);
    makeLogger("progress", sub_levels.progress);

    // audit: file-only sink (append); discarded when no log dir is configured
    {
        spdlog::sink_ptr sink;
        if (!log_dir_.empty()) {
            audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                (log_dir_ / "audit.log").string(), /*truncate=*/false);
            sink = audit_file_sink_;
        } else {
            sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        }

        const auto logger = std::make_shared<spdlog::logger>("audit", sink);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::register_logger(logger);
    }

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setVerbose(const bool verbose) {
    const auto& levels = config::ConfigRegistry::get().logging.levels;
    sync()->set_level(verbose ? spdlog::level::debug : levels.subsystem_levels.sync);
    if (verbose && console_sink_ && console_sink_->level() > spdlog::level::debug)
        console_sink_->set_level(spdlog::level::debug);
}

bool Registry::isInitialized() { return initialized_; }

}
