#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "shell/Args.hpp"
#include "shell/ProgressPrinter.hpp"
#include "storage/HttpClient.hpp"
#include "sync/Engine.hpp"
#include "sync/Progress.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace zs;
using namespace zs::config;

namespace {
constexpr int EXIT_FATAL = 1;
constexpr int EXIT_USAGE = 2;

int fatal(const std::string& msg) {
    if (log::Registry::isInitialized()) log::Registry::zonesync()->error("Error: {}", msg);
    else fmt::print(stderr, "Error: {}\n", msg);
    return EXIT_FATAL;
}
}

int main(const int argc, char** argv) {
    shell::Invocation inv;

    try {
        inv = shell::resolve(shell::parseArgs(argc, argv));
    } catch (const shell::UsageError& e) {
        fmt::print(stderr, "Error: {}\n\n{}", e.what(), shell::usage());
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        return fatal(std::string("Failed to load configuration: ") + e.what());
    }

    if (inv.help) {
        fmt::print("{}", shell::usage());
        return 0;
    }

    if (inv.print_config) {
        fmt::print("{}\n", nlohmann::json(inv.config).dump(2));
        return 0;
    }

    try {
        inv.config.validate();
    } catch (const std::invalid_argument& e) {
        fmt::print(stderr, "Error: {}\n\nUse --help for usage information.\n", e.what());
        return EXIT_USAGE;
    }

    try {
        ConfigRegistry::init(inv.config);
        log::Registry::init();
        log::Registry::setVerbose(inv.config.sync.verbose);

        const auto& syncCfg = inv.config.sync;
        auto client = std::make_shared<storage::HttpClient>(inv.config.storage);
        zs::sync::Engine engine(inv.config, client);

        shell::ProgressPrinter printer;
        zs::sync::model::Summary summary;
        {
            zs::sync::Progress::Sampler sampler(
                *engine.progress(),
                [&printer](const zs::sync::ProgressSnapshot& snap) { printer(snap); },
                std::chrono::milliseconds(syncCfg.progress_interval_ms),
                std::chrono::milliseconds(syncCfg.progress_grace_ms));

            summary = engine.run();
        }
        printer.finish(engine.progress()->snapshot());

        if (!summary.ok()) return fatal(fmt::format("{} transfer(s) and {} deletion(s) failed",
                                                    summary.failed, summary.delete_failed));

        log::Registry::zonesync()->info("Sync completed successfully!");
        return 0;
    } catch (const std::exception& e) {
        return fatal(e.what());
    }
}
