#include "shell/Args.hpp"
#include "util/objectKey.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fmt/core.h>

using namespace zs;
using namespace zs::shell;
using namespace zs::sync::model;

namespace {
const OptionSpec* findLong(const std::string_view name) {
    for (const auto& o : knownOptions())
        if (util::iequals(o.name, name)) return &o;
    return nullptr;
}

const OptionSpec* findShort(const char alias) {
    for (const auto& o : knownOptions())
        if (o.alias != '\0' && o.alias == alias) return &o;
    return nullptr;
}

std::string trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return std::string(s);
}
}

const std::vector<OptionSpec>& zs::shell::knownOptions() {
    static const std::vector<OptionSpec> opts{
        {"local-path",       '\0', true,  "Local directory path"},
        {"storage-zone",     '\0', true,  "Storage zone name"},
        {"access-key",       'k',  true,  "Storage zone access key (or set ZONESYNC_ACCESS_KEY)"},
        {"direction",        'd',  true,  "Sync direction: 'upload' or 'download' [default: upload]"},
        {"remote-path",      '\0', true,  "Remote subdirectory within the storage zone [default: root]"},
        {"region",           'r',  true,  "Storage zone region (de, ny, sg, ...) [default: de]"},
        {"profile",          'p',  true,  "Named storage profile from the config file"},
        {"parallel",         'j',  true,  "Number of parallel transfers (1-64) [default: 16]"},
        {"upload-last",      '\0', true,  "Comma-separated file names to upload last (e.g. hash.txt,manifest.json)"},
        {"dry-run",          '\0', false, "Show what would be synced without changing anything"},
        {"verbose",          'v',  false, "Print per-file skip decisions"},
        {"collect-failures", '\0', false, "Keep going after a failed transfer and report failures at the end"},
        {"config",           'c',  true,  "Config file [default: $ZONESYNC_CONFIG or ~/.config/zonesync/config.yaml]"},
        {"log-dir",          '\0', true,  "Directory for zonesync.log and audit.log"},
        {"print-config",     '\0', false, "Print the effective configuration as JSON and exit"},
        {"help",             'h',  false, "Show this help message"},
    };
    return opts;
}

// ##########################################################################
// ############################### PARSING ##################################
// ##########################################################################

CommandCall zs::shell::parseArgs(const std::vector<std::string>& args) {
    CommandCall call;
    size_t i = 0;

    if (!args.empty() && util::iequals(args[0], "sync")) i = 1;

    for (; i < args.size(); ++i) {
        const auto& arg = args[i];
        const OptionSpec* spec = nullptr;
        std::optional<std::string> inlineValue;

        if (arg.starts_with("--") && arg.size() > 2) {
            const auto body = std::string_view(arg).substr(2);
            const auto eq = body.find('=');
            const auto name = body.substr(0, eq);
            if (eq != std::string_view::npos) inlineValue = std::string(body.substr(eq + 1));
            spec = findLong(name);
            if (!spec) throw UsageError(fmt::format("Unknown option: --{}", name));
        } else if (arg.size() == 2 && arg[0] == '-' && arg[1] != '-') {
            spec = findShort(arg[1]);
            if (!spec) throw UsageError(fmt::format("Unknown option: {}", arg));
        } else {
            throw UsageError(fmt::format("Unexpected argument: {}", arg));
        }

        const std::string key(spec->name);

        if (!spec->takes_value) {
            if (inlineValue) throw UsageError(fmt::format("Option --{} does not take a value", key));
            call.options.push_back({key, std::nullopt});
            continue;
        }

        if (!inlineValue) {
            if (i + 1 >= args.size()) throw UsageError(fmt::format("Option --{} requires a value", key));
            inlineValue = args[++i];
        }

        call.options.push_back({key, std::move(inlineValue)});
    }

    return call;
}

CommandCall zs::shell::parseArgs(const int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 0 ? static_cast<size_t>(argc) : 0);
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseArgs(args);
}

std::optional<std::string> zs::shell::optVal(const CommandCall& c, const std::string_view key) {
    std::optional<std::string> out;
    for (const auto& [k, v] : c.options)
        if (k == key) out = v;
    return out;
}

std::vector<std::string> zs::shell::optVals(const CommandCall& c, const std::string_view key) {
    std::vector<std::string> out;
    for (const auto& [k, v] : c.options)
        if (k == key && v) out.push_back(*v);
    return out;
}

bool zs::shell::hasFlag(const CommandCall& c, const std::string_view key) {
    return std::ranges::any_of(c.options, [&](const FlagKV& kv) { return kv.key == key; });
}

std::optional<int> zs::shell::parseInt(const std::string& s) {
    int out = 0;
    const auto* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), end, out);
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return out;
}

std::vector<std::string> zs::shell::splitList(const std::string_view s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        const auto comma = s.find(',', start);
        const auto part = trim(s.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start));
        if (!part.empty()) out.push_back(part);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return out;
}

// ##########################################################################
// ############################## RESOLUTION ################################
// ##########################################################################

void zs::shell::applyOverrides(const CommandCall& call, config::Config& cfg) {
    auto& st = cfg.storage;
    auto& sy = cfg.sync;

    if (const auto v = optVal(call, "local-path")) sy.local_path = *v;
    if (const auto v = optVal(call, "storage-zone")) st.zone = *v;
    if (const auto v = optVal(call, "access-key")) st.access_key = *v;
    if (const auto v = optVal(call, "region")) st.region = *v;
    if (const auto v = optVal(call, "remote-path")) sy.remote_path = *v;
    if (const auto v = optVal(call, "log-dir")) cfg.logging.log_dir = *v;

    if (const auto v = optVal(call, "direction")) {
        try {
            sy.direction = directionFromString(*v);
        } catch (const std::invalid_argument&) {
            throw UsageError(fmt::format("Invalid direction '{}': expected 'upload' or 'download'", *v));
        }
    }

    if (const auto v = optVal(call, "parallel")) {
        const auto n = parseInt(*v);
        if (!n) throw UsageError(fmt::format("Invalid --parallel value '{}'", *v));
        sy.parallel = static_cast<unsigned int>(std::clamp(*n, static_cast<int>(config::MIN_PARALLEL),
                                                           static_cast<int>(config::MAX_PARALLEL)));
    }

    const auto patterns = optVals(call, "upload-last");
    if (!patterns.empty()) {
        sy.upload_last.clear();
        for (const auto& p : patterns)
            for (auto& item : splitList(p)) sy.upload_last.push_back(std::move(item));
    }

    if (hasFlag(call, "dry-run")) sy.dry_run = true;
    if (hasFlag(call, "verbose")) sy.verbose = true;
    if (hasFlag(call, "collect-failures")) sy.failure_policy = FailurePolicy::Collect;
}

Invocation zs::shell::resolve(const CommandCall& call) {
    Invocation inv;
    inv.help = hasFlag(call, "help");
    inv.print_config = hasFlag(call, "print-config");

    std::optional<std::filesystem::path> path;
    if (const auto v = optVal(call, "config")) path = *v;
    inv.config = config::loadConfigOrDefault(path);

    if (const auto v = optVal(call, "profile")) inv.config.profile = *v;
    inv.config.applyProfile();

    if (const char* key = std::getenv("ZONESYNC_ACCESS_KEY"); key && *key)
        inv.config.storage.access_key = key;

    applyOverrides(call, inv.config);
    return inv;
}

std::string zs::shell::usage() {
    std::string out =
        "zonesync - Mirror a local directory to or from a storage zone\n\n"
        "Usage:\n"
        "  zonesync [sync] [options]\n\n"
        "Options:\n";

    for (const auto& o : knownOptions()) {
        const auto flags = o.alias != '\0' ? fmt::format("-{}, --{}", o.alias, o.name) : fmt::format("    --{}", o.name);
        const auto lhs = o.takes_value ? flags + " <value>" : flags;
        out += fmt::format("  {:<32} {}\n", lhs, o.help);
    }

    out +=
        "\nExamples:\n"
        "  zonesync --local-path ./dist --storage-zone my-zone --access-key abc123\n"
        "  zonesync --local-path ./dist --storage-zone my-zone --remote-path v1.2.3\n"
        "  zonesync --local-path ./backup --storage-zone my-zone --direction download\n"
        "  zonesync --local-path ./dist --storage-zone my-zone --upload-last hash.txt,manifest.json\n\n"
        "Environment:\n"
        "  ZONESYNC_ACCESS_KEY   Storage zone access key\n"
        "  ZONESYNC_CONFIG       Config file path\n\n"
        "Files in the destination that do not exist in the source are deleted.\n";
    return out;
}
