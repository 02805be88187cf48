#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace zs::shell {

// Bad command line; main() answers with exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct OptionSpec {
    std::string_view name;
    char alias;          // '\0' when there is no short form
    bool takes_value;
    std::string_view help;
};

const std::vector<OptionSpec>& knownOptions();

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name = "sync";
    std::vector<FlagKV> options;   // in command-line order, repeats kept
};

// Accepts "--key value", "--key=value", "-k value" and a leading "sync" word.
CommandCall parseArgs(const std::vector<std::string>& args);
CommandCall parseArgs(int argc, char** argv);

std::optional<std::string> optVal(const CommandCall& c, std::string_view key);   // last wins
std::vector<std::string> optVals(const CommandCall& c, std::string_view key);
[[nodiscard]] bool hasFlag(const CommandCall& c, std::string_view key);

std::optional<int> parseInt(const std::string& s);

// "a, b,,c" -> {"a", "b", "c"}
std::vector<std::string> splitList(std::string_view s);

struct Invocation {
    config::Config config;
    bool help = false;
    bool print_config = false;
};

// Layers defaults < config file < profile < ZONESYNC_ACCESS_KEY < command line.
// Does not validate; callers decide whether a complete config is required.
Invocation resolve(const CommandCall& call);

// Command-line overrides only.
void applyOverrides(const CommandCall& call, config::Config& cfg);

std::string usage();

}
