#pragma once

#include <kapla/config.hpp>
#include <kapla/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kapla {

enum class Command { None, Install, Build, Uninstall, List, Plan, Manifest };

const char* command_name(Command cmd);

// Exit codes of the kapla binary
inline constexpr int kExitOk = 0;
inline constexpr int kExitRunFailed = 1;     // a package failed or was skipped
inline constexpr int kExitStructural = 2;    // manifest, graph, selection, config

struct CliArgs {
    Command command = Command::None;
    std::vector<std::string> packages;   // include list, or the manifest target
    std::vector<std::string> exclude;
    std::optional<size_t> jobs;
    std::optional<std::string> policy;
    std::optional<bool> lock_versions;
    bool keep_manifests = false;
    std::optional<int> timeout;
    std::optional<std::string> manifest_file;
    std::vector<std::string> without_groups;  // --without main|dev
    std::vector<std::string> only_groups;     // --only main|dev
    int verbosity = 0;                   // -v count, -1 for -q
    std::optional<std::string> log_level;
    bool no_color = false;
    std::string directory;               // -C, empty: current directory

    // Help text or parse error to print instead of running a command
    std::string cli_output;
    int exit_code = kExitOk;
};

CliArgs cli_parse(int argc, const char* const* argv);

// Command-line layer of the settings
Result<Config> cli_config(const CliArgs& args);

} // namespace kapla
