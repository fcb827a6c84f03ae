#pragma once

#include <kapla/cli.hpp>
#include <kapla/orchestrator.hpp>
#include <kapla/workspace.hpp>
#include <string>

namespace kapla {

// Execute a parsed command line; returns the process exit code
int run_cli(const CliArgs& args);

// Settings for one invocation: global file, workspace [orchestrator], CLI
Result<Config> load_effective_config(const Workspace& ws, const CliArgs& args);

// Synthesis inputs shared by every package of the workspace
Result<SynthesisContext> synthesis_context(const Workspace& ws, const Config& cfg);

// Human-readable per-package summary of a run, one line per package
std::string format_report(const RunReport& report);

} // namespace kapla
