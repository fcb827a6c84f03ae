#pragma once

#include <kapla/process.hpp>
#include <kapla/synthesizer.hpp>
#include <string>
#include <vector>

namespace kapla {

// Outcome of one per-package action
struct ActionOutcome {
    bool ok = false;
    bool cancelled = false;   // stopped because the run was cancelled
    int exit_code = 0;
    std::string message;

    static ActionOutcome success(std::string msg = "") {
        return ActionOutcome{true, false, 0, std::move(msg)};
    }
    static ActionOutcome failure(int code, std::string msg) {
        return ActionOutcome{false, false, code, std::move(msg)};
    }
    static ActionOutcome stopped(std::string msg = "cancelled") {
        return ActionOutcome{false, true, -1, std::move(msg)};
    }
};

// Per-package operation run by the orchestrator (install, build, ...).
// execute() is called from worker threads, concurrently for independent
// packages. Implementations should poll `cancel` and stop early when
// they can; ignoring it is allowed.
class Action {
public:
    virtual ~Action() = default;

    virtual std::string name() const = 0;

    virtual ActionOutcome execute(const MergedManifest& manifest,
                                  const std::string& path,
                                  const CancelToken& cancel) = 0;
};

struct CommandActionOptions {
    std::string name;
    // argv template; {name} {version} {path} {manifest} are substituted
    std::vector<std::string> argv;
    // File the synthesized manifest is written to, relative to the package
    std::string manifest_file = "pyproject.toml";
    bool keep_manifest = false;
    int timeout_seconds = 600;
};

// Runs an external command once per package, with the synthesized
// manifest written beside the package for the duration of the call.
class CommandAction : public Action {
public:
    explicit CommandAction(CommandActionOptions opts);

    std::string name() const override { return opts_.name; }

    ActionOutcome execute(const MergedManifest& manifest,
                          const std::string& path,
                          const CancelToken& cancel) override;

    const CommandActionOptions& options() const { return opts_; }

private:
    CommandActionOptions opts_;
};

// Substitute placeholders in an argv template. Unknown placeholders are
// left untouched.
std::vector<std::string> expand_command(const std::vector<std::string>& tmpl,
                                        const MergedManifest& manifest,
                                        const std::string& path,
                                        const std::string& manifest_path);

// Built-in argv for "install" and "build"; empty for anything else
std::vector<std::string> default_command(const std::string& action_name);

} // namespace kapla
