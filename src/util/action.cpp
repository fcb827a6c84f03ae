#include <kapla/action.hpp>
#include <kapla/log.hpp>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace kapla {

// ---------------------------------------------------------------------------
// Command templates
// ---------------------------------------------------------------------------

static void replace_all(std::string& s, const std::string& from,
                        const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::vector<std::string> expand_command(const std::vector<std::string>& tmpl,
                                        const MergedManifest& manifest,
                                        const std::string& path,
                                        const std::string& manifest_path) {
    std::vector<std::string> out;
    out.reserve(tmpl.size());
    for (std::string arg : tmpl) {
        replace_all(arg, "{name}", manifest.name);
        replace_all(arg, "{version}", manifest.version);
        replace_all(arg, "{path}", path);
        replace_all(arg, "{manifest}", manifest_path);
        out.push_back(std::move(arg));
    }
    return out;
}

std::vector<std::string> default_command(const std::string& action_name) {
    if (action_name == "install") return {"poetry", "install"};
    if (action_name == "build") return {"poetry", "build"};
    if (action_name == "uninstall") return {"pip", "uninstall", "-y", "{name}"};
    return {};
}

// ---------------------------------------------------------------------------
// Manifest file guard
// ---------------------------------------------------------------------------

namespace {

// Owns the synthesized manifest on disk; removes it on scope exit unless
// asked to keep it.
class ManifestFile {
public:
    ManifestFile(std::string file, bool keep) : file_(std::move(file)), keep_(keep) {}
    ~ManifestFile() {
        if (!written_ || keep_) return;
        std::error_code ec;
        fs::remove(file_, ec);
        if (ec) log::warn("could not remove '%s': %s", file_.c_str(), ec.message().c_str());
    }
    ManifestFile(const ManifestFile&) = delete;
    ManifestFile& operator=(const ManifestFile&) = delete;

    Status write(const std::string& content) {
        std::ofstream out(file_, std::ios::trunc);
        if (!out.is_open()) {
            return KaplaError{KaplaError::IO,
                "cannot write synthesized manifest '" + file_ + "'"};
        }
        written_ = true;
        out << content;
        if (!out) {
            return KaplaError{KaplaError::IO,
                "failed writing synthesized manifest '" + file_ + "'"};
        }
        return ok_status();
    }

    const std::string& path() const { return file_; }

private:
    std::string file_;
    bool keep_;
    bool written_ = false;
};

// Last non-empty line of command output, for one-line reports
std::string last_line(const std::string& text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    size_t begin = text.find_last_of('\n', end);
    begin = begin == std::string::npos ? 0 : begin + 1;
    return text.substr(begin, end - begin + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// CommandAction
// ---------------------------------------------------------------------------

CommandAction::CommandAction(CommandActionOptions opts) : opts_(std::move(opts)) {}

ActionOutcome CommandAction::execute(const MergedManifest& manifest,
                                     const std::string& path,
                                     const CancelToken& cancel) {
    if (cancel.is_cancelled()) return ActionOutcome::stopped();
    if (opts_.argv.empty()) {
        return ActionOutcome::failure(-1, "no command configured for '" + opts_.name + "'");
    }

    std::string dir = path.empty() ? "." : path;
    ManifestFile file((fs::path(dir) / opts_.manifest_file).string(), opts_.keep_manifest);
    auto written = file.write(manifest.to_toml());
    if (written.is_err()) {
        return ActionOutcome::failure(-1, written.error().message);
    }

    auto argv = expand_command(opts_.argv, manifest, dir, file.path());
    log::debug("[%s] %s: running %s", manifest.name.c_str(), opts_.name.c_str(),
               argv[0].c_str());

    auto res = run_command(argv, dir, opts_.timeout_seconds, &cancel);
    if (res.is_err()) {
        return ActionOutcome::failure(-1, res.error().message);
    }

    const CommandResult& cmd = res.value();
    if (cmd.exit_code == 0) {
        return ActionOutcome::success();
    }
    if (cmd.cancelled) {
        return ActionOutcome::stopped();
    }
    if (cmd.exit_code == 127) {
        return ActionOutcome::failure(127, "could not execute '" + argv[0] + "'");
    }

    std::string detail = last_line(cmd.stderr_str);
    if (detail.empty()) detail = last_line(cmd.stdout_str);
    std::string msg = "'" + argv[0] + "' exited with code " + std::to_string(cmd.exit_code);
    if (!detail.empty()) msg += ": " + detail;
    return ActionOutcome::failure(cmd.exit_code, msg);
}

} // namespace kapla
