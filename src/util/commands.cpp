#include <kapla/commands.hpp>
#include <kapla/dep_graph.hpp>
#include <kapla/lockfile.hpp>
#include <kapla/log.hpp>
#include <kapla/selection.hpp>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <set>
#include <sstream>
#include <thread>

#include <signal.h>
#include <time.h>

namespace fs = std::filesystem;

namespace kapla {

// ---------------------------------------------------------------------------
// Setup shared by all commands
// ---------------------------------------------------------------------------

Result<Config> load_effective_config(const Workspace& ws, const CliArgs& args) {
    std::optional<Config> global;
    std::string gpath = global_config_path();
    std::error_code ec;
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        KAPLA_TRY_ASSIGN(Config g, Config::load(gpath));
        global = std::move(g);
    }
    KAPLA_TRY_ASSIGN(Config cli, cli_config(args));
    return Result<Config>::ok(Config::effective(global, ws.settings(), cli));
}

Result<SynthesisContext> synthesis_context(const Workspace& ws, const Config& cfg) {
    SynthesisContext ctx;
    ctx.shared = ws.shared_dependencies();
    ctx.default_build = ws.config().build;
    ctx.lock_versions = cfg.lock_versions;
    if (cfg.lock_versions) {
        KAPLA_TRY_ASSIGN(ctx.lock, LockFile::load(ws.lockfile_path().string()));
        if (ctx.lock.empty()) {
            log::warn("lock file '%s' is missing or empty, nothing will be pinned",
                      ws.lockfile_path().string().c_str());
        }
    }
    for (const auto& m : ws.members()) {
        ctx.member_paths[m.name] = m.root_dir.string();
    }
    return Result<SynthesisContext>::ok(std::move(ctx));
}

static Result<Workspace> open_workspace(const CliArgs& args) {
    fs::path start = args.directory.empty() ? fs::current_path() : fs::path(args.directory);
    return Workspace::discover(start);
}

static std::set<std::string> to_set(const std::vector<std::string>& names) {
    return std::set<std::string>(names.begin(), names.end());
}

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += sep;
        out += s;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Report
// ---------------------------------------------------------------------------

std::string format_report(const RunReport& report) {
    size_t width = 0;
    for (const auto& r : report.results) width = std::max(width, r.package.size());

    std::ostringstream out;
    for (const auto& r : report.results) {
        char head[64];
        std::snprintf(head, sizeof(head), "%-9s ", task_status_name(r.status));
        out << head << r.package << std::string(width - r.package.size(), ' ');
        if (r.status == TaskStatus::Succeeded || r.status == TaskStatus::Failed) {
            out << "  " << r.duration.count() << "ms";
        }
        if (!r.message.empty()) out << "  " << r.message;
        out << "\n";
    }
    out << report.count(TaskStatus::Succeeded) << " succeeded, "
        << report.count(TaskStatus::Failed) << " failed, "
        << report.count(TaskStatus::Skipped) << " skipped\n";
    return out.str();
}

// ---------------------------------------------------------------------------
// Interrupt handling
// ---------------------------------------------------------------------------

namespace {

// Turns SIGINT/SIGTERM into Orchestrator::cancel() for the lifetime of a
// run. Must be created before the worker threads so they inherit the mask.
class InterruptGuard {
public:
    explicit InterruptGuard(Orchestrator& orch) {
        sigemptyset(&set_);
        sigaddset(&set_, SIGINT);
        sigaddset(&set_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set_, &old_);
        watcher_ = std::thread([this, &orch] {
            timespec tick{0, 100 * 1000 * 1000};
            while (!done_.load()) {
                int sig = sigtimedwait(&set_, nullptr, &tick);
                if (sig == SIGINT || sig == SIGTERM) {
                    log::warn("interrupted, waiting for running actions to stop");
                    orch.cancel();
                }
            }
        });
    }

    ~InterruptGuard() {
        done_.store(true);
        watcher_.join();
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    sigset_t set_;
    sigset_t old_;
    std::atomic<bool> done_{false};
    std::thread watcher_;
};

} // namespace

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

static Result<int> cmd_run(const CliArgs& args) {
    KAPLA_TRY_ASSIGN(Workspace ws, open_workspace(args));
    KAPLA_TRY_ASSIGN(Config cfg, load_effective_config(ws, args));
    KAPLA_TRY_ASSIGN(DependencyGraph graph, DependencyGraph::build(ws.manifests()));
    KAPLA_TRY_ASSIGN(auto selected,
        select_packages(graph, to_set(args.packages), to_set(args.exclude)));

    std::string action_name = command_name(args.command);
    std::vector<std::string> argv = ws.command(action_name);
    if (argv.empty()) {
        return KaplaError{KaplaError::Config,
            "no command configured for '" + action_name + "'",
            "add " + action_name + " = [...] to [workspace.commands]"};
    }

    Orchestrator::Options opts;
    opts.concurrency = cfg.worker_count();
    opts.failure_policy = cfg.failure_policy;
    opts.reverse = args.command == Command::Uninstall;
    KAPLA_TRY_ASSIGN(opts.synthesis, synthesis_context(ws, cfg));
    opts.synthesis.without_groups = to_set(args.without_groups);
    opts.synthesis.only_groups = to_set(args.only_groups);

    CommandActionOptions action_opts;
    action_opts.name = action_name;
    action_opts.argv = std::move(argv);
    action_opts.manifest_file = cfg.manifest_file;
    action_opts.keep_manifest = cfg.keep_manifests;
    action_opts.timeout_seconds = cfg.timeout_seconds;
    CommandAction action(std::move(action_opts));

    if (selected.empty()) {
        log::warn("nothing to %s", action_name.c_str());
        return Result<int>::ok(kExitOk);
    }

    Orchestrator orch(std::move(opts));
    auto report = [&] {
        InterruptGuard guard(orch);
        return orch.run(graph, selected, action);
    }();
    if (report.is_err()) return std::move(report).error();

    std::fputs(format_report(report.value()).c_str(), stdout);
    return Result<int>::ok(report.value().success() ? kExitOk : kExitRunFailed);
}

static Result<int> cmd_list(const CliArgs& args) {
    KAPLA_TRY_ASSIGN(Workspace ws, open_workspace(args));
    KAPLA_TRY_ASSIGN(DependencyGraph graph, DependencyGraph::build(ws.manifests()));

    for (const auto& m : ws.members()) {
        std::string rel = m.root_dir.lexically_relative(ws.root_dir()).generic_string();
        std::printf("%s %s (%s)\n", m.name.c_str(), m.version.c_str(), rel.c_str());
        if (log::get_level() <= log::Debug) {
            std::fputs(graph.tree_display(m.name).c_str(), stdout);
        }
    }
    return Result<int>::ok(kExitOk);
}

static Result<int> cmd_plan(const CliArgs& args) {
    KAPLA_TRY_ASSIGN(Workspace ws, open_workspace(args));
    KAPLA_TRY_ASSIGN(DependencyGraph graph, DependencyGraph::build(ws.manifests()));
    KAPLA_TRY_ASSIGN(auto selected,
        select_packages(graph, to_set(args.packages), to_set(args.exclude)));
    KAPLA_TRY_ASSIGN(ExecutionPlan plan, graph.plan(selected));

    for (size_t i = 0; i < plan.batches.size(); ++i) {
        std::printf("%zu: %s\n", i, join(plan.batches[i], " ").c_str());
    }
    return Result<int>::ok(kExitOk);
}

static Result<int> cmd_manifest(const CliArgs& args) {
    KAPLA_TRY_ASSIGN(Workspace ws, open_workspace(args));
    KAPLA_TRY_ASSIGN(Config cfg, load_effective_config(ws, args));
    KAPLA_TRY_ASSIGN(DependencyGraph graph, DependencyGraph::build(ws.manifests()));

    const std::string& name = args.packages.front();
    const Manifest* pkg = graph.find(name);
    if (!pkg) {
        return KaplaError{KaplaError::NotFound,
            "no workspace member named '" + name + "'",
            "run 'kapla list' to see the members"};
    }
    KAPLA_TRY_ASSIGN(SynthesisContext ctx, synthesis_context(ws, cfg));
    ctx.without_groups = to_set(args.without_groups);
    ctx.only_groups = to_set(args.only_groups);
    std::fputs(synthesize(*pkg, ctx).to_toml().c_str(), stdout);
    return Result<int>::ok(kExitOk);
}

int run_cli(const CliArgs& args) {
    if (args.log_level) {
        auto lvl = log::parse_level(*args.log_level);
        if (lvl.is_err()) {
            std::fprintf(stderr, "%s\n", lvl.error().format().c_str());
            return kExitStructural;
        }
        log::set_level(lvl.value());
    } else {
        log::set_level(log::level_for_verbosity(args.verbosity));
    }
    if (args.no_color) log::set_color_enabled(false);

    if (!args.cli_output.empty()) {
        std::FILE* out = args.exit_code == kExitOk ? stdout : stderr;
        std::fprintf(out, "%s\n", args.cli_output.c_str());
        return args.exit_code;
    }

    Result<int> result = Result<int>::ok(kExitOk);
    switch (args.command) {
        case Command::Install:
        case Command::Build:
        case Command::Uninstall: result = cmd_run(args); break;
        case Command::List:      result = cmd_list(args); break;
        case Command::Plan:      result = cmd_plan(args); break;
        case Command::Manifest:  result = cmd_manifest(args); break;
        case Command::None:      break;
    }

    if (result.is_err()) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        return kExitStructural;
    }
    return result.value();
}

} // namespace kapla
