#include <kapla/cli.hpp>

#include <CLI/CLI.hpp>

namespace kapla {

const char* command_name(Command cmd) {
    switch (cmd) {
        case Command::None:      return "none";
        case Command::Install:   return "install";
        case Command::Build:     return "build";
        case Command::Uninstall: return "uninstall";
        case Command::List:      return "list";
        case Command::Plan:      return "plan";
        case Command::Manifest:  return "manifest";
    }
    return "unknown";
}

CliArgs cli_parse(int argc, const char* const* argv) {
    CLI::App app{"kapla - monorepo package manager"};
    app.allow_windows_style_options(false);

    CliArgs args{};

    int verbose = 0;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "More output (-vv for trace)");
    app.add_flag("-q,--quiet", quiet, "Only warnings and errors")->excludes("--verbose");
    std::string log_level;
    auto* log_level_opt = app.add_option("--log-level", log_level,
                                         "trace, debug, info, warn or error");
    app.add_flag("--no-color", args.no_color, "Disable colored log output");
    app.add_option("-C,--directory", args.directory,
                   "Run as if started in this directory");

    // install and build share their options
    size_t jobs = 0;
    std::string policy;
    bool lock = false;
    bool no_lock = false;
    int timeout = 0;
    std::string manifest_file;
    struct RunOptions {
        CLI::Option* jobs;
        CLI::Option* policy;
        CLI::Option* timeout;
        CLI::Option* manifest_file;
    };
    std::vector<RunOptions> run_opts;
    auto add_group_options = [&](CLI::App* sub) {
        auto* without = sub->add_option("--without", args.without_groups,
            "Dependency group to leave out (main or dev)")
            ->check(CLI::IsMember({"main", "dev"}))->allow_extra_args(false);
        auto* only = sub->add_option("--only", args.only_groups,
            "Only keep this dependency group (main or dev)")
            ->check(CLI::IsMember({"main", "dev"}))->allow_extra_args(false);
        only->excludes(without);
    };
    auto add_run_options = [&](CLI::App* sub) {
        sub->add_option("packages", args.packages,
                        "Packages to process with their dependencies (all if omitted)");
        sub->add_option("-x,--exclude", args.exclude, "Package to leave out")
            ->allow_extra_args(false);
        RunOptions opts{};
        opts.jobs = sub->add_option("-j,--jobs", jobs, "Concurrent actions")
            ->check(CLI::PositiveNumber);
        opts.policy = sub->add_option("--policy", policy,
            "fail-fast-per-branch, continue-independent or fail-fast");
        auto* lock_opt = sub->add_flag("--lock", lock, "Pin dependencies to the lock file");
        auto* no_lock_opt = sub->add_flag("--no-lock", no_lock, "Ignore the lock file");
        lock_opt->excludes(no_lock_opt);
        sub->add_flag("--keep-manifests", args.keep_manifests,
                      "Leave synthesized manifests on disk");
        opts.timeout = sub->add_option("--timeout", timeout,
            "Per-package timeout in seconds")->check(CLI::PositiveNumber);
        opts.manifest_file = sub->add_option("--manifest-file", manifest_file,
            "File name of the synthesized manifest");
        run_opts.push_back(opts);
    };

    auto* install = app.add_subcommand("install", "Install packages in dependency order");
    add_run_options(install);
    add_group_options(install);
    install->callback([&args] { args.command = Command::Install; });

    auto* build = app.add_subcommand("build", "Build packages in dependency order");
    add_run_options(build);
    build->callback([&args] { args.command = Command::Build; });

    auto* uninstall = app.add_subcommand("uninstall",
        "Uninstall packages, dependents before their dependencies");
    uninstall->add_option("packages", args.packages,
                          "Packages to uninstall with their dependencies (all if omitted)");
    uninstall->add_option("-x,--exclude", args.exclude, "Package to leave out")
        ->allow_extra_args(false);
    RunOptions uninstall_opts{};
    uninstall_opts.jobs = uninstall->add_option("-j,--jobs", jobs, "Concurrent actions")
        ->check(CLI::PositiveNumber);
    uninstall_opts.policy = uninstall->add_option("--policy", policy,
        "fail-fast-per-branch, continue-independent or fail-fast");
    uninstall_opts.timeout = uninstall->add_option("--timeout", timeout,
        "Per-package timeout in seconds")->check(CLI::PositiveNumber);
    run_opts.push_back(uninstall_opts);
    uninstall->callback([&args] { args.command = Command::Uninstall; });

    auto* list = app.add_subcommand("list", "List workspace members");
    list->callback([&args] { args.command = Command::List; });

    auto* plan = app.add_subcommand("plan", "Show the execution batches");
    plan->add_option("packages", args.packages, "Packages to plan for");
    plan->add_option("-x,--exclude", args.exclude, "Package to leave out")->allow_extra_args(false);
    plan->callback([&args] { args.command = Command::Plan; });

    std::string manifest_target;
    auto* manifest = app.add_subcommand("manifest", "Print the synthesized manifest");
    manifest->add_option("package", manifest_target, "Package name")->required();
    manifest->add_flag("--lock", lock, "Pin dependencies to the lock file");
    add_group_options(manifest);
    manifest->callback([&args, &manifest_target] {
        args.command = Command::Manifest;
        args.packages = {manifest_target};
    });

    app.require_subcommand(0, 1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::CallForHelp&) {
        args.cli_output = app.help();
        args.command = Command::None;
        return args;
    } catch (const CLI::ParseError& e) {
        args.cli_output = e.what();
        args.exit_code = kExitStructural;
        args.command = Command::None;
        return args;
    }

    args.verbosity = quiet ? -1 : verbose;
    if (log_level_opt->count() > 0) args.log_level = log_level;
    for (const auto& opts : run_opts) {
        if (opts.jobs->count() > 0) args.jobs = jobs;
        if (opts.policy->count() > 0) args.policy = policy;
        if (opts.timeout->count() > 0) args.timeout = timeout;
        if (opts.manifest_file && opts.manifest_file->count() > 0) {
            args.manifest_file = manifest_file;
        }
    }
    if (lock) args.lock_versions = true;
    if (no_lock) args.lock_versions = false;

    if (args.command == Command::None) {
        args.cli_output = app.help();
    }
    return args;
}

Result<Config> cli_config(const CliArgs& args) {
    Config cfg;
    if (args.jobs) {
        cfg.concurrency = *args.jobs;
        cfg.concurrency_set = true;
    }
    if (args.policy) {
        KAPLA_TRY_ASSIGN(cfg.failure_policy, parse_failure_policy(*args.policy));
        cfg.failure_policy_set = true;
    }
    if (args.lock_versions) {
        cfg.lock_versions = *args.lock_versions;
        cfg.lock_versions_set = true;
    }
    if (args.keep_manifests) {
        cfg.keep_manifests = true;
        cfg.keep_manifests_set = true;
    }
    if (args.timeout) {
        cfg.timeout_seconds = *args.timeout;
        cfg.timeout_set = true;
    }
    if (args.manifest_file) {
        if (args.manifest_file->empty() ||
            args.manifest_file->find('/') != std::string::npos) {
            return KaplaError{KaplaError::Config,
                "--manifest-file must be a plain file name"};
        }
        cfg.manifest_file = *args.manifest_file;
        cfg.manifest_file_set = true;
    }
    return Result<Config>::ok(std::move(cfg));
}

} // namespace kapla
