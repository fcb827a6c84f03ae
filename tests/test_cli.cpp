#include <catch2/catch.hpp>
#include <kapla/cli.hpp>

using namespace kapla;

static CliArgs parse(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "kapla");
    return cli_parse(static_cast<int>(argv.size()), argv.data());
}

// ===== cli_parse =====

TEST_CASE("no command prints help", "[cli]") {
    auto a = parse({});
    REQUIRE(a.command == Command::None);
    REQUIRE(a.exit_code == kExitOk);
    REQUIRE(a.cli_output.find("install") != std::string::npos);
}

TEST_CASE("--help prints help", "[cli]") {
    auto a = parse({"--help"});
    REQUIRE(a.command == Command::None);
    REQUIRE(a.exit_code == kExitOk);
    REQUIRE_FALSE(a.cli_output.empty());
}

TEST_CASE("install with packages and excludes", "[cli]") {
    auto a = parse({"install", "api", "worker", "-x", "docs", "--exclude", "bench"});
    REQUIRE(a.command == Command::Install);
    REQUIRE(a.packages == std::vector<std::string>{"api", "worker"});
    REQUIRE(a.exclude == std::vector<std::string>{"docs", "bench"});
    REQUIRE_FALSE(a.jobs.has_value());
    REQUIRE_FALSE(a.policy.has_value());
    REQUIRE_FALSE(a.lock_versions.has_value());
    REQUIRE(a.cli_output.empty());
}

TEST_CASE("build run options", "[cli]") {
    auto a = parse({"build", "-j", "4", "--policy", "fail-fast", "--lock",
                    "--keep-manifests", "--timeout", "90",
                    "--manifest-file", "pyproject.gen.toml"});
    REQUIRE(a.command == Command::Build);
    REQUIRE(a.packages.empty());
    REQUIRE(a.jobs == size_t{4});
    REQUIRE(a.policy == std::string("fail-fast"));
    REQUIRE(a.lock_versions == true);
    REQUIRE(a.keep_manifests);
    REQUIRE(a.timeout == 90);
    REQUIRE(a.manifest_file == std::string("pyproject.gen.toml"));
}

TEST_CASE("--no-lock", "[cli]") {
    auto a = parse({"install", "--no-lock"});
    REQUIRE(a.lock_versions == false);
}

TEST_CASE("--lock and --no-lock conflict", "[cli]") {
    auto a = parse({"install", "--lock", "--no-lock"});
    REQUIRE(a.exit_code == kExitStructural);
    REQUIRE(a.command == Command::None);
}

TEST_CASE("zero jobs rejected", "[cli]") {
    auto a = parse({"build", "-j", "0"});
    REQUIRE(a.exit_code == kExitStructural);
    REQUIRE_FALSE(a.cli_output.empty());
}

TEST_CASE("global flags", "[cli]") {
    auto a = parse({"-vv", "--no-color", "-C", "/tmp/ws", "list"});
    REQUIRE(a.command == Command::List);
    REQUIRE(a.verbosity == 2);
    REQUIRE(a.no_color);
    REQUIRE(a.directory == "/tmp/ws");

    auto q = parse({"-q", "list"});
    REQUIRE(q.verbosity == -1);

    auto l = parse({"--log-level", "debug", "plan"});
    REQUIRE(l.log_level == std::string("debug"));
}

TEST_CASE("quiet and verbose are exclusive", "[cli]") {
    auto a = parse({"-q", "-v", "list"});
    REQUIRE(a.exit_code == kExitStructural);
}

TEST_CASE("plan with selection", "[cli]") {
    auto a = parse({"plan", "web", "-x", "legacy"});
    REQUIRE(a.command == Command::Plan);
    REQUIRE(a.packages == std::vector<std::string>{"web"});
    REQUIRE(a.exclude == std::vector<std::string>{"legacy"});
}

TEST_CASE("manifest command", "[cli]") {
    auto a = parse({"manifest", "models", "--lock"});
    REQUIRE(a.command == Command::Manifest);
    REQUIRE(a.packages == std::vector<std::string>{"models"});
    REQUIRE(a.lock_versions == true);

    auto missing = parse({"manifest"});
    REQUIRE(missing.exit_code == kExitStructural);
}

TEST_CASE("uninstall options", "[cli]") {
    auto a = parse({"uninstall", "api", "-x", "docs", "-j", "3", "--timeout", "20"});
    REQUIRE(a.command == Command::Uninstall);
    REQUIRE(a.packages == std::vector<std::string>{"api"});
    REQUIRE(a.exclude == std::vector<std::string>{"docs"});
    REQUIRE(a.jobs == size_t(3));
    REQUIRE(a.timeout == 20);
    REQUIRE_FALSE(a.manifest_file.has_value());

    REQUIRE(parse({"uninstall", "--lock"}).exit_code == kExitStructural);
}

TEST_CASE("dependency group options", "[cli]") {
    auto a = parse({"install", "--without", "dev"});
    REQUIRE(a.without_groups == std::vector<std::string>{"dev"});
    REQUIRE(a.only_groups.empty());

    auto m = parse({"manifest", "api", "--only", "main"});
    REQUIRE(m.command == Command::Manifest);
    REQUIRE(m.only_groups == std::vector<std::string>{"main"});

    REQUIRE(parse({"install", "--without", "docs"}).exit_code == kExitStructural);
    REQUIRE(parse({"install", "--without", "dev", "--only", "main"}).exit_code ==
            kExitStructural);
    REQUIRE(parse({"build", "--without", "dev"}).exit_code == kExitStructural);
}

TEST_CASE("unknown subcommand", "[cli]") {
    auto a = parse({"deploy"});
    REQUIRE(a.exit_code == kExitStructural);
}

TEST_CASE("command names", "[cli]") {
    REQUIRE(std::string(command_name(Command::Install)) == "install");
    REQUIRE(std::string(command_name(Command::Manifest)) == "manifest");
    REQUIRE(std::string(command_name(Command::Uninstall)) == "uninstall");
}

// ===== cli_config =====

TEST_CASE("cli config sets only given options", "[cli]") {
    auto a = parse({"install", "-j", "2", "--policy", "continue-independent"});
    auto r = cli_config(a);
    REQUIRE(r.is_ok());
    const auto& c = r.value();
    REQUIRE(c.concurrency_set);
    REQUIRE(c.concurrency == 2);
    REQUIRE(c.failure_policy_set);
    REQUIRE(c.failure_policy == FailurePolicy::PerBranch);
    REQUIRE_FALSE(c.lock_versions_set);
    REQUIRE_FALSE(c.timeout_set);
    REQUIRE_FALSE(c.keep_manifests_set);
}

TEST_CASE("cli config rejects a bad policy", "[cli]") {
    auto r = cli_config(parse({"install", "--policy", "eventually"}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Config);
}

TEST_CASE("cli config rejects a manifest path", "[cli]") {
    auto r = cli_config(parse({"build", "--manifest-file", "sub/pyproject.toml"}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Config);
}
