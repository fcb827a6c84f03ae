#include <catch2/catch.hpp>
#include <kapla/action.hpp>
#include "test_support.hpp"

#include <thread>

using namespace kapla;

static MergedManifest sample_manifest() {
    MergedManifest m;
    m.name = "api";
    m.version = "2.0.0";
    m.path = "libs/api";
    m.dependencies["requests"] = MergedDependency{
        "requests", "^2.31", "^2.31", DepOrigin::Local, false, false, {}, ""};
    m.shared_deps_applied = true;
    return m;
}

// ===== expand_command =====

TEST_CASE("expand command placeholders", "[action]") {
    auto argv = expand_command(
        {"tool", "--pkg={name}", "{version}", "{path}", "-f", "{manifest}", "{other}"},
        sample_manifest(), "/ws/libs/api", "/ws/libs/api/pyproject.toml");
    REQUIRE(argv == std::vector<std::string>{
        "tool", "--pkg=api", "2.0.0", "/ws/libs/api", "-f",
        "/ws/libs/api/pyproject.toml", "{other}"});
}

TEST_CASE("repeated placeholders all expand", "[action]") {
    auto argv = expand_command({"{name}-{name}"}, sample_manifest(), "", "");
    REQUIRE(argv == std::vector<std::string>{"api-api"});
}

TEST_CASE("default commands", "[action]") {
    REQUIRE(default_command("install") == std::vector<std::string>{"poetry", "install"});
    REQUIRE(default_command("build") == std::vector<std::string>{"poetry", "build"});
    REQUIRE(default_command("uninstall") ==
            std::vector<std::string>{"pip", "uninstall", "-y", "{name}"});
    REQUIRE(default_command("publish").empty());
}

// ===== CommandAction =====

static CommandActionOptions sh_action(const std::string& script) {
    CommandActionOptions opts;
    opts.name = "build";
    opts.argv = {"/bin/sh", "-c", script};
    opts.timeout_seconds = 30;
    return opts;
}

TEST_CASE("command runs in the package directory with the manifest present", "[action]") {
    TempDir tmp;
    CommandAction action(sh_action("cp pyproject.toml seen.toml && pwd > where.txt"));
    CancelToken token;

    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    REQUIRE(outcome.ok);
    REQUIRE(outcome.exit_code == 0);

    std::string seen = tmp.read_file("seen.toml");
    REQUIRE(seen.find("name = \"api\"") != std::string::npos);
    REQUIRE(seen.find("requests = \"^2.31\"") != std::string::npos);
    std::string where = tmp.read_file("where.txt");
    REQUIRE(fs::equivalent(fs::path(where.substr(0, where.find('\n'))), tmp.path));
    // Removed after the command
    REQUIRE_FALSE(tmp.exists("pyproject.toml"));
}

TEST_CASE("manifest kept on request", "[action]") {
    TempDir tmp;
    auto opts = sh_action("true");
    opts.keep_manifest = true;
    opts.manifest_file = "generated.toml";
    CommandAction action(opts);
    CancelToken token;

    REQUIRE(action.execute(sample_manifest(), tmp.path.string(), token).ok);
    REQUIRE(tmp.exists("generated.toml"));
    REQUIRE_FALSE(tmp.exists("pyproject.toml"));
}

TEST_CASE("manifest removed after a failed command", "[action]") {
    TempDir tmp;
    CommandAction action(sh_action("echo starting; echo 'resolver: no match' >&2; exit 4"));
    CancelToken token;

    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    REQUIRE_FALSE(outcome.ok);
    REQUIRE_FALSE(outcome.cancelled);
    REQUIRE(outcome.exit_code == 4);
    REQUIRE(outcome.message == "'/bin/sh' exited with code 4: resolver: no match");
    REQUIRE_FALSE(tmp.exists("pyproject.toml"));
}

TEST_CASE("placeholders reach the command", "[action]") {
    TempDir tmp;
    CommandAction action(sh_action("echo {name} {version} > out.txt"));
    CancelToken token;
    REQUIRE(action.execute(sample_manifest(), tmp.path.string(), token).ok);
    REQUIRE(tmp.read_file("out.txt") == "api 2.0.0\n");
}

TEST_CASE("missing executable", "[action]") {
    TempDir tmp;
    CommandActionOptions opts;
    opts.name = "install";
    opts.argv = {"kapla-no-such-tool-xyz"};
    CommandAction action(opts);
    CancelToken token;

    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.exit_code == 127);
    REQUIRE(outcome.message.find("could not execute") != std::string::npos);
}

TEST_CASE("empty command fails", "[action]") {
    TempDir tmp;
    CommandActionOptions opts;
    opts.name = "publish";
    CommandAction action(opts);
    CancelToken token;
    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.message.find("no command configured") != std::string::npos);
}

TEST_CASE("cancelled before start does not run", "[action]") {
    TempDir tmp;
    CommandAction action(sh_action("touch ran"));
    CancelToken token;
    token.cancel();

    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.cancelled);
    REQUIRE_FALSE(tmp.exists("ran"));
}

TEST_CASE("cancelled while running", "[action]") {
    TempDir tmp;
    CommandAction action(sh_action("exec sleep 10"));
    CancelToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto outcome = action.execute(sample_manifest(), tmp.path.string(), token);
    canceller.join();

    REQUIRE_FALSE(outcome.ok);
    REQUIRE(outcome.cancelled);
    REQUIRE(outcome.message == "cancelled");
    REQUIRE_FALSE(tmp.exists("pyproject.toml"));
}
