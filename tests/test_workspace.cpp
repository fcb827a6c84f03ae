#include <catch2/catch.hpp>
#include <kapla/workspace.hpp>
#include "test_support.hpp"

using namespace kapla;

static std::string member_toml(const std::string& name,
                               const std::string& version = "1.0.0",
                               const std::string& deps = "") {
    std::string version_line = version == "inherit"
        ? "version = { workspace = true }"
        : "version = \"" + version + "\"";
    return "[package]\nname = \"" + name + "\"\n" + version_line + "\n" +
           (deps.empty() ? "" : "\n[dependencies]\n" + deps + "\n");
}

// Root with two libs, one app, a hidden and an excluded directory
static void write_sample(const TempDir& tmp) {
    tmp.write_file("Kapla.toml", R"(
[workspace]
name = "monorepo"
version = "3.1.0"
members = ["libs/*", "apps/*"]
exclude = ["libs/legacy"]

[workspace.dependencies]
requests = "^2.28"
pydantic = { version = "^2.5" }

[workspace.build]
requires = ["poetry-core>=1.0.0"]
backend = "poetry.core.masonry.api"

[workspace.commands]
test = ["pytest", "{path}"]

[orchestrator]
concurrency = 3
lock-versions = true
)");
    tmp.write_file("libs/core/Kapla.toml", member_toml("core", "inherit"));
    tmp.write_file("libs/models/Kapla.toml",
        member_toml("models", "0.4.0", "core = { member = true }\npydantic = { workspace = true }"));
    tmp.write_file("apps/web/Kapla.toml",
        member_toml("web", "2.0.0", "models = { member = true }"));
    tmp.write_file("libs/legacy/Kapla.toml", member_toml("legacy"));
    tmp.write_file("libs/.cache/Kapla.toml", member_toml("cache"));
    tmp.write_file("docs/Kapla.toml", member_toml("docs"));
    tmp.write_file("libs/notes/README.md", "no manifest here");
}

// ===== load =====

TEST_CASE("load workspace members", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_ok());
    const auto& ws = r.value();

    REQUIRE(ws.member_count() == 3);
    std::vector<std::string> names;
    for (const auto& m : ws.members()) names.push_back(m.name);
    REQUIRE(names == std::vector<std::string>{"core", "models", "web"});

    const auto* models = ws.find_member("models");
    REQUIRE(models != nullptr);
    REQUIRE(models->version == "0.4.0");
    REQUIRE(fs::equivalent(models->root_dir, tmp.path / "libs/models"));
    REQUIRE(models->manifest.depends_on("core"));
    REQUIRE(ws.find_member("legacy") == nullptr);
    REQUIRE(ws.find_member("cache") == nullptr);
    REQUIRE(ws.find_member("docs") == nullptr);
}

TEST_CASE("inherited member version", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    auto ws = Workspace::load(tmp.path).value();
    REQUIRE(ws.find_member("core")->version == "3.1.0");
    REQUIRE(ws.find_member("core")->manifest.package.version == "3.1.0");
}

TEST_CASE("inherited version without a workspace version", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml", "[workspace]\nmembers = [\"libs/*\"]\n");
    tmp.write_file("libs/core/Kapla.toml", member_toml("core", "inherit"));
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Manifest);
}

TEST_CASE("workspace configuration accessors", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    auto ws = Workspace::load(tmp.path).value();

    REQUIRE(ws.config().name == "monorepo");
    REQUIRE(ws.shared_dependencies() ==
            SharedDependencySet{{"pydantic", "^2.5"}, {"requests", "^2.28"}});
    REQUIRE(ws.config().build.backend == "poetry.core.masonry.api");
    REQUIRE(ws.lockfile_path() == ws.root_dir() / "kapla.lock");
    REQUIRE(ws.settings().concurrency == 3);
    REQUIRE(ws.settings().lock_versions);
}

TEST_CASE("action commands", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    auto ws = Workspace::load(tmp.path).value();
    REQUIRE(ws.command("test") == std::vector<std::string>{"pytest", "{path}"});
    REQUIRE(ws.command("install") == std::vector<std::string>{"poetry", "install"});
    REQUIRE(ws.command("publish").empty());
}

TEST_CASE("manifests for the graph", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    auto ws = Workspace::load(tmp.path).value();
    auto manifests = ws.manifests();
    REQUIRE(manifests.size() == 3);
    REQUIRE(manifests[0].package.name == "core");
    REQUIRE(fs::equivalent(manifests[0].path, tmp.path / "libs/core"));
}

TEST_CASE("root without a workspace section", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml", member_toml("solo"));
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Manifest);
    REQUIRE(r.error().message.find("not a workspace") != std::string::npos);
}

TEST_CASE("duplicate member names", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml", "[workspace]\nmembers = [\"libs/*\", \"apps/*\"]\n");
    tmp.write_file("libs/core/Kapla.toml", member_toml("core"));
    tmp.write_file("apps/core/Kapla.toml", member_toml("core", "2.0.0"));
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Duplicate);
    REQUIRE(r.error().subjects == std::vector<std::string>{"core"});
}

TEST_CASE("nested workspace rejected", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml", "[workspace]\nmembers = [\"libs/*\"]\n");
    tmp.write_file("libs/inner/Kapla.toml", "[workspace]\nmembers = [\"x/*\"]\n");
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("nested workspaces") != std::string::npos);
}

TEST_CASE("invalid orchestrator settings in the root manifest", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml",
        "[workspace]\nmembers = [\"libs/*\"]\n\n[orchestrator]\nconcurrency = 0\n");
    auto r = Workspace::load(tmp.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == KaplaError::Config);
}

TEST_CASE("recursive member glob", "[workspace]") {
    TempDir tmp;
    tmp.write_file("Kapla.toml", "[workspace]\nmembers = [\"packages/**\"]\n");
    tmp.write_file("packages/a/Kapla.toml", member_toml("a"));
    tmp.write_file("packages/group/b/Kapla.toml", member_toml("b"));
    auto ws = Workspace::load(tmp.path).value();
    REQUIRE(ws.member_count() == 2);
    REQUIRE(ws.find_member("b") != nullptr);
}

// ===== discover =====

TEST_CASE("discover walks up past member manifests", "[workspace]") {
    TempDir tmp;
    write_sample(tmp);
    fs::create_directories(tmp.path / "libs/models/src/models");

    auto r = Workspace::discover(tmp.path / "libs/models/src/models");
    REQUIRE(r.is_ok());
    REQUIRE(fs::equivalent(r.value().root_dir(), tmp.path));
    REQUIRE(r.value().member_count() == 3);
}

TEST_CASE("discover without a workspace", "[workspace]") {
    TempDir tmp;
    tmp.write_file("lone/Kapla.toml", member_toml("lone"));
    auto r = Workspace::discover(tmp.path / "lone");
    // The temp directory may sit below an unrelated workspace; only the
    // common case is asserted.
    if (r.is_err()) {
        REQUIRE(r.error().code == KaplaError::NotFound);
    }
}
