#pragma once

#include <kapla/result.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace kapla {

// Name of the manifest file at the workspace root and in every member
inline constexpr const char* kManifestFileName = "Kapla.toml";

// [package] section
struct PackageInfo {
    std::string name;
    std::string version;
    std::string description;
    std::vector<std::string> authors;
    // version = { workspace = true }: filled in from [workspace] on load
    bool version_inherited = false;
};

// One entry of [dependencies] / [dev-dependencies] resolved from outside
// the monorepo. The constraint is opaque to kapla.
struct ExternalDep {
    std::string name;
    std::string constraint;            // empty when inherited
    bool inherit = false;              // { workspace = true }
    bool dev = false;                  // declared under [dev-dependencies]
    std::vector<std::string> extras;
    std::string markers;

    bool operator==(const ExternalDep& o) const;
};

// [build] section, also [workspace.build]
struct BuildSystem {
    std::vector<std::string> requirements;   // "requires"
    std::string backend;

    bool empty() const { return requirements.empty() && backend.empty(); }
    bool operator==(const BuildSystem& o) const;
};

// [workspace] section of the root manifest
struct WorkspaceConfig {
    std::string name;
    std::string version;
    std::vector<std::string> members;
    std::vector<std::string> exclude;
    std::string lockfile = "kapla.lock";
    // [workspace.dependencies]: the shared dependency set
    std::map<std::string, std::string> dependencies;
    // [workspace.build]: default build system for members
    BuildSystem build;
    // [workspace.commands]: argv templates keyed by action name
    std::map<std::string, std::vector<std::string>> commands;
};

// Validated, strict form of one Kapla.toml. Every downstream component
// works on this type only.
struct Manifest {
    PackageInfo package;
    std::string path;                                   // directory of the package
    std::vector<std::string> internal_deps;             // sorted, unique
    std::map<std::string, ExternalDep> external_deps;   // keyed by declared name
    BuildSystem build;
    std::optional<WorkspaceConfig> workspace;

    // Parse from TOML text; path is recorded verbatim
    static Result<Manifest> parse(const std::string& toml_str,
                                  const std::string& path = "");

    // Parse from a manifest file; path becomes the file's directory
    static Result<Manifest> load(const std::string& file);

    bool is_workspace() const;

    bool depends_on(const std::string& name) const;
};

} // namespace kapla
