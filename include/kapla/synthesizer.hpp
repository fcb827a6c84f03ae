#pragma once

#include <kapla/manifest.hpp>
#include <kapla/lockfile.hpp>
#include <set>
#include <string>
#include <vector>
#include <map>

namespace kapla {

// Repo-wide dependency name -> constraint, from [workspace.dependencies]
using SharedDependencySet = std::map<std::string, std::string>;

// Where the effective constraint of a merged dependency came from
enum class DepOrigin {
    Local,      // package-local constraint, overriding any shared one
    Shared,     // only declared in the shared set
    Inherited,  // { workspace = true } picking up the shared constraint
};

const char* dep_origin_name(DepOrigin origin);

struct MergedDependency {
    std::string name;
    std::string constraint;   // handed to the external tool
    std::string declared;     // constraint before lock pinning
    DepOrigin origin = DepOrigin::Local;
    bool locked = false;
    bool dev = false;
    std::vector<std::string> extras;
    std::string markers;

    bool operator==(const MergedDependency& o) const;
};

// Complete manifest for one package, ready for the external toolchain
struct MergedManifest {
    std::string name;
    std::string version;
    std::string path;
    std::string description;
    std::vector<std::string> authors;
    std::map<std::string, MergedDependency> dependencies;
    // Internal dependency name -> member directory
    std::map<std::string, std::string> local_paths;
    BuildSystem build;
    bool shared_deps_applied = false;

    // Render as TOML for the external tool
    std::string to_toml() const;

    bool operator==(const MergedManifest& o) const;
    bool operator!=(const MergedManifest& o) const { return !(*this == o); }
};

// Read-only inputs of synthesis, passed explicitly
struct SynthesisContext {
    SharedDependencySet shared;
    LockFile lock;
    // Member name -> directory, for internal dependency references
    std::map<std::string, std::string> member_paths;
    // Used when a package has no [build] section
    BuildSystem default_build;
    // Pin external dependencies to their locked versions
    bool lock_versions = false;
    // External dependency groups to leave out, and when non-empty the only
    // groups to keep. Internal dependencies are always kept.
    std::set<std::string> without_groups;
    std::set<std::string> only_groups;
};

// "main" for [dependencies] and shared entries, "dev" for [dev-dependencies]
const char* dependency_group_name(bool dev);
bool group_selected(const SynthesisContext& ctx, bool dev);

// Merge a package with the shared set and lock mapping. Pure: the same
// inputs always give the same manifest and nothing is mutated.
MergedManifest synthesize(const Manifest& pkg, const SynthesisContext& ctx);

} // namespace kapla
