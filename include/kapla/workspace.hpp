#pragma once

#include <kapla/result.hpp>
#include <kapla/manifest.hpp>
#include <kapla/config.hpp>
#include <kapla/synthesizer.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace kapla {

struct WorkspaceMember {
    std::string name;
    std::string version;
    std::filesystem::path manifest_path;
    std::filesystem::path root_dir;
    Manifest manifest;
};

class Workspace {
public:
    // Walk up from start_dir to find a workspace root (Kapla.toml with [workspace])
    static Result<Workspace> discover(const std::filesystem::path& start_dir);

    // Load from a specific workspace root directory
    static Result<Workspace> load(const std::filesystem::path& workspace_root);

    const std::vector<WorkspaceMember>& members() const;
    size_t member_count() const;

    // Find member by package name
    const WorkspaceMember* find_member(const std::string& name) const;

    // Member manifests in name order, ready for DependencyGraph::build
    std::vector<Manifest> manifests() const;

    const WorkspaceConfig& config() const;
    const SharedDependencySet& shared_dependencies() const;

    // Absolute path of the lock file; it may not exist
    std::filesystem::path lockfile_path() const;

    // argv template for an action: [workspace.commands] first, then the
    // built-in default. Empty when neither knows the action.
    std::vector<std::string> command(const std::string& action) const;

    // Workspace layer of the settings: the root manifest's [orchestrator]
    const Config& settings() const;

    // Validate workspace structure
    Status validate() const;

    const std::filesystem::path& root_dir() const;

private:
    Manifest root_manifest_;
    std::filesystem::path root_dir_;
    std::vector<WorkspaceMember> members_;
    Config settings_;

    // Expand member glob patterns into actual member directories
    Status expand_member_globs();
};

} // namespace kapla
