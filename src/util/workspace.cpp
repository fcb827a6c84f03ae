#include <kapla/workspace.hpp>
#include <kapla/action.hpp>
#include <kapla/glob.hpp>
#include <kapla/log.hpp>
#include <kapla/name.hpp>
#include <algorithm>
#include <map>
#include <set>

namespace kapla {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Private helpers
// ---------------------------------------------------------------------------

static bool matches_any(const std::vector<std::string>& patterns,
                        const std::string& rel) {
    for (const auto& pattern : patterns) {
        if (glob_match(pattern, rel)) return true;
    }
    return false;
}

Status Workspace::expand_member_globs() {
    const auto& ws = root_manifest_.workspace.value();
    std::vector<std::string> found_dirs;  // relative dir paths

    std::error_code ec;
    fs::recursive_directory_iterator it(root_dir_, ec);
    if (ec) {
        return KaplaError{KaplaError::IO,
            "cannot scan workspace '" + root_dir_.string() + "': " + ec.message()};
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return KaplaError{KaplaError::IO,
                "cannot scan workspace '" + root_dir_.string() + "': " + ec.message()};
        }
        const auto& entry = *it;
        if (!entry.is_directory(ec)) continue;

        // Hidden directories (.git, .venv, ...) are never members
        if (entry.path().filename().string().rfind('.', 0) == 0) {
            it.disable_recursion_pending();
            continue;
        }

        std::string rel_str = entry.path().lexically_relative(root_dir_).generic_string();
        if (!fs::exists(entry.path() / kManifestFileName, ec)) continue;
        if (!matches_any(ws.members, rel_str)) continue;
        if (matches_any(ws.exclude, rel_str)) {
            log::debug("excluding member directory '%s'", rel_str.c_str());
            continue;
        }
        found_dirs.push_back(rel_str);
    }

    for (const auto& rel_dir : found_dirs) {
        fs::path member_dir = root_dir_ / rel_dir;
        fs::path manifest_path = member_dir / kManifestFileName;

        KAPLA_TRY_ASSIGN(Manifest manifest, Manifest::load(manifest_path.string()));

        if (manifest.package.version_inherited) {
            if (ws.version.empty()) {
                return KaplaError{KaplaError::Manifest,
                    "member '" + manifest.package.name +
                    "' inherits its version but [workspace] declares none",
                    "set version in the root [workspace] table",
                    manifest_path.string(), 0};
            }
            manifest.package.version = ws.version;
        }

        WorkspaceMember member;
        member.name = manifest.package.name;
        member.version = manifest.package.version;
        member.manifest_path = manifest_path;
        member.root_dir = member_dir;
        member.manifest = std::move(manifest);
        members_.push_back(std::move(member));
    }

    // Sort members by name for deterministic ordering
    std::stable_sort(members_.begin(), members_.end(),
        [](const WorkspaceMember& a, const WorkspaceMember& b) {
            return a.name < b.name;
        });

    log::debug("workspace '%s': %zu member(s)", root_dir_.string().c_str(),
               members_.size());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Static factory methods
// ---------------------------------------------------------------------------

Result<Workspace> Workspace::load(const fs::path& workspace_root) {
    fs::path manifest_path = workspace_root / kManifestFileName;

    KAPLA_TRY_ASSIGN(Manifest manifest, Manifest::load(manifest_path.string()));
    if (!manifest.is_workspace()) {
        return KaplaError{KaplaError::Manifest,
            "not a workspace: " + manifest_path.string(),
            "add a [workspace] section to make this a workspace root"};
    }

    Workspace ws;

    std::error_code ec;
    ws.root_dir_ = fs::canonical(workspace_root, ec);
    if (ec) ws.root_dir_ = fs::absolute(workspace_root);

    ws.root_manifest_ = std::move(manifest);

    KAPLA_TRY_ASSIGN(ws.settings_, Config::load(manifest_path.string()));
    KAPLA_TRY(ws.expand_member_globs());
    KAPLA_TRY(ws.validate());

    return Result<Workspace>::ok(std::move(ws));
}

Result<Workspace> Workspace::discover(const fs::path& start_dir) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return KaplaError{KaplaError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    while (true) {
        fs::path candidate = dir / kManifestFileName;
        if (fs::exists(candidate, ec)) {
            auto manifest = Manifest::load(candidate.string());
            if (manifest.is_ok() && manifest.value().is_workspace()) {
                return Workspace::load(dir);
            }
            // A member manifest: keep walking up
        }

        fs::path parent = dir.parent_path();
        if (parent == dir) {
            return KaplaError{KaplaError::NotFound,
                "no workspace root found from: " + start_dir.string(),
                std::string("create a ") + kManifestFileName +
                " with a [workspace] section at the repository root"};
        }
        dir = parent;
    }
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

const std::vector<WorkspaceMember>& Workspace::members() const {
    return members_;
}

size_t Workspace::member_count() const {
    return members_.size();
}

const WorkspaceMember* Workspace::find_member(const std::string& name) const {
    for (const auto& m : members_) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

std::vector<Manifest> Workspace::manifests() const {
    std::vector<Manifest> out;
    out.reserve(members_.size());
    for (const auto& m : members_) out.push_back(m.manifest);
    return out;
}

const WorkspaceConfig& Workspace::config() const {
    return root_manifest_.workspace.value();
}

const SharedDependencySet& Workspace::shared_dependencies() const {
    return config().dependencies;
}

fs::path Workspace::lockfile_path() const {
    return root_dir_ / config().lockfile;
}

std::vector<std::string> Workspace::command(const std::string& action) const {
    auto it = config().commands.find(action);
    if (it != config().commands.end()) return it->second;
    return default_command(action);
}

const Config& Workspace::settings() const {
    return settings_;
}

const fs::path& Workspace::root_dir() const {
    return root_dir_;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

Status Workspace::validate() const {
    for (const auto& m : members_) {
        if (m.manifest.is_workspace()) {
            return KaplaError{KaplaError::Manifest,
                "member at '" + m.root_dir.string() +
                "' is itself a workspace, nested workspaces not allowed",
                "", m.manifest_path.string(), 0};
        }
    }

    std::map<std::string, const WorkspaceMember*> names;
    for (const auto& m : members_) {
        auto [it, inserted] = names.emplace(m.name, &m);
        if (!inserted) {
            return KaplaError{KaplaError::Duplicate,
                "duplicate workspace member name: " + m.name,
                "declared in '" + it->second->manifest_path.string() +
                "' and '" + m.manifest_path.string() + "'"}
                .with_subjects({m.name});
        }
    }

    std::set<std::string> shared;
    for (const auto& [dep_name, constraint] : shared_dependencies()) {
        shared.insert(normalize_package_name(dep_name));
    }
    for (const auto& m : members_) {
        for (const auto& [dep_name, dep] : m.manifest.external_deps) {
            if (dep.inherit && !shared.count(normalize_package_name(dep_name))) {
                log::warn("member '%s' inherits '%s' which is not in "
                          "[workspace.dependencies], using '*'",
                          m.name.c_str(), dep_name.c_str());
            }
        }
    }

    return ok_status();
}

} // namespace kapla
