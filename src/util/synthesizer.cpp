#include <kapla/synthesizer.hpp>
#include <kapla/name.hpp>
#include <toml++/toml.hpp>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace kapla {

const char* dep_origin_name(DepOrigin origin) {
    switch (origin) {
        case DepOrigin::Local:     return "local";
        case DepOrigin::Shared:    return "shared";
        case DepOrigin::Inherited: return "inherited";
    }
    return "unknown";
}

bool MergedDependency::operator==(const MergedDependency& o) const {
    return name == o.name && constraint == o.constraint &&
           declared == o.declared && origin == o.origin &&
           locked == o.locked && dev == o.dev &&
           extras == o.extras && markers == o.markers;
}

bool MergedManifest::operator==(const MergedManifest& o) const {
    return name == o.name && version == o.version && path == o.path &&
           description == o.description && authors == o.authors &&
           dependencies == o.dependencies && local_paths == o.local_paths &&
           build == o.build && shared_deps_applied == o.shared_deps_applied;
}

// ---------------------------------------------------------------------------
// synthesize
// ---------------------------------------------------------------------------

const char* dependency_group_name(bool dev) {
    return dev ? "dev" : "main";
}

bool group_selected(const SynthesisContext& ctx, bool dev) {
    std::string group = dependency_group_name(dev);
    if (ctx.without_groups.count(group)) return false;
    return ctx.only_groups.empty() || ctx.only_groups.count(group) > 0;
}

static void apply_lock(MergedDependency& dep, const SynthesisContext& ctx) {
    if (!ctx.lock_versions) return;
    const std::string* pinned = ctx.lock.find(dep.name);
    if (!pinned) return;
    dep.constraint = "==" + *pinned;
    dep.locked = true;
}

MergedManifest synthesize(const Manifest& pkg, const SynthesisContext& ctx) {
    MergedManifest out;
    out.name = pkg.package.name;
    out.version = pkg.package.version;
    out.path = pkg.path;
    out.description = pkg.package.description;
    out.authors = pkg.package.authors;
    out.build = pkg.build.empty() ? ctx.default_build : pkg.build;

    // Internal dependencies are built from the tree, never fetched
    std::unordered_set<std::string> internal;
    for (const auto& dep : pkg.internal_deps) {
        internal.insert(normalize_package_name(dep));
        auto it = ctx.member_paths.find(dep);
        out.local_paths[dep] = it != ctx.member_paths.end() ? it->second : dep;
    }

    std::unordered_map<std::string, const std::string*> shared_by_key;
    for (const auto& [name, constraint] : ctx.shared) {
        shared_by_key[normalize_package_name(name)] = &constraint;
    }

    // Package-local entries: override or inherit
    std::unordered_set<std::string> local_keys;
    for (const auto& [name, ext] : pkg.external_deps) {
        std::string key = normalize_package_name(name);
        local_keys.insert(key);
        if (!group_selected(ctx, ext.dev)) continue;

        MergedDependency dep;
        dep.name = name;
        dep.dev = ext.dev;
        dep.extras = ext.extras;
        dep.markers = ext.markers;
        if (ext.inherit) {
            auto it = shared_by_key.find(key);
            dep.declared = it != shared_by_key.end() ? *it->second : "*";
            dep.origin = DepOrigin::Inherited;
        } else {
            dep.declared = ext.constraint;
            dep.origin = DepOrigin::Local;
        }
        dep.constraint = dep.declared;
        apply_lock(dep, ctx);
        out.dependencies[name] = std::move(dep);
    }

    // Shared-only entries pass through as-is
    for (const auto& [name, constraint] : ctx.shared) {
        std::string key = normalize_package_name(name);
        if (local_keys.count(key) || internal.count(key)) continue;
        if (!group_selected(ctx, false)) continue;

        MergedDependency dep;
        dep.name = name;
        dep.declared = constraint;
        dep.constraint = constraint;
        dep.origin = DepOrigin::Shared;
        apply_lock(dep, ctx);
        out.dependencies[name] = std::move(dep);
    }

    out.shared_deps_applied = true;
    return out;
}

// ---------------------------------------------------------------------------
// MergedManifest::to_toml
// ---------------------------------------------------------------------------

static toml::array to_array(const std::vector<std::string>& items) {
    toml::array arr;
    for (const auto& s : items) arr.push_back(s);
    return arr;
}

std::string MergedManifest::to_toml() const {
    toml::table package;
    package.insert_or_assign("name", name);
    package.insert_or_assign("version", version);
    if (!description.empty()) package.insert_or_assign("description", description);
    if (!authors.empty()) package.insert_or_assign("authors", to_array(authors));

    toml::table deps;
    toml::table dev_deps;
    for (const auto& [dep_name, dep] : dependencies) {
        toml::table& target = dep.dev ? dev_deps : deps;
        if (dep.extras.empty() && dep.markers.empty()) {
            target.insert_or_assign(dep_name, dep.constraint);
            continue;
        }
        toml::table entry;
        entry.is_inline(true);
        entry.insert_or_assign("version", dep.constraint);
        if (!dep.extras.empty()) entry.insert_or_assign("extras", to_array(dep.extras));
        if (!dep.markers.empty()) entry.insert_or_assign("markers", dep.markers);
        target.insert_or_assign(dep_name, std::move(entry));
    }
    for (const auto& [dep_name, dep_path] : local_paths) {
        toml::table entry;
        entry.is_inline(true);
        entry.insert_or_assign("path", dep_path);
        entry.insert_or_assign("develop", true);
        deps.insert_or_assign(dep_name, std::move(entry));
    }

    toml::table doc;
    doc.insert_or_assign("package", std::move(package));
    doc.insert_or_assign("dependencies", std::move(deps));
    if (!dev_deps.empty()) doc.insert_or_assign("dev-dependencies", std::move(dev_deps));

    if (!build.empty()) {
        toml::table build_system;
        build_system.insert_or_assign("requires", to_array(build.requirements));
        if (!build.backend.empty()) {
            build_system.insert_or_assign("build-backend", build.backend);
        }
        doc.insert_or_assign("build-system", std::move(build_system));
    }

    toml::table tool;
    tool.insert_or_assign("shared-deps-applied", shared_deps_applied);
    doc.insert_or_assign("kapla", std::move(tool));

    std::ostringstream ss;
    ss << doc << "\n";
    return ss.str();
}

} // namespace kapla
