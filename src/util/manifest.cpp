#include <kapla/manifest.hpp>
#include <kapla/name.hpp>
#include <kapla/version.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace kapla {

bool ExternalDep::operator==(const ExternalDep& o) const {
    return name == o.name && constraint == o.constraint &&
           inherit == o.inherit && dev == o.dev &&
           extras == o.extras && markers == o.markers;
}

bool BuildSystem::operator==(const BuildSystem& o) const {
    return requirements == o.requirements && backend == o.backend;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int line_of(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

static KaplaError manifest_error(const std::string& msg, const toml::node& node,
                                 const std::string& path) {
    return KaplaError{KaplaError::Manifest, msg, "", path, line_of(node)};
}

static Result<std::vector<std::string>> string_array(const toml::node& node,
                                                     const std::string& what,
                                                     const std::string& path) {
    std::vector<std::string> out;
    auto arr = node.as_array();
    if (!arr) {
        return manifest_error(what + " must be an array of strings", node, path);
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return manifest_error(what + " must be an array of strings", elem, path);
        }
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

// Parsed entry of a dependency table, before it is sorted into
// internal or external.
struct DepEntry {
    bool member = false;
    ExternalDep external;
};

static Result<DepEntry> parse_dependency(const std::string& name,
                                         const toml::node& node,
                                         bool dev,
                                         const std::string& path) {
    DepEntry entry;
    entry.external.name = name;
    entry.external.dev = dev;

    // requests = "^2.28"
    if (auto s = node.value<std::string>()) {
        if (s->empty()) {
            return manifest_error("dependency '" + name + "' has an empty constraint",
                                  node, path);
        }
        entry.external.constraint = *s;
        return Result<DepEntry>::ok(std::move(entry));
    }

    auto tbl = node.as_table();
    if (!tbl) {
        return manifest_error("dependency '" + name + "' must be a string or a table",
                              node, path);
    }
    if (tbl->empty()) {
        return KaplaError{KaplaError::Manifest,
            "dependency '" + name + "' has no source",
            "specify one of: a version string, version = \"...\", "
            "workspace = true, or member = true",
            path, line_of(node)};
    }

    for (const auto& [key, val] : *tbl) {
        std::string k(key.str());
        if (k != "member" && k != "workspace" && k != "version" &&
            k != "extras" && k != "markers") {
            return KaplaError{KaplaError::Manifest,
                "dependency '" + name + "' has unknown key '" + k + "'",
                "allowed keys: member, workspace, version, extras, markers",
                path, line_of(val)};
        }
    }

    int source_count = 0;
    if (auto node = tbl->get("member")) {
        auto m = node->value<bool>();
        if (!m || !node->is_boolean() || !*m) {
            return manifest_error("dependency '" + name + "': member must be true",
                                  *node, path);
        }
        entry.member = true;
        ++source_count;
    }
    if (auto node = tbl->get("workspace")) {
        auto ws = node->value<bool>();
        if (!ws || !node->is_boolean() || !*ws) {
            return manifest_error("dependency '" + name + "': workspace must be true",
                                  *node, path);
        }
        entry.external.inherit = true;
        ++source_count;
    }
    if (auto node = tbl->get("version")) {
        auto v = node->value<std::string>();
        if (!node->is_string() || !v || v->empty()) {
            return manifest_error("dependency '" + name +
                                  "': version must be a non-empty string", *node, path);
        }
        entry.external.constraint = *v;
        ++source_count;
    }
    if (source_count > 1) {
        return KaplaError{KaplaError::Manifest,
            "dependency '" + name + "' has multiple sources",
            "version, workspace, and member are mutually exclusive",
            path, line_of(node)};
    }

    if (entry.member && dev) {
        return KaplaError{KaplaError::Manifest,
            "dev dependency '" + name + "' cannot be a workspace member",
            "declare internal dependencies under [dependencies]",
            path, line_of(node)};
    }

    if (auto extras = tbl->get("extras")) {
        auto list = string_array(*extras, "extras of '" + name + "'", path);
        if (list.is_err()) return std::move(list).error();
        entry.external.extras = std::move(list).value();
    }
    if (auto markers = tbl->get("markers")) {
        if (!markers->is_string()) {
            return manifest_error("dependency '" + name + "': markers must be a string",
                                  *markers, path);
        }
        entry.external.markers = markers->value<std::string>().value_or("");
    }
    if (entry.member && (!entry.external.extras.empty() ||
                         !entry.external.markers.empty())) {
        return manifest_error("member dependency '" + name +
                              "' cannot declare extras or markers", node, path);
    }

    // { extras = [...] } alone leaves the constraint open
    if (source_count == 0) entry.external.constraint = "*";

    return Result<DepEntry>::ok(std::move(entry));
}

static Status parse_dependency_table(const toml::table& tbl, bool dev,
                                     const std::string& path, Manifest& m,
                                     std::set<std::string>& seen) {
    for (const auto& [key, val] : tbl) {
        std::string name(key.str());

        auto valid = validate_package_name(name);
        if (valid.is_err()) {
            auto err = std::move(valid).error();
            err.code = KaplaError::Manifest;
            err.file = path;
            err.line = line_of(val);
            return err;
        }

        // "Foo-Bar" and "foo_bar" name the same dependency
        if (!seen.insert(normalize_package_name(name)).second) {
            return KaplaError{KaplaError::Manifest,
                "dependency '" + name + "' is declared more than once",
                "remove the duplicate entry",
                path, line_of(val)}.with_subjects({name});
        }

        if (name == m.package.name) {
            return KaplaError{KaplaError::Manifest,
                "package '" + name + "' depends on itself",
                "", path, line_of(val)}.with_subjects({name});
        }

        auto entry = parse_dependency(name, val, dev, path);
        if (entry.is_err()) return std::move(entry).error();

        if (entry.value().member) {
            m.internal_deps.push_back(name);
        } else {
            m.external_deps[name] = std::move(entry.value().external);
        }
    }
    return ok_status();
}

static Result<BuildSystem> parse_build_system(const toml::table& tbl,
                                              const std::string& path) {
    BuildSystem bs;
    if (auto req = tbl.get("requires")) {
        auto list = string_array(*req, "build requires", path);
        if (list.is_err()) return std::move(list).error();
        bs.requirements = std::move(list).value();
    }
    if (auto v = tbl["backend"].value<std::string>()) bs.backend = *v;
    return Result<BuildSystem>::ok(std::move(bs));
}

static Result<WorkspaceConfig> parse_workspace(const toml::table& ws,
                                               const std::string& path) {
    WorkspaceConfig wc;
    if (auto v = ws["name"].value<std::string>()) wc.name = *v;
    if (auto v = ws["version"].value<std::string>()) {
        auto parsed = Version::parse(*v);
        if (parsed.is_err()) {
            auto err = std::move(parsed).error();
            err.file = path;
            return err;
        }
        wc.version = *v;
    }
    if (auto v = ws["lockfile"].value<std::string>()) wc.lockfile = *v;

    if (auto members = ws.get("members")) {
        auto list = string_array(*members, "workspace members", path);
        if (list.is_err()) return std::move(list).error();
        wc.members = std::move(list).value();
    }
    if (auto exclude = ws.get("exclude")) {
        auto list = string_array(*exclude, "workspace exclude", path);
        if (list.is_err()) return std::move(list).error();
        wc.exclude = std::move(list).value();
    }

    if (auto deps = ws["dependencies"].as_table()) {
        for (const auto& [key, val] : *deps) {
            std::string name(key.str());
            std::string constraint;
            if (auto s = val.value<std::string>()) {
                constraint = *s;
            } else if (auto t = val.as_table()) {
                auto v = t->get("version");
                if (!v || !v->is_string() || t->size() != 1) {
                    return manifest_error("workspace dependency '" + name +
                                          "' must be { version = \"...\" }", val, path);
                }
                constraint = v->value<std::string>().value_or("");
            } else {
                return manifest_error("workspace dependency '" + name +
                                      "' must be a string or a table", val, path);
            }
            wc.dependencies[name] = constraint;
        }
    }

    if (auto build = ws["build"].as_table()) {
        auto bs = parse_build_system(*build, path);
        if (bs.is_err()) return std::move(bs).error();
        wc.build = std::move(bs).value();
    }

    if (auto commands = ws["commands"].as_table()) {
        for (const auto& [key, val] : *commands) {
            std::string action(key.str());
            auto argv = string_array(val, "command '" + action + "'", path);
            if (argv.is_err()) return std::move(argv).error();
            if (argv.value().empty()) {
                return manifest_error("command '" + action + "' is empty", val, path);
            }
            wc.commands[action] = std::move(argv).value();
        }
    }

    return Result<WorkspaceConfig>::ok(std::move(wc));
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str,
                                 const std::string& path) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KaplaError{KaplaError::Parse,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", path, static_cast<int>(e.source().begin.line)};
    }

    Manifest m;
    m.path = path;

    if (auto ws = doc["workspace"].as_table()) {
        if (doc.contains("package")) {
            return KaplaError{KaplaError::Manifest,
                "workspace root cannot declare a [package] section",
                "move the package into its own member directory",
                path, 0};
        }
        auto wc = parse_workspace(*ws, path);
        if (wc.is_err()) return std::move(wc).error();
        m.workspace = std::move(wc).value();
        return Result<Manifest>::ok(std::move(m));
    }

    // [package] section
    auto pkg = doc["package"].as_table();
    if (!pkg) {
        return KaplaError{KaplaError::Manifest,
            "missing [package] section",
            "every member manifest needs a [package] table with name and version",
            path, 0};
    }

    auto name = (*pkg)["name"].value<std::string>();
    if (!name) {
        return KaplaError{KaplaError::Manifest,
            "missing required field 'package.name'", "", path, line_of(*pkg)};
    }
    auto valid = validate_package_name(*name);
    if (valid.is_err()) {
        auto err = std::move(valid).error();
        err.code = KaplaError::Manifest;
        err.file = path;
        err.line = line_of(*pkg);
        return err;
    }
    m.package.name = *name;

    auto version_node = pkg->get("version");
    if (!version_node) {
        return KaplaError{KaplaError::Manifest,
            "missing required field 'package.version' in '" + *name + "'",
            "set version = \"x.y.z\" or version = { workspace = true }",
            path, line_of(*pkg)};
    }
    if (auto v = version_node->value<std::string>()) {
        auto parsed = Version::parse(*v);
        if (parsed.is_err()) {
            auto err = std::move(parsed).error();
            err.file = path;
            err.line = line_of(*version_node);
            return err;
        }
        m.package.version = *v;
    } else if (auto t = version_node->as_table();
               t && (*t)["workspace"].value_or(false)) {
        m.package.version_inherited = true;
    } else {
        return manifest_error("package.version must be a string or { workspace = true }",
                              *version_node, path);
    }

    if (auto v = (*pkg)["description"].value<std::string>()) {
        m.package.description = *v;
    }
    if (auto authors = pkg->get("authors")) {
        auto list = string_array(*authors, "package.authors", path);
        if (list.is_err()) return std::move(list).error();
        m.package.authors = std::move(list).value();
    }

    std::set<std::string> seen;
    if (auto deps = doc.get("dependencies")) {
        auto tbl = deps->as_table();
        if (!tbl) return manifest_error("[dependencies] must be a table", *deps, path);
        KAPLA_TRY(parse_dependency_table(*tbl, false, path, m, seen));
    }
    if (auto deps = doc.get("dev-dependencies")) {
        auto tbl = deps->as_table();
        if (!tbl) return manifest_error("[dev-dependencies] must be a table", *deps, path);
        KAPLA_TRY(parse_dependency_table(*tbl, true, path, m, seen));
    }
    std::sort(m.internal_deps.begin(), m.internal_deps.end());

    if (auto build = doc["build"].as_table()) {
        auto bs = parse_build_system(*build, path);
        if (bs.is_err()) return std::move(bs).error();
        m.build = std::move(bs).value();
    }

    return Result<Manifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Manifest::load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::load(const std::string& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return KaplaError{KaplaError::IO,
            "cannot open manifest file: " + file};
    }

    std::ostringstream ss;
    ss << in.rdbuf();

    auto m = Manifest::parse(ss.str(), std::filesystem::path(file).parent_path().string());
    if (m.is_err()) {
        // Point diagnostics at the file rather than its directory
        auto err = std::move(m).error();
        err.file = file;
        return err;
    }
    return m;
}

bool Manifest::is_workspace() const {
    return workspace.has_value();
}

bool Manifest::depends_on(const std::string& name) const {
    return std::binary_search(internal_deps.begin(), internal_deps.end(), name);
}

} // namespace kapla
