#include <kapla/lockfile.hpp>
#include <kapla/name.hpp>
#include <kapla/log.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace kapla {

Result<LockFile> LockFile::parse(const std::string& toml_str,
                                 const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KaplaError{KaplaError::Parse,
            std::string("lock file parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    LockFile lock;
    auto arr = doc["package"].as_array();
    if (!arr) return Result<LockFile>::ok(std::move(lock));

    for (const auto& elem : *arr) {
        auto tbl = elem.as_table();
        int line = static_cast<int>(elem.source().begin.line);
        if (!tbl) {
            return KaplaError{KaplaError::Parse,
                "lock file [[package]] entry must be a table", "", origin, line};
        }
        auto name = (*tbl)["name"].value<std::string>();
        auto version = (*tbl)["version"].value<std::string>();
        if (!name || !version) {
            return KaplaError{KaplaError::Parse,
                "lock file entry is missing name or version", "", origin, line};
        }
        auto [it, inserted] = lock.packages.emplace(normalize_package_name(*name), *version);
        if (!inserted && it->second != *version) {
            return KaplaError{KaplaError::Parse,
                "package '" + *name + "' is locked to both " + it->second +
                " and " + *version, "", origin, line}.with_subjects({*name});
        }
    }

    return Result<LockFile>::ok(std::move(lock));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        log::debug("no lock file at %s", path.c_str());
        return Result<LockFile>::ok(LockFile{});
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return KaplaError{KaplaError::IO, "cannot open lock file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return LockFile::parse(ss.str(), path);
}

const std::string* LockFile::find(const std::string& name) const {
    auto it = packages.find(normalize_package_name(name));
    if (it == packages.end()) return nullptr;
    return &it->second;
}

} // namespace kapla
