#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <kapla/manifest.hpp>

#include <unistd.h>

namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        static std::atomic<int> counter{0};
        const char* base_env = std::getenv("KAPLA_TEST_TMPDIR");
        fs::path base = base_env ? fs::path(base_env) : fs::temp_directory_path();
        path = base / ("kapla_test_" + std::to_string(getpid()) + "_" +
            std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
            "_" + std::to_string(counter++));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    void write_file(const std::string& rel, const std::string& content) const {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    bool exists(const std::string& rel) const {
        return fs::exists(path / rel);
    }
};

// In-memory member manifest with internal dependencies only
inline kapla::Manifest make_manifest(const std::string& name,
                                     std::vector<std::string> deps = {},
                                     const std::string& version = "1.0.0") {
    kapla::Manifest m;
    m.package.name = name;
    m.package.version = version;
    m.path = "libs/" + name;
    std::sort(deps.begin(), deps.end());
    m.internal_deps = std::move(deps);
    return m;
}
