#pragma once

#include <kapla/result.hpp>
#include <kapla/orchestrator.hpp>
#include <string>
#include <optional>

namespace kapla {

// Layered settings: global > workspace > command line.
// Later layers override earlier ones field by field, only where a field
// was explicitly set.
struct Config {
    size_t concurrency = 0;                       // 0: hardware concurrency
    FailurePolicy failure_policy = FailurePolicy::PerBranch;
    bool lock_versions = false;
    bool keep_manifests = false;
    int timeout_seconds = 600;
    std::string manifest_file = "pyproject.toml";

    // Track which fields were explicitly set (for merge)
    bool concurrency_set = false;
    bool failure_policy_set = false;
    bool lock_versions_set = false;
    bool keep_manifests_set = false;
    bool timeout_set = false;
    bool manifest_file_set = false;

    // Load the [orchestrator] table of a TOML file (global config or root
    // manifest)
    static Result<Config> load(const std::string& path);

    static Result<Config> parse(const std::string& toml_str,
                                const std::string& origin = "");

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Worker count actually used: concurrency, or hardware concurrency
    // (at least 1) when unset
    size_t worker_count() const;

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& workspace,
                            const std::optional<Config>& cli);
};

// ~/.kapla/config.toml, empty when no home directory is known
std::string global_config_path();

} // namespace kapla
