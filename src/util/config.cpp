#include <kapla/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace kapla {

static KaplaError config_error(const std::string& msg, const std::string& origin,
                               const toml::node& node) {
    return KaplaError{KaplaError::Config, msg, "",
                      origin, static_cast<int>(node.source().begin.line)};
}

Result<Config> Config::parse(const std::string& toml_str, const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return KaplaError{KaplaError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", origin, static_cast<int>(e.source().begin.line)};
    }

    Config cfg;
    auto* orch = doc["orchestrator"].as_table();
    if (!orch) return Result<Config>::ok(std::move(cfg));

    for (const auto& [key, val] : *orch) {
        std::string k(key);
        if (k == "concurrency") {
            auto v = val.value<int64_t>();
            if (!v || *v < 1) {
                return config_error("orchestrator.concurrency must be a positive integer",
                                    origin, val);
            }
            cfg.concurrency = static_cast<size_t>(*v);
            cfg.concurrency_set = true;
        } else if (k == "failure-policy") {
            auto v = val.value<std::string>();
            if (!v) {
                return config_error("orchestrator.failure-policy must be a string",
                                    origin, val);
            }
            auto policy = parse_failure_policy(*v);
            if (policy.is_err()) {
                KaplaError err = std::move(policy).error();
                err.file = origin;
                err.line = static_cast<int>(val.source().begin.line);
                return err;
            }
            cfg.failure_policy = policy.value();
            cfg.failure_policy_set = true;
        } else if (k == "lock-versions") {
            auto v = val.value<bool>();
            if (!v) return config_error("orchestrator.lock-versions must be a boolean", origin, val);
            cfg.lock_versions = *v;
            cfg.lock_versions_set = true;
        } else if (k == "keep-manifests") {
            auto v = val.value<bool>();
            if (!v) return config_error("orchestrator.keep-manifests must be a boolean", origin, val);
            cfg.keep_manifests = *v;
            cfg.keep_manifests_set = true;
        } else if (k == "timeout") {
            auto v = val.value<int64_t>();
            if (!v || *v < 1) {
                return config_error("orchestrator.timeout must be a positive number of seconds",
                                    origin, val);
            }
            cfg.timeout_seconds = static_cast<int>(*v);
            cfg.timeout_set = true;
        } else if (k == "manifest-file") {
            auto v = val.value<std::string>();
            if (!v || v->empty() || v->find('/') != std::string::npos) {
                return config_error("orchestrator.manifest-file must be a plain file name",
                                    origin, val);
            }
            cfg.manifest_file = *v;
            cfg.manifest_file_set = true;
        } else {
            return config_error("unknown orchestrator setting '" + k + "'", origin, val);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return KaplaError{KaplaError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

void Config::merge(const Config& other) {
    if (other.concurrency_set) {
        concurrency = other.concurrency;
        concurrency_set = true;
    }
    if (other.failure_policy_set) {
        failure_policy = other.failure_policy;
        failure_policy_set = true;
    }
    if (other.lock_versions_set) {
        lock_versions = other.lock_versions;
        lock_versions_set = true;
    }
    if (other.keep_manifests_set) {
        keep_manifests = other.keep_manifests;
        keep_manifests_set = true;
    }
    if (other.timeout_set) {
        timeout_seconds = other.timeout_seconds;
        timeout_set = true;
    }
    if (other.manifest_file_set) {
        manifest_file = other.manifest_file;
        manifest_file_set = true;
    }
}

size_t Config::worker_count() const {
    if (concurrency_set && concurrency > 0) return concurrency;
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& workspace,
                         const std::optional<Config>& cli) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (workspace.has_value()) result.merge(workspace.value());
    if (cli.has_value()) result.merge(cli.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.kapla/config.toml";
}

} // namespace kapla
