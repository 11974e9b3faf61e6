// src/core/config.cpp
#include "pipeflow/core/config.h"
#include "pipeflow/core/errors.h"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace pipeflow {

namespace {

namespace fs = std::filesystem;

void warn_ignored(const char* key) {
    std::cerr << "[WARNING] Ignoring config field '" << key << "': unexpected type" << std::endl;
}

void read_string(const Value& j, const char* key, std::string& out) {
    if (!j.contains(key)) return;
    if (j[key].is_string()) {
        out = j[key].get<std::string>();
    } else {
        warn_ignored(key);
    }
}

template <typename T>
void read_positive(const Value& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    if (j[key].is_number_integer() && j[key].get<int64_t>() > 0) {
        out = static_cast<T>(j[key].get<int64_t>());
    } else {
        warn_ignored(key);
    }
}

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    fs::path p(path);
    if (p.is_absolute()) return path;
    return (fs::path(base_dir) / p).lexically_normal().string();
}

} // namespace

EngineConfig parse_engine_config(const Value& j, const std::string& base_dir) {
    EngineConfig config;
    if (!j.is_object()) {
        std::cerr << "[WARNING] Config document is not an object, using defaults" << std::endl;
        return config;
    }

    if (j.contains("definitions_dirs")) {
        if (j["definitions_dirs"].is_array()) {
            for (const auto& dir : j["definitions_dirs"]) {
                if (dir.is_string()) {
                    config.definitions_dirs.push_back(resolve_path(base_dir, dir.get<std::string>()));
                }
            }
        } else if (j["definitions_dirs"].is_string()) {
            config.definitions_dirs.push_back(resolve_path(base_dir, j["definitions_dirs"].get<std::string>()));
        } else {
            warn_ignored("definitions_dirs");
        }
    }

    read_string(j, "api_base_url", config.api_base_url);
    read_string(j, "public_base_url", config.public_base_url);
    read_string(j, "upload_url_template", config.upload_url_template);
    read_string(j, "user_agent", config.user_agent);

    if (j.contains("endpoint_overrides")) {
        if (j["endpoint_overrides"].is_object()) {
            for (const auto& [type, url] : j["endpoint_overrides"].items()) {
                if (url.is_string()) config.endpoint_overrides[type] = url.get<std::string>();
            }
        } else {
            warn_ignored("endpoint_overrides");
        }
    }

    read_positive(j, "http_timeout_ms", config.http_timeout_ms);
    read_positive(j, "connect_timeout_ms", config.connect_timeout_ms);
    read_positive(j, "script_timeout_ms", config.script_timeout_ms);
    read_positive(j, "script_memory_limit_mb", config.script_memory_limit_mb);
    read_positive(j, "history_limit", config.history_limit);

    if (j.contains("verify_ssl")) {
        if (j["verify_ssl"].is_boolean()) {
            config.verify_ssl = j["verify_ssl"].get<bool>();
        } else {
            warn_ignored("verify_ssl");
        }
    }

    std::string state_file;
    read_string(j, "state_file", state_file);
    if (!state_file.empty()) {
        config.state_file = resolve_path(base_dir, state_file);
    }

    return config;
}

EngineConfig load_engine_config(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return EngineConfig{};
    }

    Value j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Malformed config file '" + config_path + "': " + e.what());
    }

    // Relative paths are taken from the config file's directory
    fs::path config_dir = fs::path(config_path).parent_path();
    if (config_dir.empty()) config_dir = ".";
    return parse_engine_config(j, config_dir.string());
}

} // namespace pipeflow
