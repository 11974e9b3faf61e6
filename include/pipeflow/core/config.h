// pipeflow/core/config.h
#ifndef PIPEFLOW_CORE_CONFIG_H
#define PIPEFLOW_CORE_CONFIG_H

#include "common/types.h"
#include <map>
#include <string>
#include <vector>

namespace pipeflow {

struct EngineConfig {
    std::vector<std::string> definitions_dirs;           // searched after registered documents
    std::string api_base_url;                            // prefix for relative endpoints
    std::string public_base_url;                         // origin used to sanitize file URLs
    std::string upload_url_template = "/api/upload/pdb/{file_id}";
    std::map<std::string, std::string> endpoint_overrides; // node type -> URL

    long http_timeout_ms = 60000;
    long connect_timeout_ms = 10000;
    bool verify_ssl = true;
    std::string user_agent = "pipeflow/1.0";

    long script_timeout_ms = 5000;
    size_t script_memory_limit_mb = 64;

    size_t history_limit = 50;
    std::string state_file; // empty: no persistence
};

// Missing file -> defaults; fields of the wrong type are ignored one by one.
// Throws ConfigurationError when the file exists but is not valid JSON.
EngineConfig load_engine_config(const std::string& config_path = "pipeflow_config.json");

EngineConfig parse_engine_config(const Value& doc, const std::string& base_dir = ".");

} // namespace pipeflow

#endif // PIPEFLOW_CORE_CONFIG_H
