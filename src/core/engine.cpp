// src/core/engine.cpp
#include "pipeflow/core/engine.h"
#include "pipeflow/core/errors.h"
#include "common/utils.h"
#include <iostream>

namespace pipeflow {

namespace {

HttpClientOptions http_options(const EngineConfig& config) {
    HttpClientOptions options;
    options.timeout_ms = config.http_timeout_ms;
    options.connect_timeout_ms = config.connect_timeout_ms;
    options.verify_ssl = config.verify_ssl;
    options.user_agent = config.user_agent;
    return options;
}

DispatcherOptions dispatcher_options(const EngineConfig& config) {
    DispatcherOptions options;
    options.endpoint_overrides = config.endpoint_overrides;
    options.public_base_url = config.public_base_url;
    options.upload_url_template = config.upload_url_template;
    options.script_timeout = std::chrono::milliseconds(config.script_timeout_ms);
    options.script_memory_limit_bytes = config.script_memory_limit_mb * 1024 * 1024;
    return options;
}

std::shared_ptr<HttpTransport> make_transport(const EngineConfig& config, std::shared_ptr<HttpTransport> given) {
    if (given) return given;
    return std::make_shared<CurlHttpTransport>(http_options(config));
}

std::shared_ptr<ScriptSandbox> make_sandbox(std::shared_ptr<ScriptSandbox> given) {
    if (given) return given;
    return std::make_shared<QuickJSSandbox>();
}

} // namespace

void seed_default_configs(Pipeline& pipeline, NodeDefinitionRegistry& registry) {
    for (auto& node : pipeline.nodes) {
        Value config;
        try {
            config = registry.get_default_node_config(node.type);
        } catch (const PipeflowError& e) {
            // The node fails on its own when it runs
            std::cerr << "[WARNING] Node " << node.id << ": " << e.what() << std::endl;
            continue;
        }
        if (node.config.is_object()) {
            config.update(node.config);
        }
        node.config = std::move(config);
    }
}

PipelineEngine::PipelineEngine(Pipeline pipeline, EngineConfig config, EngineDependencies deps)
    : config_(std::move(config)),
      store_(Pipeline{}, config_.history_limit),
      transport_(make_transport(config_, std::move(deps.transport))),
      sandbox_(make_sandbox(std::move(deps.sandbox))),
      api_client_(std::move(deps.api_client)),
      dispatcher_(registry_, transport_, sandbox_, dispatcher_options(config_)),
      coordinator_(store_, dispatcher_, registry_, &events_) {
    for (const auto& dir : config_.definitions_dirs) {
        registry_.add_search_directory(dir);
    }
    if (!api_client_ && !config_.api_base_url.empty()) {
        api_client_ = std::make_shared<CurlApiClient>(config_.api_base_url, transport_);
    }

    seed_default_configs(pipeline, registry_);
    std::cout << "[INFO] Pipeline loaded: " << pipeline.name << " (" << pipeline.nodes.size()
              << " nodes, " << pipeline.edges.size() << " edges)" << std::endl;
    store_.set_pipeline(std::move(pipeline));
}

std::unique_ptr<PipelineEngine> PipelineEngine::from_document(const Value& document, EngineConfig config,
                                                              EngineDependencies deps) {
    Pipeline pipeline;
    try {
        // Accept either a bare pipeline or a saved store snapshot
        const Value& source = document.contains("pipeline") ? document["pipeline"] : document;
        pipeline = source.get<Pipeline>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Malformed pipeline document: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(std::string("Malformed pipeline document: ") + e.what());
    }
    return std::make_unique<PipelineEngine>(std::move(pipeline), std::move(config), std::move(deps));
}

std::unique_ptr<PipelineEngine> PipelineEngine::from_file(const std::string& file_path, EngineConfig config,
                                                          EngineDependencies deps) {
    Value document;
    try {
        document = load_document(file_path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError("Cannot load pipeline '" + file_path + "': " + e.what());
    }
    return from_document(document, std::move(config), std::move(deps));
}

Execution PipelineEngine::run() {
    Execution execution = coordinator_.run(api_client_.get());
    persist_if_configured();
    return execution;
}

Execution PipelineEngine::run_single_node(const NodeId& node_id) {
    Execution execution = coordinator_.run_single_node(node_id, api_client_.get());
    persist_if_configured();
    return execution;
}

ValidationReport PipelineEngine::validate() const {
    return coordinator_.validate();
}

std::string PipelineEngine::state_path(const std::string& path) const {
    std::string resolved = path.empty() ? config_.state_file : path;
    if (resolved.empty()) {
        throw ConfigurationError("No state file configured");
    }
    return resolved;
}

void PipelineEngine::save_state(const std::string& path) const {
    const std::string target = state_path(path);
    store_.save_to_file(target);
    std::cout << "[INFO] State saved to " << target << std::endl;
}

void PipelineEngine::load_state(const std::string& path) {
    const std::string source = state_path(path);
    store_.load_from_file(source);
    std::cout << "[INFO] State loaded from " << source << std::endl;
}

void PipelineEngine::persist_if_configured() const {
    if (!config_.state_file.empty()) {
        save_state(config_.state_file);
    }
}

} // namespace pipeflow
