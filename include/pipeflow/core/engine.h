// pipeflow/core/engine.h
#ifndef PIPEFLOW_CORE_ENGINE_H
#define PIPEFLOW_CORE_ENGINE_H

#include "pipeflow/core/config.h"
#include "pipeflow/core/coordinator.h"
#include "pipeflow/core/events.h"
#include "pipeflow/core/executor.h"
#include "pipeflow/core/state_store.h"
#include "pipeflow/http/http_client.h"
#include "pipeflow/library/loader.h"
#include "pipeflow/script/sandbox.h"
#include <memory>
#include <string>

namespace pipeflow {

// Collaborators left null are built from the config (libcurl, QuickJS)
struct EngineDependencies {
    std::shared_ptr<HttpTransport> transport;
    std::shared_ptr<ScriptSandbox> sandbox;
    std::shared_ptr<ApiClient> api_client;
};

class PipelineEngine {
public:
    // Pipeline document in JSON or YAML
    static std::unique_ptr<PipelineEngine> from_file(const std::string& file_path,
                                                     EngineConfig config = load_engine_config(),
                                                     EngineDependencies deps = {});
    static std::unique_ptr<PipelineEngine> from_document(const Value& document,
                                                         EngineConfig config = load_engine_config(),
                                                         EngineDependencies deps = {});

    explicit PipelineEngine(Pipeline pipeline, EngineConfig config = {}, EngineDependencies deps = {});

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    Execution run();
    Execution run_single_node(const NodeId& node_id);
    ValidationReport validate() const;
    void cancel() { coordinator_.cancel(); }

    EventBus& events() { return events_; }
    NodeDefinitionRegistry& registry() { return registry_; }
    ExecutionStateStore& store() { return store_; }
    const EngineConfig& config() const { return config_; }
    ApiClient* api_client() { return api_client_.get(); }

    // Empty path falls back to config().state_file
    void save_state(const std::string& path = "") const;
    void load_state(const std::string& path = "");

private:
    std::string state_path(const std::string& path) const;
    void persist_if_configured() const;

    EngineConfig config_;
    NodeDefinitionRegistry registry_;
    ExecutionStateStore store_;
    EventBus events_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<ScriptSandbox> sandbox_;
    std::shared_ptr<ApiClient> api_client_;
    ExecutionDispatcher dispatcher_;
    ExecutionCoordinator coordinator_;
};

// Fills each node's missing config keys from its type's defaultConfig
void seed_default_configs(Pipeline& pipeline, NodeDefinitionRegistry& registry);

} // namespace pipeflow

#endif // PIPEFLOW_CORE_ENGINE_H
