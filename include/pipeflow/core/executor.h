// pipeflow/core/executor.h
#ifndef PIPEFLOW_CORE_EXECUTOR_H
#define PIPEFLOW_CORE_EXECUTOR_H

#include "pipeflow/core/pipeline.h"
#include "pipeflow/library/loader.h"
#include "pipeflow/http/http_client.h"
#include "pipeflow/script/sandbox.h"
#include "common/types.h"
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace pipeflow {

struct ExecutionContext {
    const Pipeline& pipeline;
    ApiClient* api_client = nullptr; // required only for relative endpoints
};

struct ExecutionResult {
    Value data = nullptr;
    Value inputs = Value::object(); // resolved handle inputs the node ran with
    std::optional<Value> request;
    std::optional<Value> response;
};

struct DispatcherOptions {
    // node type -> URL used when the definition's endpoint is empty or relative
    std::map<std::string, std::string> endpoint_overrides;
    std::string public_base_url;
    std::string upload_url_template = "/api/upload/pdb/{file_id}";
    std::chrono::milliseconds script_timeout{5000};
    size_t script_memory_limit_bytes = 64 * 1024 * 1024;
};

/**
 * ExecutionDispatcher: runs one node. The strategy variant of the node's definition picks
 * the handler; inputs are resolved and validated first.
 */
class ExecutionDispatcher {
public:
    ExecutionDispatcher(NodeDefinitionRegistry& registry,
                        std::shared_ptr<HttpTransport> transport,
                        std::shared_ptr<ScriptSandbox> sandbox,
                        DispatcherOptions options = {});

    ExecutionResult execute_node(const PipelineNode& node, const ExecutionContext& context);

    const DispatcherOptions& options() const { return options_; }

private:
    struct NodeCall {
        const PipelineNode& node;
        const NodeDefinition& definition;
        const Value& inputs;
        const ExecutionContext& context;
    };

    ExecutionResult execute_strategy(const ApiCallStrategy& strategy, const NodeCall& call);
    ExecutionResult execute_strategy(const FileCheckStrategy& strategy, const NodeCall& call);
    ExecutionResult execute_strategy(const LogStrategy& strategy, const NodeCall& call);
    ExecutionResult execute_strategy(const CodeExecutionStrategy& strategy, const NodeCall& call);

    std::string sanitize_file_url(const std::string& url, const Value& file_id) const;

    NodeDefinitionRegistry& registry_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<ScriptSandbox> sandbox_;
    DispatcherOptions options_;
};

// Quote bare {{...}} expressions that sit outside JSON string literals so the text parses
std::string repair_json_templates(const std::string& text);

} // namespace pipeflow

#endif // PIPEFLOW_CORE_EXECUTOR_H
