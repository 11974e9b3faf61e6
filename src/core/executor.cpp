// src/core/executor.cpp
#include "pipeflow/core/executor.h"
#include "pipeflow/core/data_flow.h"
#include "pipeflow/core/errors.h"
#include "pipeflow/dsl/templates.h"
#include "common/utils.h"
#include <iostream>

namespace pipeflow {

namespace {

std::string origin_of(const std::string& url) {
    auto scheme = url.find("://");
    if (scheme == std::string::npos) return url;
    auto path = url.find('/', scheme + 3);
    return path == std::string::npos ? url : url.substr(0, path);
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

} // namespace

ExecutionDispatcher::ExecutionDispatcher(NodeDefinitionRegistry& registry,
                                         std::shared_ptr<HttpTransport> transport,
                                         std::shared_ptr<ScriptSandbox> sandbox,
                                         DispatcherOptions options)
    : registry_(registry),
      transport_(std::move(transport)),
      sandbox_(std::move(sandbox)),
      options_(std::move(options)) {}

ExecutionResult ExecutionDispatcher::execute_node(const PipelineNode& node, const ExecutionContext& context) {
    const NodeDefinitionPtr definition_ptr = registry_.load_node_config(node.type);
    const NodeDefinition& definition = *definition_ptr;

    Value inputs = DataFlowResolver::get_all_input_data(node, definition, context.pipeline);
    DataFlowResolver::validate_inputs(node, definition, inputs);

    NodeCall call{node, definition, inputs, context};
    ExecutionResult result = std::visit(
        [this, &call](const auto& strategy) { return execute_strategy(strategy, call); },
        definition.execution.strategy);
    result.inputs = inputs;
    return result;
}

std::string ExecutionDispatcher::sanitize_file_url(const std::string& url, const Value& file_id) const {
    if (url.rfind("blob:", 0) == 0) {
        // Browser-local handles are meaningless to downstream services
        std::string id = value_to_text(file_id);
        if (id.empty() || options_.public_base_url.empty()) {
            std::cerr << "[WARNING] Dropping unusable blob URL for file without id" << std::endl;
            return "";
        }
        return origin_of(options_.public_base_url) + replace_all(options_.upload_url_template, "{file_id}", id);
    }
    if (!url.empty() && url.front() == '/' && !options_.public_base_url.empty()) {
        return origin_of(options_.public_base_url) + url;
    }
    return url;
}

ExecutionResult ExecutionDispatcher::execute_strategy(const FileCheckStrategy& strategy, const NodeCall& call) {
    const Value& config = call.node.config;
    auto it = config.find(strategy.identifying_field);
    if (it == config.end() || !is_truthy(*it)) {
        throw ValidationError("No " + strategy.identifying_field + " specified for input node");
    }

    Value descriptor = {
        {"type", strategy.descriptor_type},
        {strategy.identifying_field, *it}
    };
    for (const char* key : {"file_id", "file_url"}) {
        if (config.contains(key) && !config[key].is_null()) {
            descriptor[key] = config[key];
        }
    }
    if (descriptor.contains("file_url") && descriptor["file_url"].is_string()) {
        descriptor["file_url"] = sanitize_file_url(descriptor["file_url"].get<std::string>(),
                                                   descriptor.value("file_id", Value()));
    }
    for (const auto& field : strategy.carried_fields) {
        if (config.contains(field) && !config[field].is_null()) {
            descriptor[field] = config[field];
        }
    }

    ExecutionResult result;
    result.data = descriptor;
    result.request = Value{{"type", "file_check"}, {strategy.identifying_field, *it}};
    result.response = Value{{"status", 200}, {"statusText", "OK"}, {"data", descriptor}};
    return result;
}

ExecutionResult ExecutionDispatcher::execute_strategy(const LogStrategy& strategy, const NodeCall& call) {
    Value message = strategy.message;
    if (message.is_string() && TemplateResolver::contains_expression(message.get_ref<const std::string&>())) {
        message = TemplateResolver::resolve(message, call.node, call.inputs);
    }
    if (message.is_null()) {
        message = call.node.config.value("message", Value(""));
    }
    if (message.is_null()) {
        message = "";
    }

    std::cout << "[Message Input Node: " << call.node.label << "] " << value_to_text(message) << std::endl;

    ExecutionResult result;
    result.data = Value{{"message", message}, {"loggedAt", format_iso8601(Clock::now())}};
    result.request = Value{{"type", "log"}, {"message", message}};
    result.response = Value{{"status", 200}, {"statusText", "Logged"}, {"data", {{"message", message}}}};
    return result;
}

ExecutionResult ExecutionDispatcher::execute_strategy(const CodeExecutionStrategy& strategy, const NodeCall& call) {
    Value code_value = strategy.code;
    if (code_value.is_string() && TemplateResolver::contains_expression(code_value.get_ref<const std::string&>())) {
        code_value = TemplateResolver::resolve(code_value, call.node, call.inputs);
    }
    std::string code = code_value.is_string() ? code_value.get<std::string>() : "";
    if (trim(code).empty()) {
        auto cfg = call.node.config.find("code");
        code = (cfg != call.node.config.end() && cfg->is_string()) ? cfg->get<std::string>() : "";
    }
    if (trim(code).empty()) {
        throw ConfigurationError("No code provided for code execution node");
    }
    if (!sandbox_) {
        throw ConfigurationError("No script sandbox configured for code execution node");
    }

    const std::string label = call.node.label;
    ScriptScope scope;
    scope.input = call.inputs;
    scope.config = call.node.config.is_null() ? Value::object() : call.node.config;
    scope.node = TemplateResolver::build_context(call.node, call.inputs)["node"];
    scope.timeout = options_.script_timeout;
    scope.memory_limit_bytes = options_.script_memory_limit_bytes;
    scope.log = [label](const std::string& level, const std::string& line) {
        if (level == "log") {
            std::cout << "[Code Execution: " << label << "] " << line << std::endl;
        } else {
            std::cerr << "[Code Execution: " << label << "] " << line << std::endl;
        }
    };

    Value data;
    try {
        auto returned = sandbox_->run(code, scope);
        data = returned.has_value()
            ? *returned
            : Value{{"executed", true}, {"timestamp", format_iso8601(Clock::now())}};
    } catch (const ScriptExecutionError& e) {
        std::cerr << "[Code Execution Error in " << label << "] " << e.what() << std::endl;
        throw ScriptExecutionError(std::string("Code execution failed: ") + e.what());
    }

    std::cout << "[Code Execution: " << label << "] Result: " << data.dump() << std::endl;

    ExecutionResult result;
    result.data = data;
    result.request = Value{
        {"type", "code_execution"},
        {"code", code.size() > 200 ? code.substr(0, 200) + "..." : code}
    };
    result.response = Value{{"status", 200}, {"statusText", "Executed"}, {"data", data}};
    return result;
}

} // namespace pipeflow
