// src/core/coordinator.cpp
#include "pipeflow/core/coordinator.h"
#include "pipeflow/core/data_flow.h"
#include "pipeflow/core/errors.h"
#include "pipeflow/core/result_metadata.h"
#include "pipeflow/scheduler/topo_scheduler.h"
#include "common/utils.h"
#include <iostream>

namespace pipeflow {

namespace {

bool has_result(const PipelineNode& node) {
    return node.result_metadata.has_value() && !node.result_metadata->is_null() &&
           !(node.result_metadata->is_object() && node.result_metadata->empty());
}

// Server-provided explanation buried in an error response body
std::optional<std::string> server_detail(const std::optional<Value>& response) {
    if (!response || !response->is_object() || !response->contains("data")) return std::nullopt;
    const Value& data = (*response)["data"];
    if (!data.is_object()) return std::nullopt;
    for (const char* key : {"error", "detail"}) {
        if (data.contains(key) && data[key].is_string()) return data[key].get<std::string>();
    }
    if (data.contains("data") && data["data"].is_object() && data["data"].contains("detail") &&
        data["data"]["detail"].is_string()) {
        return data["data"]["detail"].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

Value ValidationReport::to_json() const {
    return Value{{"valid", valid()}, {"errors", errors}, {"nodeErrors", node_errors}};
}

ExecutionCoordinator::ExecutionCoordinator(ExecutionStateStore& store,
                                           ExecutionDispatcher& dispatcher,
                                           NodeDefinitionRegistry& registry,
                                           EventBus* events)
    : store_(store), dispatcher_(dispatcher), registry_(registry), events_(events) {}

Execution ExecutionCoordinator::new_execution() {
    Execution execution;
    execution.id = "exec_" + std::to_string(to_epoch_ms(Clock::now()));
    execution.started_at = Clock::now();
    execution.status = ExecutionStatus::QUEUED;
    return execution;
}

void ExecutionCoordinator::emit(PipelineEvent event) {
    if (events_ != nullptr) {
        events_->emit(event);
    }
}

Execution ExecutionCoordinator::run(ApiClient* api_client) {
    const Pipeline pipeline = store_.pipeline();

    auto problems = pipeline.validate_structure();
    if (!problems.empty()) {
        throw ValidationError("Invalid pipeline " + pipeline.id + ": " + problems.front());
    }
    const std::vector<NodeId> order = execution_order(pipeline);

    cancel_requested_.store(false);

    Execution execution = new_execution();
    execution.status = ExecutionStatus::RUNNING;
    store_.begin_execution(execution);
    store_.set_pipeline_status(PipelineStatus::RUNNING);

    // Re-arm everything that has not finished
    for (const auto& node : pipeline.nodes) {
        if (is_done(node.status)) continue;
        if (node.status == NodeStatus::RUNNING) {
            NodePatch patch;
            patch.status = NodeStatus::PENDING;
            store_.update_node(node.id, patch);
        } else {
            store_.update_node_status(node.id, NodeStatus::PENDING);
        }
    }

    std::cout << "[INFO] Starting execution " << execution.id << " of pipeline '" << pipeline.name
              << "' (" << order.size() << " nodes)" << std::endl;
    emit({PipelineEventType::RUN_STARTED, pipeline.id, std::nullopt, std::nullopt, std::nullopt});

    bool cancelled = false;
    for (const auto& node_id : order) {
        if (cancel_requested_.load()) {
            cancelled = true;
            std::cout << "[INFO] Execution " << execution.id << " cancelled before node " << node_id << std::endl;
            break;
        }

        auto current = store_.node(node_id);
        if (!current) continue;
        if (is_done(current->status)) {
            std::cout << "[INFO] Skipping " << node_id << " - already " << to_string(current->status) << std::endl;
            continue;
        }

        execute_in_run(node_id, api_client);
    }

    store_.finalize_execution(cancelled);
    reconcile_statuses();

    const PipelineStatus final_status = cancelled ? PipelineStatus::DRAFT : PipelineStatus::COMPLETED;
    store_.set_pipeline_status(final_status);

    const Pipeline finished = store_.pipeline();
    emit({PipelineEventType::RUN_COMPLETED, finished.id, std::nullopt, to_string(final_status), finished.nodes});

    std::cout << "[INFO] Execution " << execution.id << " finished" << std::endl;
    return *store_.current_execution();
}

Execution ExecutionCoordinator::run_single_node(const NodeId& node_id, ApiClient* api_client) {
    auto target = store_.node(node_id);
    if (!target) {
        throw NotFoundError("Unknown node id: " + node_id);
    }

    cancel_requested_.store(false);

    NodePatch rearm;
    rearm.status = NodeStatus::PENDING;
    store_.update_node(node_id, rearm);

    Execution execution = new_execution();
    execution.status = ExecutionStatus::RUNNING;
    store_.begin_execution(execution);
    store_.set_pipeline_status(PipelineStatus::RUNNING);

    const std::string pipeline_id = store_.pipeline().id;
    emit({PipelineEventType::RUN_STARTED, pipeline_id, std::nullopt, std::nullopt, std::nullopt});

    execute_in_run(node_id, api_client);

    store_.finalize_execution(false);
    reconcile_statuses();
    store_.set_pipeline_status(PipelineStatus::COMPLETED);

    const Pipeline finished = store_.pipeline();
    emit({PipelineEventType::RUN_COMPLETED, finished.id, std::nullopt,
          to_string(PipelineStatus::COMPLETED), finished.nodes});
    return *store_.current_execution();
}

void ExecutionCoordinator::execute_in_run(const NodeId& node_id, ApiClient* api_client) {
    store_.update_node_status(node_id, NodeStatus::RUNNING);
    const auto started = std::chrono::steady_clock::now();

    const Pipeline pipeline = store_.pipeline();
    const PipelineNode& node = *pipeline.find_node(node_id);
    Value input = Value{{"config", node.config}};

    try {
        ExecutionContext context{pipeline, api_client};
        ExecutionResult result = dispatcher_.execute_node(node, context);
        input["inputs"] = result.inputs;

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();

        auto metadata = extract_result_metadata(*registry_.load_node_config(node.type), result.data);
        if (metadata) {
            NodePatch patch;
            patch.result_metadata = std::move(metadata);
            store_.update_node(node_id, patch);
        }
        store_.update_node_status(node_id, NodeStatus::COMPLETED);

        ExecutionLogPatch log;
        log.status = NodeStatus::COMPLETED;
        log.duration_ms = duration;
        log.input = input;
        log.output = result.data;
        log.request = result.request;
        log.response = result.response;
        store_.update_execution_log(node_id, log);

        std::cout << "[INFO] Node " << node_id << " completed successfully (" << duration << " ms)" << std::endl;
    } catch (const PipeflowError& e) {
        record_failure(node_id, e.what(), e.request(), e.response(), input);
    } catch (const std::exception& e) {
        record_failure(node_id, e.what(), std::nullopt, std::nullopt, input);
    }

    auto finished = store_.node(node_id);
    emit({PipelineEventType::NODE_COMPLETED, pipeline.id, node_id,
          finished ? to_string(finished->status) : std::string("error"), std::nullopt});
}

void ExecutionCoordinator::record_failure(const NodeId& node_id, const std::string& message,
                                          const std::optional<Value>& request,
                                          const std::optional<Value>& response,
                                          const Value& input) {
    std::cerr << "[ERROR] Node " << node_id << " failed: " << message << std::endl;
    auto detail = server_detail(response);
    if (detail && *detail != message) {
        std::cerr << "[ERROR] Server Error Message: " << *detail << std::endl;
    }

    store_.update_node_status(node_id, NodeStatus::ERROR, message.empty() ? "Execution failed" : message);

    ExecutionLogPatch log;
    log.status = NodeStatus::ERROR;
    log.error = message.empty() ? "Execution failed" : message;
    log.input = input;
    log.request = request;
    log.response = response;
    store_.update_execution_log(node_id, log);
}

void ExecutionCoordinator::reconcile_statuses() {
    for (const auto& node : store_.pipeline().nodes) {
        NodePatch patch;
        if ((node.status == NodeStatus::IDLE || node.status == NodeStatus::PENDING) && has_result(node)) {
            patch.status = NodeStatus::COMPLETED;
        } else if (node.status == NodeStatus::RUNNING) {
            if (has_result(node)) {
                patch.status = NodeStatus::COMPLETED;
            } else {
                patch.status = NodeStatus::ERROR;
                if (!node.error) patch.error = "Execution did not finish";
            }
        }
        if (patch.status) {
            std::cerr << "[WARNING] Reconciling node " << node.id << ": " << to_string(node.status)
                      << " -> " << to_string(*patch.status) << std::endl;
            store_.update_node(node.id, patch);
        }
    }
}

ValidationReport ExecutionCoordinator::validate() const {
    return validate(store_.pipeline());
}

ValidationReport ExecutionCoordinator::validate(const Pipeline& pipeline) const {
    ValidationReport report;
    report.errors = pipeline.validate_structure();

    auto cyclic = find_cycle_nodes(pipeline.nodes, pipeline.edges);
    if (!cyclic.empty()) {
        std::string listed;
        for (const auto& id : cyclic) {
            if (!listed.empty()) listed += ", ";
            listed += id;
        }
        report.errors.push_back("Pipeline contains a cycle involving nodes: " + listed);
    }

    for (const auto& node : pipeline.nodes) {
        std::vector<std::string> problems;
        NodeDefinitionPtr definition;
        try {
            definition = registry_.load_node_config(node.type);
        } catch (const PipeflowError& e) {
            report.node_errors[node.id].push_back(e.what());
            continue;
        }

        Value inputs = DataFlowResolver::get_all_input_data(node, *definition, pipeline);
        for (const auto& handle_id : DataFlowResolver::missing_inputs(*definition, inputs)) {
            // An upstream node that has not run yet will provide the data
            bool connected = false;
            for (const auto& edge : pipeline.edges) {
                if (edge.target == node.id && (!edge.target_handle || *edge.target_handle == handle_id)) {
                    connected = true;
                }
            }
            if (connected) continue;
            std::string data_type;
            for (const auto& handle : definition->inputs) {
                if (handle.id == handle_id) data_type = handle.data_type.value_or("");
            }
            problems.push_back("Missing required input '" + handle_id + "' (" + data_type + ")");
        }

        for (const auto& [field, schema] : definition->schema) {
            if (!schema.required) continue;
            auto it = node.config.find(field);
            if (it == node.config.end() || !is_truthy(*it)) {
                problems.push_back("Missing required config field: " + field);
            }
        }

        if (!problems.empty()) {
            report.node_errors[node.id] = std::move(problems);
        }
    }
    return report;
}

} // namespace pipeflow
