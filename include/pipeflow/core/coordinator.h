// pipeflow/core/coordinator.h
#ifndef PIPEFLOW_CORE_COORDINATOR_H
#define PIPEFLOW_CORE_COORDINATOR_H

#include "pipeflow/core/events.h"
#include "pipeflow/core/executor.h"
#include "pipeflow/core/state_store.h"
#include "pipeflow/library/loader.h"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pipeflow {

struct ValidationReport {
    std::vector<std::string> errors;                          // graph-level problems
    std::map<NodeId, std::vector<std::string>> node_errors;   // per-node problems

    bool valid() const { return errors.empty() && node_errors.empty(); }
    Value to_json() const;
};

/**
 * ExecutionCoordinator: drives a run over the store's pipeline in topological order,
 * one node at a time. A failing node is recorded and the run moves on.
 */
class ExecutionCoordinator {
public:
    ExecutionCoordinator(ExecutionStateStore& store,
                         ExecutionDispatcher& dispatcher,
                         NodeDefinitionRegistry& registry,
                         EventBus* events = nullptr);

    // Throws CycleError / ValidationError before anything in the store changes
    Execution run(ApiClient* api_client);

    // Executes one node against the current upstream results, in its own execution
    Execution run_single_node(const NodeId& node_id, ApiClient* api_client);

    ValidationReport validate() const;
    ValidationReport validate(const Pipeline& pipeline) const;

    // Stops the run before the next node starts; the node in flight finishes
    void cancel() { cancel_requested_.store(true); }
    bool cancel_requested() const { return cancel_requested_.load(); }

private:
    void execute_in_run(const NodeId& node_id, ApiClient* api_client);
    void record_failure(const NodeId& node_id, const std::string& message,
                        const std::optional<Value>& request, const std::optional<Value>& response,
                        const Value& input);
    void reconcile_statuses();
    void emit(PipelineEvent event);

    static Execution new_execution();

    ExecutionStateStore& store_;
    ExecutionDispatcher& dispatcher_;
    NodeDefinitionRegistry& registry_;
    EventBus* events_;
    std::atomic<bool> cancel_requested_{false};
};

} // namespace pipeflow

#endif // PIPEFLOW_CORE_COORDINATOR_H
