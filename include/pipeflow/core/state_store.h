// pipeflow/core/state_store.h
#ifndef PIPEFLOW_CORE_STATE_STORE_H
#define PIPEFLOW_CORE_STATE_STORE_H

#include "pipeflow/core/pipeline.h"
#include "common/types.h"
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pipeflow {

struct StoreSnapshot {
    Pipeline pipeline;
    std::optional<Execution> current_execution;
    std::vector<Execution> history; // newest first
};

void to_json(Value& j, const StoreSnapshot& snapshot);
void from_json(const Value& j, StoreSnapshot& snapshot);

/**
 * ExecutionStateStore: pipeline graph, current execution and run history.
 * Mutated by the coordinator; readers get copies.
 */
class ExecutionStateStore {
public:
    static constexpr size_t kDefaultHistoryLimit = 50;

    explicit ExecutionStateStore(Pipeline pipeline = {}, size_t history_limit = kDefaultHistoryLimit);

    Pipeline pipeline() const;
    std::optional<Execution> current_execution() const;
    std::vector<Execution> history() const;
    std::optional<PipelineNode> node(const NodeId& node_id) const;

    StoreSnapshot snapshot() const;
    void restore(StoreSnapshot snapshot);

    void set_pipeline(Pipeline pipeline);
    void set_pipeline_status(PipelineStatus status);

    // Replaces the current execution; the previous one stays in history only
    void begin_execution(Execution execution);

    // Stamps completion; current stays readable as completed, a copy goes to history
    // (stopped when cancelled) and history is capped
    void finalize_execution(bool cancelled);

    void add_execution_log(ExecutionLogEntry entry);
    void update_execution_log(const NodeId& node_id, const ExecutionLogPatch& patch);

    // Lifecycle-checked transition; keeps the node's log entry in sync. Throws ValidationError
    // for transitions outside idle/pending -> running -> completed|success|error (error -> pending re-arms).
    void update_node_status(const NodeId& node_id, NodeStatus status,
                            const std::optional<std::string>& error = std::nullopt);

    // Unchecked partial update
    void update_node(const NodeId& node_id, const NodePatch& patch);

    void save_to_file(const std::string& path) const;
    void load_from_file(const std::string& path);

    size_t history_limit() const { return history_limit_; }

private:
    PipelineNode& node_ref(const NodeId& node_id);
    static bool transition_allowed(NodeStatus from, NodeStatus to);

    mutable std::mutex mutex_;
    Pipeline pipeline_;
    std::optional<Execution> current_;
    std::vector<Execution> history_;
    size_t history_limit_;
};

} // namespace pipeflow

#endif // PIPEFLOW_CORE_STATE_STORE_H
