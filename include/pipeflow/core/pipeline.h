// pipeflow/core/pipeline.h
#ifndef PIPEFLOW_CORE_PIPELINE_H
#define PIPEFLOW_CORE_PIPELINE_H

#include "common/types.h"
#include <optional>
#include <string>
#include <vector>

namespace pipeflow {

struct PipelineNode {
    NodeId id;
    NodeTypeName type;
    std::string label;
    Value config = Value::object();
    NodeStatus status = NodeStatus::IDLE;
    std::optional<Value> result_metadata; // written on success, never cleared implicitly
    std::optional<std::string> error;
};

struct Edge {
    std::string id;
    NodeId source;
    NodeId target;
    std::optional<std::string> source_handle;
    std::optional<std::string> target_handle; // absent: matches any input handle of target
};

struct Pipeline {
    std::string id;
    std::string name;
    std::vector<PipelineNode> nodes;
    std::vector<Edge> edges;
    PipelineStatus status = PipelineStatus::DRAFT;

    PipelineNode* find_node(const NodeId& node_id);
    const PipelineNode* find_node(const NodeId& node_id) const;

    // Unique node ids, edges pointing at existing nodes. Returns the problems found.
    std::vector<std::string> validate_structure() const;
};

struct ExecutionLogEntry {
    NodeId node_id;
    std::string node_label;
    NodeTypeName node_type;
    NodeStatus status = NodeStatus::RUNNING;
    TimePoint started_at{};
    std::optional<TimePoint> completed_at;
    std::optional<int64_t> duration_ms;
    Value input = Value::object();
    Value output = nullptr;
    std::optional<Value> request;
    std::optional<Value> response;
    std::optional<std::string> error;
};

struct Execution {
    std::string id;
    TimePoint started_at{};
    std::optional<TimePoint> completed_at;
    ExecutionStatus status = ExecutionStatus::QUEUED;
    std::vector<ExecutionLogEntry> logs;

    ExecutionLogEntry* find_log(const NodeId& node_id);
};

// Partial updates applied by the store; unset members are left alone
struct NodePatch {
    std::optional<NodeStatus> status;
    std::optional<Value> result_metadata;
    std::optional<std::string> error;
    std::optional<Value> config;
    std::optional<std::string> label;
};

struct ExecutionLogPatch {
    std::optional<NodeStatus> status;
    std::optional<TimePoint> completed_at;
    std::optional<int64_t> duration_ms;
    std::optional<Value> input;
    std::optional<Value> output;
    std::optional<Value> request;
    std::optional<Value> response;
    std::optional<std::string> error;
};

// nlohmann ADL hooks
void to_json(Value& j, const PipelineNode& node);
void from_json(const Value& j, PipelineNode& node);
void to_json(Value& j, const Edge& edge);
void from_json(const Value& j, Edge& edge);
void to_json(Value& j, const Pipeline& pipeline);
void from_json(const Value& j, Pipeline& pipeline);
void to_json(Value& j, const ExecutionLogEntry& entry);
void from_json(const Value& j, ExecutionLogEntry& entry);
void to_json(Value& j, const Execution& execution);
void from_json(const Value& j, Execution& execution);

} // namespace pipeflow

#endif // PIPEFLOW_CORE_PIPELINE_H
