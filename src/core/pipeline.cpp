// src/core/pipeline.cpp
#include "pipeflow/core/pipeline.h"
#include "common/utils.h"
#include <unordered_set>

namespace pipeflow {

namespace {

template <typename T>
void put_optional(Value& j, const char* key, const std::optional<T>& field) {
    if (field.has_value()) {
        j[key] = *field;
    }
}

std::optional<std::string> optional_string(const Value& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<TimePoint> optional_time(const Value& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return parse_iso8601(j[key].get<std::string>());
    }
    return std::nullopt;
}

} // namespace

PipelineNode* Pipeline::find_node(const NodeId& node_id) {
    for (auto& node : nodes) {
        if (node.id == node_id) return &node;
    }
    return nullptr;
}

const PipelineNode* Pipeline::find_node(const NodeId& node_id) const {
    for (const auto& node : nodes) {
        if (node.id == node_id) return &node;
    }
    return nullptr;
}

std::vector<std::string> Pipeline::validate_structure() const {
    std::vector<std::string> problems;
    std::unordered_set<NodeId> ids;
    for (const auto& node : nodes) {
        if (node.id.empty()) {
            problems.push_back("Node with empty id");
        } else if (!ids.insert(node.id).second) {
            problems.push_back("Duplicate node id: " + node.id);
        }
    }
    for (const auto& edge : edges) {
        if (ids.count(edge.source) == 0) {
            problems.push_back("Edge " + edge.id + " references unknown source node: " + edge.source);
        }
        if (ids.count(edge.target) == 0) {
            problems.push_back("Edge " + edge.id + " references unknown target node: " + edge.target);
        }
    }
    return problems;
}

ExecutionLogEntry* Execution::find_log(const NodeId& node_id) {
    // Latest entry wins when a node appears more than once
    for (auto it = logs.rbegin(); it != logs.rend(); ++it) {
        if (it->node_id == node_id) return &*it;
    }
    return nullptr;
}

void to_json(Value& j, const PipelineNode& node) {
    j = Value{
        {"id", node.id},
        {"type", node.type},
        {"label", node.label},
        {"config", node.config},
        {"status", to_string(node.status)}
    };
    put_optional(j, "result_metadata", node.result_metadata);
    put_optional(j, "error", node.error);
}

void from_json(const Value& j, PipelineNode& node) {
    node.id = j.at("id").get<std::string>();
    node.type = j.at("type").get<std::string>();
    node.label = j.value("label", node.type);
    node.config = j.value("config", Value::object());
    node.status = parse_node_status(j.value("status", "idle"));
    node.result_metadata.reset();
    if (j.contains("result_metadata") && !j["result_metadata"].is_null()) {
        node.result_metadata = j["result_metadata"];
    }
    node.error = optional_string(j, "error");
}

void to_json(Value& j, const Edge& edge) {
    j = Value{
        {"id", edge.id},
        {"source", edge.source},
        {"target", edge.target}
    };
    put_optional(j, "sourceHandle", edge.source_handle);
    put_optional(j, "targetHandle", edge.target_handle);
}

void from_json(const Value& j, Edge& edge) {
    edge.source = j.at("source").get<std::string>();
    edge.target = j.at("target").get<std::string>();
    edge.id = j.value("id", edge.source + "-" + edge.target);
    edge.source_handle = optional_string(j, "sourceHandle");
    edge.target_handle = optional_string(j, "targetHandle");
}

void to_json(Value& j, const Pipeline& pipeline) {
    j = Value{
        {"id", pipeline.id},
        {"name", pipeline.name},
        {"nodes", pipeline.nodes},
        {"edges", pipeline.edges},
        {"status", to_string(pipeline.status)}
    };
}

void from_json(const Value& j, Pipeline& pipeline) {
    pipeline.id = j.value("id", "");
    pipeline.name = j.value("name", pipeline.id);
    pipeline.nodes = j.value("nodes", std::vector<PipelineNode>{});
    pipeline.edges = j.value("edges", std::vector<Edge>{});
    pipeline.status = parse_pipeline_status(j.value("status", "draft"));
}

void to_json(Value& j, const ExecutionLogEntry& entry) {
    j = Value{
        {"nodeId", entry.node_id},
        {"nodeLabel", entry.node_label},
        {"nodeType", entry.node_type},
        {"status", to_string(entry.status)},
        {"startedAt", format_iso8601(entry.started_at)},
        {"input", entry.input},
        {"output", entry.output}
    };
    if (entry.completed_at) {
        j["completedAt"] = format_iso8601(*entry.completed_at);
    }
    put_optional(j, "duration", entry.duration_ms);
    put_optional(j, "request", entry.request);
    put_optional(j, "response", entry.response);
    put_optional(j, "error", entry.error);
}

void from_json(const Value& j, ExecutionLogEntry& entry) {
    entry.node_id = j.at("nodeId").get<std::string>();
    entry.node_label = j.value("nodeLabel", "");
    entry.node_type = j.value("nodeType", "");
    entry.status = parse_node_status(j.value("status", "running"));
    entry.started_at = parse_iso8601(j.at("startedAt").get<std::string>());
    entry.completed_at = optional_time(j, "completedAt");
    entry.duration_ms.reset();
    if (j.contains("duration") && j["duration"].is_number()) {
        entry.duration_ms = j["duration"].get<int64_t>();
    }
    entry.input = j.value("input", Value::object());
    entry.output = j.value("output", Value());
    entry.request.reset();
    entry.response.reset();
    if (j.contains("request")) entry.request = j["request"];
    if (j.contains("response")) entry.response = j["response"];
    entry.error = optional_string(j, "error");
}

void to_json(Value& j, const Execution& execution) {
    j = Value{
        {"id", execution.id},
        {"startedAt", format_iso8601(execution.started_at)},
        {"status", to_string(execution.status)},
        {"logs", execution.logs}
    };
    if (execution.completed_at) {
        j["completedAt"] = format_iso8601(*execution.completed_at);
    }
}

void from_json(const Value& j, Execution& execution) {
    execution.id = j.at("id").get<std::string>();
    execution.started_at = parse_iso8601(j.at("startedAt").get<std::string>());
    execution.completed_at = optional_time(j, "completedAt");
    execution.status = parse_execution_status(j.value("status", "queued"));
    execution.logs = j.value("logs", std::vector<ExecutionLogEntry>{});
}

} // namespace pipeflow
