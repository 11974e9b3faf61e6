// src/core/data_flow.cpp
#include "pipeflow/core/data_flow.h"
#include "pipeflow/core/errors.h"

namespace pipeflow {

namespace {

const Value* member(const Value& obj, const std::string& key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

bool is_tagged(const Value* candidate, const std::string& data_type) {
    return candidate != nullptr && candidate->is_object() &&
           candidate->contains("type") && (*candidate)["type"] == data_type;
}

} // namespace

const Edge* DataFlowResolver::find_incoming_edge(const NodeId& node_id, const std::string& handle_id,
                                                 const Pipeline& pipeline) {
    const Edge* wildcard = nullptr;
    for (const auto& edge : pipeline.edges) {
        if (edge.target != node_id) continue;
        if (edge.target_handle.has_value()) {
            if (*edge.target_handle == handle_id) return &edge;
        } else if (wildcard == nullptr) {
            wildcard = &edge;
        }
    }
    return wildcard;
}

Value DataFlowResolver::project(const Value& meta, const std::optional<std::string>& data_type) {
    if (meta.is_null()) return nullptr;
    if (!meta.is_object()) return meta;

    if (!data_type.has_value()) {
        for (const char* key : {"output_file", "sequence", "message", "data"}) {
            if (const Value* v = member(meta, key)) return *v;
        }
        return meta.empty() ? Value() : meta;
    }

    const std::string& type = *data_type;
    if (type == "any") {
        return meta.empty() ? Value() : meta;
    }

    // 1. tagged descriptor
    for (const char* key : {"file_info", "output_file"}) {
        const Value* v = member(meta, key);
        if (is_tagged(v, type)) return *v;
    }
    for (auto it = meta.begin(); it != meta.end(); ++it) {
        if (is_tagged(&it.value(), type)) return it.value();
    }

    // 2. conventional field
    if (type == "pdb_file") {
        if (const Value* v = member(meta, "output_file")) return *v;
        if (const Value* v = member(meta, "file_info")) return *v;
    }
    if (const Value* v = member(meta, type)) return *v;

    return nullptr;
}

Value DataFlowResolver::get_input_data(const NodeId& node_id, const std::string& handle_id,
                                       const HandleDefinition& handle, const Pipeline& pipeline) {
    const Edge* edge = find_incoming_edge(node_id, handle_id, pipeline);
    if (edge == nullptr) return nullptr;

    const PipelineNode* source = pipeline.find_node(edge->source);
    if (source == nullptr || !source->result_metadata.has_value()) return nullptr;

    return project(*source->result_metadata, handle.data_type);
}

Value DataFlowResolver::get_all_input_data(const PipelineNode& node, const NodeDefinition& definition,
                                           const Pipeline& pipeline) {
    Value inputs = Value::object();
    for (const auto& handle : definition.inputs) {
        Value data = get_input_data(node.id, handle.id, handle, pipeline);
        if (!data.is_null()) {
            inputs[handle.id] = std::move(data);
        }
    }
    return inputs;
}

std::vector<std::string> DataFlowResolver::missing_inputs(const NodeDefinition& definition, const Value& inputs) {
    std::vector<std::string> missing;
    if (definition.execution.inputs_optional) return missing;
    for (const auto& handle : definition.inputs) {
        if (!handle.data_type.has_value()) continue;
        if (!inputs.is_object() || !inputs.contains(handle.id) || inputs[handle.id].is_null()) {
            missing.push_back(handle.id);
        }
    }
    return missing;
}

void DataFlowResolver::validate_inputs(const PipelineNode& node, const NodeDefinition& definition,
                                       const Value& inputs) {
    auto missing = missing_inputs(definition, inputs);
    if (missing.empty()) return;

    const std::string& handle_id = missing.front();
    std::string data_type;
    for (const auto& handle : definition.inputs) {
        if (handle.id == handle_id) data_type = handle.data_type.value_or("");
    }
    throw ValidationError("Missing required input '" + handle_id + "' (" + data_type + ") for node " +
                          node.label + " (" + node.id + ")");
}

} // namespace pipeflow
