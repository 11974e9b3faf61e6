// src/common/types.cpp
#include "common/types.h"
#include <stdexcept>

namespace pipeflow {

std::string to_string(NodeStatus status) {
    switch (status) {
        case NodeStatus::IDLE:      return "idle";
        case NodeStatus::PENDING:   return "pending";
        case NodeStatus::RUNNING:   return "running";
        case NodeStatus::COMPLETED: return "completed";
        case NodeStatus::SUCCESS:   return "success";
        case NodeStatus::ERROR:     return "error";
    }
    return "idle";
}

std::string to_string(PipelineStatus status) {
    switch (status) {
        case PipelineStatus::DRAFT:     return "draft";
        case PipelineStatus::RUNNING:   return "running";
        case PipelineStatus::COMPLETED: return "completed";
        case PipelineStatus::FAILED:    return "failed";
    }
    return "draft";
}

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::QUEUED:    return "queued";
        case ExecutionStatus::RUNNING:   return "running";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::STOPPED:   return "stopped";
    }
    return "queued";
}

NodeStatus parse_node_status(std::string_view text) {
    if (text == "idle") return NodeStatus::IDLE;
    if (text == "pending") return NodeStatus::PENDING;
    if (text == "running") return NodeStatus::RUNNING;
    if (text == "completed") return NodeStatus::COMPLETED;
    if (text == "success") return NodeStatus::SUCCESS;
    if (text == "error") return NodeStatus::ERROR;
    throw std::runtime_error("Unknown node status '" + std::string(text) + "'");
}

PipelineStatus parse_pipeline_status(std::string_view text) {
    if (text == "draft") return PipelineStatus::DRAFT;
    if (text == "running") return PipelineStatus::RUNNING;
    if (text == "completed") return PipelineStatus::COMPLETED;
    if (text == "failed") return PipelineStatus::FAILED;
    throw std::runtime_error("Unknown pipeline status '" + std::string(text) + "'");
}

ExecutionStatus parse_execution_status(std::string_view text) {
    if (text == "queued") return ExecutionStatus::QUEUED;
    if (text == "running") return ExecutionStatus::RUNNING;
    if (text == "completed") return ExecutionStatus::COMPLETED;
    if (text == "stopped") return ExecutionStatus::STOPPED;
    throw std::runtime_error("Unknown execution status '" + std::string(text) + "'");
}

} // namespace pipeflow
