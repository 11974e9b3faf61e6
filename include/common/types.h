#ifndef PIPEFLOW_COMMON_TYPES_H
#define PIPEFLOW_COMMON_TYPES_H

#include <string>
#include <string_view>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace pipeflow {

// nlohmann::json is the single dynamic value type (config, results, envelopes)
using Value = nlohmann::json;

using NodeId = std::string;
using NodeTypeName = std::string; // e.g. "http_request_node"

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class NodeStatus : uint8_t {
    IDLE,
    PENDING,
    RUNNING,
    COMPLETED,
    SUCCESS,
    ERROR
};

enum class PipelineStatus : uint8_t {
    DRAFT,
    RUNNING,
    COMPLETED,
    FAILED
};

// queued -> running -> completed; stopped is only recorded in history for cancelled runs
enum class ExecutionStatus : uint8_t {
    QUEUED,
    RUNNING,
    COMPLETED,
    STOPPED
};

std::string to_string(NodeStatus status);
std::string to_string(PipelineStatus status);
std::string to_string(ExecutionStatus status);

NodeStatus parse_node_status(std::string_view text);
PipelineStatus parse_pipeline_status(std::string_view text);
ExecutionStatus parse_execution_status(std::string_view text);

// completed and success are both terminal "done" states
inline bool is_done(NodeStatus status) {
    return status == NodeStatus::COMPLETED || status == NodeStatus::SUCCESS;
}

} // namespace pipeflow

#endif // PIPEFLOW_COMMON_TYPES_H
