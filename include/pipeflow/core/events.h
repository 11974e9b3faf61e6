// pipeflow/core/events.h
#ifndef PIPEFLOW_CORE_EVENTS_H
#define PIPEFLOW_CORE_EVENTS_H

#include "pipeflow/core/pipeline.h"
#include "common/types.h"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pipeflow {

enum class PipelineEventType : uint8_t {
    RUN_STARTED,
    NODE_COMPLETED,
    RUN_COMPLETED
};

std::string to_string(PipelineEventType type); // "run-started", "node-completed", "run-completed"

struct PipelineEvent {
    PipelineEventType type;
    std::string pipeline_id;
    std::optional<NodeId> node_id;             // node-completed
    std::optional<std::string> status;         // node-completed, run-completed
    std::optional<std::vector<PipelineNode>> nodes; // run-completed

    Value to_json() const;
};

/**
 * EventBus: synchronous fan-out to subscribers. Handlers run on the emitting thread and
 * may unsubscribe themselves or cancel the run.
 */
class EventBus {
public:
    using Handler = std::function<void(const PipelineEvent&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler);
    void unsubscribe(SubscriptionId id);
    void emit(const PipelineEvent& event);

    size_t subscriber_count() const;

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace pipeflow

#endif // PIPEFLOW_CORE_EVENTS_H
