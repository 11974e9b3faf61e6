// src/core/events.cpp
#include "pipeflow/core/events.h"
#include <iostream>

namespace pipeflow {

std::string to_string(PipelineEventType type) {
    switch (type) {
        case PipelineEventType::RUN_STARTED:    return "run-started";
        case PipelineEventType::NODE_COMPLETED: return "node-completed";
        case PipelineEventType::RUN_COMPLETED:  return "run-completed";
    }
    return "unknown";
}

Value PipelineEvent::to_json() const {
    Value j = {{"type", to_string(type)}, {"pipelineId", pipeline_id}};
    if (node_id) j["nodeId"] = *node_id;
    if (status) j["status"] = *status;
    if (nodes) j["nodes"] = *nodes;
    return j;
}

EventBus::SubscriptionId EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

void EventBus::emit(const PipelineEvent& event) {
    // Copy so handlers can (un)subscribe while being called
    std::map<SubscriptionId, Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& [id, handler] : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Event handler " << id << " failed on " << to_string(event.type)
                      << ": " << e.what() << std::endl;
        }
    }
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

} // namespace pipeflow
