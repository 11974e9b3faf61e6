// src/core/state_store.cpp
#include "pipeflow/core/state_store.h"
#include "pipeflow/core/errors.h"
#include "common/utils.h"
#include <fstream>

namespace pipeflow {

void to_json(Value& j, const StoreSnapshot& snapshot) {
    j = Value{
        {"pipeline", snapshot.pipeline},
        {"currentExecution", snapshot.current_execution ? Value(*snapshot.current_execution) : Value()},
        {"executionHistory", snapshot.history}
    };
}

void from_json(const Value& j, StoreSnapshot& snapshot) {
    snapshot.pipeline = j.at("pipeline").get<Pipeline>();
    snapshot.current_execution.reset();
    if (j.contains("currentExecution") && !j["currentExecution"].is_null()) {
        snapshot.current_execution = j["currentExecution"].get<Execution>();
    }
    snapshot.history = j.value("executionHistory", std::vector<Execution>{});
}

ExecutionStateStore::ExecutionStateStore(Pipeline pipeline, size_t history_limit)
    : pipeline_(std::move(pipeline)), history_limit_(history_limit) {}

Pipeline ExecutionStateStore::pipeline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pipeline_;
}

std::optional<Execution> ExecutionStateStore::current_execution() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

std::vector<Execution> ExecutionStateStore::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

std::optional<PipelineNode> ExecutionStateStore::node(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const PipelineNode* found = pipeline_.find_node(node_id);
    if (found == nullptr) return std::nullopt;
    return *found;
}

StoreSnapshot ExecutionStateStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return StoreSnapshot{pipeline_, current_, history_};
}

void ExecutionStateStore::restore(StoreSnapshot snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    pipeline_ = std::move(snapshot.pipeline);
    current_ = std::move(snapshot.current_execution);
    history_ = std::move(snapshot.history);
    if (history_.size() > history_limit_) {
        history_.resize(history_limit_);
    }
}

void ExecutionStateStore::set_pipeline(Pipeline pipeline) {
    std::lock_guard<std::mutex> lock(mutex_);
    pipeline_ = std::move(pipeline);
}

void ExecutionStateStore::set_pipeline_status(PipelineStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    pipeline_.status = status;
}

void ExecutionStateStore::begin_execution(Execution execution) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(execution);
}

void ExecutionStateStore::finalize_execution(bool cancelled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        throw NotFoundError("No execution in progress");
    }
    current_->completed_at = Clock::now();
    current_->status = ExecutionStatus::COMPLETED;

    Execution archived = *current_;
    archived.status = cancelled ? ExecutionStatus::STOPPED : ExecutionStatus::COMPLETED;
    history_.insert(history_.begin(), std::move(archived));
    if (history_.size() > history_limit_) {
        history_.resize(history_limit_);
    }
}

void ExecutionStateStore::add_execution_log(ExecutionLogEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        throw NotFoundError("No execution in progress");
    }
    if (entry.started_at == TimePoint{}) {
        entry.started_at = Clock::now();
    }
    current_->logs.push_back(std::move(entry));
}

void ExecutionStateStore::update_execution_log(const NodeId& node_id, const ExecutionLogPatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_) {
        throw NotFoundError("No execution in progress");
    }
    ExecutionLogEntry* log = current_->find_log(node_id);
    if (log == nullptr) {
        throw NotFoundError("No execution log for node: " + node_id);
    }
    if (patch.status) log->status = *patch.status;
    if (patch.completed_at) log->completed_at = patch.completed_at;
    if (patch.duration_ms) log->duration_ms = patch.duration_ms;
    if (patch.input) log->input = *patch.input;
    if (patch.output) log->output = *patch.output;
    if (patch.request) log->request = patch.request;
    if (patch.response) log->response = patch.response;
    if (patch.error) log->error = patch.error;
}

bool ExecutionStateStore::transition_allowed(NodeStatus from, NodeStatus to) {
    if (from == to) return true;
    switch (from) {
        case NodeStatus::IDLE:
            return to == NodeStatus::PENDING || to == NodeStatus::RUNNING;
        case NodeStatus::PENDING:
            return to == NodeStatus::RUNNING || to == NodeStatus::IDLE;
        case NodeStatus::RUNNING:
            return to == NodeStatus::COMPLETED || to == NodeStatus::SUCCESS || to == NodeStatus::ERROR;
        case NodeStatus::ERROR:
            return to == NodeStatus::PENDING || to == NodeStatus::IDLE;
        case NodeStatus::COMPLETED:
        case NodeStatus::SUCCESS:
            return false;
    }
    return false;
}

void ExecutionStateStore::update_node_status(const NodeId& node_id, NodeStatus status,
                                             const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    PipelineNode& target = node_ref(node_id);
    if (!transition_allowed(target.status, status)) {
        throw ValidationError("Invalid status transition for node " + node_id + ": " +
                              to_string(target.status) + " -> " + to_string(status));
    }

    target.status = status;
    if (error) {
        target.error = error;
    } else if (status == NodeStatus::PENDING || status == NodeStatus::RUNNING) {
        target.error.reset();
    }

    if (!current_) return;

    const TimePoint now = Clock::now();
    ExecutionLogEntry* log = current_->find_log(node_id);
    if (status == NodeStatus::RUNNING && log == nullptr) {
        ExecutionLogEntry entry;
        entry.node_id = target.id;
        entry.node_label = target.label;
        entry.node_type = target.type;
        entry.status = NodeStatus::RUNNING;
        entry.started_at = now;
        current_->logs.push_back(std::move(entry));
    } else if (log != nullptr) {
        log->status = status;
        if (error) log->error = error;
        if (!is_done(status) && status != NodeStatus::ERROR) return;
        log->completed_at = now;
        log->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - log->started_at).count();
    }
}

void ExecutionStateStore::update_node(const NodeId& node_id, const NodePatch& patch) {
    std::lock_guard<std::mutex> lock(mutex_);
    PipelineNode& target = node_ref(node_id);
    if (patch.status) target.status = *patch.status;
    if (patch.result_metadata) target.result_metadata = patch.result_metadata;
    if (patch.error) target.error = patch.error;
    if (patch.config) target.config = *patch.config;
    if (patch.label) target.label = *patch.label;
}

PipelineNode& ExecutionStateStore::node_ref(const NodeId& node_id) {
    PipelineNode* found = pipeline_.find_node(node_id);
    if (found == nullptr) {
        throw NotFoundError("Unknown node id: " + node_id);
    }
    return *found;
}

void ExecutionStateStore::save_to_file(const std::string& path) const {
    Value doc = snapshot();
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ConfigurationError("Cannot write state file: " + path);
    }
    out << doc.dump(2);
    if (!out) {
        throw ConfigurationError("Failed writing state file: " + path);
    }
}

void ExecutionStateStore::load_from_file(const std::string& path) {
    Value doc;
    try {
        doc = load_document(path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(std::string("Cannot load state: ") + e.what());
    }
    StoreSnapshot loaded;
    try {
        loaded = doc.get<StoreSnapshot>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed state file '" + path + "': " + e.what());
    } catch (const std::runtime_error& e) {
        throw ConfigurationError("Malformed state file '" + path + "': " + e.what());
    }
    restore(std::move(loaded));
}

} // namespace pipeflow
