// pipeflow/core/errors.h
#ifndef PIPEFLOW_CORE_ERRORS_H
#define PIPEFLOW_CORE_ERRORS_H

#include "common/types.h"
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pipeflow {

// Base of every node-scoped failure. Request/response envelopes ride along so the
// coordinator can put them into the execution log.
class PipeflowError : public std::runtime_error {
public:
    explicit PipeflowError(const std::string& message) : std::runtime_error(message) {}

    const std::optional<Value>& request() const { return request_; }
    const std::optional<Value>& response() const { return response_; }

    void attach_request(Value request) { request_ = std::move(request); }
    void attach_response(Value response) { response_ = std::move(response); }

private:
    std::optional<Value> request_;
    std::optional<Value> response_;
};

// Unknown execution type, missing endpoint, broken definition document
class ConfigurationError : public PipeflowError {
public:
    using PipeflowError::PipeflowError;
};

// Unknown node type or node id
class NotFoundError : public PipeflowError {
public:
    using PipeflowError::PipeflowError;
};

// Missing required input handle or schema field
class ValidationError : public PipeflowError {
public:
    using PipeflowError::PipeflowError;
};

// Pipeline graph contains a dependency cycle
class CycleError : public ValidationError {
public:
    CycleError(const std::string& message, std::vector<NodeId> cyclic_nodes)
        : ValidationError(message), cyclic_nodes_(std::move(cyclic_nodes)) {}

    const std::vector<NodeId>& cyclic_nodes() const { return cyclic_nodes_; }

private:
    std::vector<NodeId> cyclic_nodes_;
};

// Non-2xx response; the response envelope is always attached
class HttpError : public PipeflowError {
public:
    HttpError(const std::string& message, int status) : PipeflowError(message), status_(status) {}
    int status() const { return status_; }

private:
    int status_;
};

// Connection failure, DNS error, timeout: no HTTP status was received
class NetworkError : public PipeflowError {
public:
    using PipeflowError::PipeflowError;
};

// Exception raised inside an isolated script (or the script timed out)
class ScriptExecutionError : public PipeflowError {
public:
    using PipeflowError::PipeflowError;
};

} // namespace pipeflow

#endif // PIPEFLOW_CORE_ERRORS_H
