// pipeflow/script/sandbox.h
#ifndef PIPEFLOW_SCRIPT_SANDBOX_H
#define PIPEFLOW_SCRIPT_SANDBOX_H

#include "common/types.h"
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace pipeflow {

// level is "log", "warn" or "error"
using ScriptLogSink = std::function<void(const std::string& level, const std::string& message)>;

struct ScriptScope {
    Value input = Value::object();
    Value config = Value::object();
    Value node = Value::object(); // {id, type, label, status}
    ScriptLogSink log;
    std::chrono::milliseconds timeout{5000};
    size_t memory_limit_bytes = 64 * 1024 * 1024;
};

/**
 * ScriptSandbox: runs a user snippet as a function body. Only input, config, node,
 * console, Date and JSON are visible to it.
 */
class ScriptSandbox {
public:
    virtual ~ScriptSandbox() = default;

    // nullopt when the script returns undefined. Throws ScriptExecutionError.
    virtual std::optional<Value> run(const std::string& code, const ScriptScope& scope) = 0;
};

// QuickJS interpreter, one fresh runtime per run, no std/os modules
class QuickJSSandbox : public ScriptSandbox {
public:
    std::optional<Value> run(const std::string& code, const ScriptScope& scope) override;
};

} // namespace pipeflow

#endif // PIPEFLOW_SCRIPT_SANDBOX_H
