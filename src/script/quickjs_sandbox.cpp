// src/script/quickjs_sandbox.cpp
#include "pipeflow/script/sandbox.h"
#include "pipeflow/core/errors.h"
#include "quickjs.h"
#include <cstring>

namespace pipeflow {

namespace {

struct RunState {
    std::chrono::steady_clock::time_point deadline;
    bool timed_out = false;
    const ScriptLogSink* log = nullptr;
};

int interrupt_handler(JSRuntime*, void* opaque) {
    auto* state = static_cast<RunState*>(opaque);
    if (std::chrono::steady_clock::now() >= state->deadline) {
        state->timed_out = true;
        return 1;
    }
    return 0;
}

// RAII owners for the runtime and context
struct RuntimeHandle {
    JSRuntime* rt = JS_NewRuntime();
    ~RuntimeHandle() { if (rt) JS_FreeRuntime(rt); }
};

struct ContextHandle {
    JSContext* ctx = nullptr;
    explicit ContextHandle(JSRuntime* rt) : ctx(JS_NewContextRaw(rt)) {}
    ~ContextHandle() { if (ctx) JS_FreeContext(ctx); }
};

std::string take_cstring(JSContext* ctx, JSValueConst val) {
    const char* str = JS_ToCString(ctx, val);
    if (str == nullptr) return "";
    std::string out(str);
    JS_FreeCString(ctx, str);
    return out;
}

// Objects are shown as JSON, everything else via ToString
std::string js_to_text(JSContext* ctx, JSValueConst val) {
    if (JS_IsObject(val) && !JS_IsFunction(ctx, val)) {
        JSValue json = JS_JSONStringify(ctx, val, JS_UNDEFINED, JS_UNDEFINED);
        if (!JS_IsException(json) && !JS_IsUndefined(json)) {
            std::string text = take_cstring(ctx, json);
            JS_FreeValue(ctx, json);
            return text;
        }
        JS_FreeValue(ctx, json);
        JS_FreeValue(ctx, JS_GetException(ctx));
    }
    return take_cstring(ctx, val);
}

JSValue console_write(JSContext* ctx, int argc, JSValueConst* argv, const char* level) {
    auto* state = static_cast<RunState*>(JS_GetContextOpaque(ctx));
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) line += " ";
        line += js_to_text(ctx, argv[i]);
    }
    if (state != nullptr && state->log != nullptr && *state->log) {
        (*state->log)(level, line);
    }
    return JS_UNDEFINED;
}

JSValue js_console_log(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return console_write(ctx, argc, argv, "log");
}

JSValue js_console_warn(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return console_write(ctx, argc, argv, "warn");
}

JSValue js_console_error(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return console_write(ctx, argc, argv, "error");
}

JSValue to_js(JSContext* ctx, const Value& value) {
    std::string text = value.dump();
    return JS_ParseJSON(ctx, text.c_str(), text.size(), "<scope>");
}

// Message of a pending exception; Error objects contribute their .message
std::string exception_message(JSContext* ctx) {
    JSValue exception = JS_GetException(ctx);
    std::string message;
    if (JS_IsError(ctx, exception)) {
        JSValue msg = JS_GetPropertyStr(ctx, exception, "message");
        message = take_cstring(ctx, msg);
        JS_FreeValue(ctx, msg);
    }
    if (message.empty()) {
        message = take_cstring(ctx, exception);
    }
    JS_FreeValue(ctx, exception);
    return message;
}

void install_globals(JSContext* ctx, const ScriptScope& scope) {
    JSValue global = JS_GetGlobalObject(ctx);

    JSValue console = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, console, "log", JS_NewCFunction(ctx, js_console_log, "log", 1));
    JS_SetPropertyStr(ctx, console, "warn", JS_NewCFunction(ctx, js_console_warn, "warn", 1));
    JS_SetPropertyStr(ctx, console, "error", JS_NewCFunction(ctx, js_console_error, "error", 1));
    JS_SetPropertyStr(ctx, global, "console", console);

    const std::pair<const char*, const Value*> bindings[] = {
        {"input", &scope.input},
        {"config", &scope.config},
        {"node", &scope.node},
    };
    for (const auto& [name, value] : bindings) {
        JSValue js = to_js(ctx, *value);
        if (JS_IsException(js)) {
            JS_FreeValue(ctx, global);
            throw ScriptExecutionError(std::string("Failed to bind '") + name + "': " + exception_message(ctx));
        }
        JS_SetPropertyStr(ctx, global, name, js);
    }

    JS_FreeValue(ctx, global);
}

} // namespace

std::optional<Value> QuickJSSandbox::run(const std::string& code, const ScriptScope& scope) {
    RuntimeHandle runtime;
    if (runtime.rt == nullptr) {
        throw ScriptExecutionError("Failed to create script runtime");
    }
    JS_SetMemoryLimit(runtime.rt, scope.memory_limit_bytes);
    JS_SetMaxStackSize(runtime.rt, 1024 * 1024);

    RunState state;
    state.deadline = std::chrono::steady_clock::now() + scope.timeout;
    state.log = &scope.log;
    JS_SetInterruptHandler(runtime.rt, interrupt_handler, &state);

    ContextHandle context(runtime.rt);
    JSContext* ctx = context.ctx;
    if (ctx == nullptr) {
        throw ScriptExecutionError("Failed to create script context");
    }

    // No std/os modules: only the language core plus Date, JSON, RegExp, Map/Set
    JS_AddIntrinsicBaseObjects(ctx);
    JS_AddIntrinsicDate(ctx);
    JS_AddIntrinsicEval(ctx);
    JS_AddIntrinsicJSON(ctx);
    JS_AddIntrinsicRegExp(ctx);
    JS_AddIntrinsicMapSet(ctx);
    JS_SetContextOpaque(ctx, &state);

    install_globals(ctx, scope);

    std::string wrapped = "(function(){\n" + code + "\n})()";
    JSValue result = JS_Eval(ctx, wrapped.c_str(), wrapped.size(), "<code>", JS_EVAL_TYPE_GLOBAL);

    if (JS_IsException(result)) {
        std::string message = exception_message(ctx);
        if (state.timed_out) {
            message = "Script timed out after " + std::to_string(scope.timeout.count()) + " ms";
        }
        throw ScriptExecutionError(message);
    }

    if (JS_IsUndefined(result)) {
        JS_FreeValue(ctx, result);
        return std::nullopt;
    }

    JSValue json = JS_JSONStringify(ctx, result, JS_UNDEFINED, JS_UNDEFINED);
    JS_FreeValue(ctx, result);
    if (JS_IsException(json)) {
        throw ScriptExecutionError("Script result is not serializable: " + exception_message(ctx));
    }
    if (JS_IsUndefined(json)) {
        // functions and symbols have no JSON form
        return std::nullopt;
    }
    std::string text = take_cstring(ctx, json);
    JS_FreeValue(ctx, json);

    Value parsed = Value::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        throw ScriptExecutionError("Script result could not be converted: " + text);
    }
    return parsed;
}

} // namespace pipeflow
