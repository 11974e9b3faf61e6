// src/core/api_call.cpp
#include "pipeflow/core/executor.h"
#include "pipeflow/core/errors.h"
#include "pipeflow/dsl/templates.h"
#include "common/utils.h"
#include <iterator>

namespace pipeflow {

namespace {

bool flag_is_false(const Value& flag) {
    return (flag.is_boolean() && !flag.get<bool>()) || (flag.is_string() && flag.get<std::string>() == "false");
}

Value take_flag(const Value& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    return it == obj.end() ? Value() : *it;
}

// Object, or a JSON string holding one; anything else yields an empty object
Value as_object(const Value& value) {
    if (value.is_object()) return value;
    if (value.is_string() && !value.get_ref<const std::string&>().empty()) {
        Value parsed = Value::parse(value.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_object()) return parsed;
    }
    return Value::object();
}

std::string append_query(const std::string& endpoint, const Value& params) {
    if (!params.is_object() || params.empty()) return endpoint;
    std::string query;
    for (auto it = params.begin(); it != params.end(); ++it) {
        if (!query.empty()) query += "&";
        query += url_encode(it.key()) + "=" + url_encode(value_to_text(it.value()));
    }
    return endpoint + (endpoint.find('?') == std::string::npos ? "?" : "&") + query;
}

HeaderMap build_headers(const Value& resolved) {
    HeaderMap headers;
    if (!resolved.is_object()) return headers;

    const Value send_headers = take_flag(resolved, "__send_headers__");
    const Value custom_headers = take_flag(resolved, "__custom_headers__");
    const std::string auth_type = value_to_text(take_flag(resolved, "__auth_type__"));
    const std::string username = value_to_text(take_flag(resolved, "__basic_auth_username__"));
    const std::string password = value_to_text(take_flag(resolved, "__basic_auth_password__"));
    const std::string bearer = value_to_text(take_flag(resolved, "__bearer_token__"));
    const std::string custom_name = value_to_text(take_flag(resolved, "__custom_auth_header_name__"));
    const std::string custom_value = value_to_text(take_flag(resolved, "__custom_auth_header_value__"));

    if (auth_type == "basic" && !username.empty() && !password.empty()) {
        headers["Authorization"] = "Basic " + base64_encode(username + ":" + password);
    } else if (auth_type == "bearer" && !bearer.empty()) {
        headers["Authorization"] = "Bearer " + bearer;
    } else if (auth_type == "custom" && !custom_name.empty() && !custom_value.empty()) {
        headers[custom_name] = custom_value;
    }

    // Plain header entries of the definition itself
    Value plain = strip_reserved_flags(resolved);
    for (auto it = plain.begin(); it != plain.end(); ++it) {
        headers[it.key()] = value_to_text(it.value());
    }

    Value custom = as_object(custom_headers);
    for (auto it = custom.begin(); it != custom.end(); ++it) {
        headers[it.key()] = value_to_text(it.value());
    }

    for (auto it = headers.begin(); it != headers.end();) {
        it = it->second.empty() ? headers.erase(it) : std::next(it);
    }

    if (flag_is_false(send_headers)) {
        HeaderMap auth_only;
        for (const auto& [key, value] : headers) {
            std::string lower = to_lower(key);
            if (lower.find("auth") != std::string::npos || lower.find("token") != std::string::npos) {
                auth_only[key] = value;
            }
        }
        return auth_only;
    }
    return headers;
}

void set_content_type(HeaderMap& headers, const std::string& body_kind) {
    if (find_header(headers, "Content-Type")) return;
    static const std::map<std::string, std::string> kTypes = {
        {"json", "application/json"},
        {"form-data", "multipart/form-data"},
        {"x-www-form-urlencoded", "application/x-www-form-urlencoded"},
        {"text", "text/plain"},
        {"xml", "application/xml"},
        {"raw", "text/plain"},
    };
    auto it = kTypes.find(body_kind);
    if (it != kTypes.end()) {
        headers["Content-Type"] = it->second;
    }
}

Value network_error_envelope(const std::string& message) {
    return Value{
        {"status", 0},
        {"statusText", "Network Error"},
        {"headers", Value::object()},
        {"data", {{"error", message}, {"status", "error"}}}
    };
}

} // namespace

std::string repair_json_templates(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    bool in_string = false;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[++i]);
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
            out.push_back(c);
            continue;
        }
        if (c == '{' && i + 1 < text.size() && text[i + 1] == '{') {
            size_t close = text.find("}}", i + 2);
            if (close != std::string::npos) {
                out += '"' + text.substr(i, close + 2 - i) + '"';
                i = close + 1;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

ExecutionResult ExecutionDispatcher::execute_strategy(const ApiCallStrategy& strategy, const NodeCall& call) {
    const PipelineNode& node = call.node;
    const Value context = TemplateResolver::build_context(node, call.inputs);
    const Value& defaults = call.definition.default_config;

    // Endpoint
    std::string endpoint = value_to_text(TemplateResolver::resolve_with_context(strategy.endpoint, context));
    if (endpoint.empty() && defaults.contains("url")) {
        endpoint = value_to_text(defaults["url"]);
    }
    auto override_it = options_.endpoint_overrides.find(node.type);
    if (override_it != options_.endpoint_overrides.end() && !override_it->second.empty() &&
        (endpoint.empty() || !is_absolute_url(endpoint))) {
        endpoint = override_it->second;
    }
    if (endpoint.empty()) {
        throw ConfigurationError("Node " + node.label +
                                 " has api_call type but no endpoint specified. Please configure the URL in the node settings.");
    }

    // Method
    std::string method = "POST";
    if (!strategy.method.is_null()) {
        method = value_to_text(TemplateResolver::resolve_with_context(strategy.method, context));
        if (method.empty()) {
            method = defaults.contains("method") ? value_to_text(defaults["method"]) : "GET";
        }
    }
    method = to_upper(method.empty() ? "POST" : method);

    // Query string
    Value query_params = nullptr;
    if (!strategy.query_params.is_null()) {
        query_params = as_object(TemplateResolver::resolve_with_context(strategy.query_params, context));
    }
    const std::string url = append_query(endpoint, query_params);

    // Headers and auth
    HeaderMap headers;
    if (!strategy.headers.is_null()) {
        headers = build_headers(TemplateResolver::resolve_with_context(strategy.headers, context));
    }

    // Body
    Value body = nullptr;
    bool has_body = false;
    if (!strategy.payload.is_null()) {
        Value resolved = TemplateResolver::resolve_with_context(strategy.payload, context);
        bool flagged = false;
        if (resolved.is_object()) {
            for (auto it = resolved.begin(); it != resolved.end(); ++it) {
                if (is_reserved_flag(it.key())) flagged = true;
            }
        }

        if (!flagged) {
            body = resolved;
            has_body = !body.is_null();
        } else if (!flag_is_false(take_flag(resolved, "__send_body__"))) {
            const std::string kind = value_to_text(take_flag(resolved, "__body_content_type__"));
            const std::string specify = value_to_text(take_flag(resolved, "__body_specify__"));
            const Value body_raw = take_flag(resolved, "__body_raw__");
            const Value legacy = take_flag(resolved, "__legacy_payload__");

            // Read the JSON body source without resolving it, so expressions inside are resolved once
            Value body_json = take_flag(strategy.payload, "__body_json__");
            if (body_json.is_string()) {
                auto segments = TemplateResolver::parse(body_json.get<std::string>());
                if (segments.size() == 1 && segments[0].is_expression) {
                    const Value* raw = TemplateResolver::lookup(context, segments[0].path);
                    body_json = raw ? *raw : Value();
                }
            }

            if ((specify == "json" || specify == "expression") && is_truthy(body_json)) {
                Value parsed = body_json;
                bool parse_failed = false;
                if (body_json.is_string()) {
                    parsed = Value::parse(repair_json_templates(body_json.get<std::string>()), nullptr, false);
                    parse_failed = parsed.is_discarded();
                }
                if (!parse_failed) {
                    body = TemplateResolver::resolve_with_context(parsed, context);
                } else if (specify == "expression") {
                    body = TemplateResolver::resolve_with_context(body_json, context);
                } else {
                    throw ConfigurationError("Invalid JSON body for node " + node.label + ": " +
                                             body_json.get<std::string>());
                }
                has_body = true;
            } else if (is_truthy(body_raw) && (kind == "raw" || kind == "text" || kind == "xml")) {
                body = value_to_text(TemplateResolver::resolve_with_context(body_raw, context));
                has_body = true;
            } else if (is_truthy(legacy)) {
                body = TemplateResolver::resolve_with_context(legacy, context);
                has_body = true;
            } else {
                // Non-flag payload members form the body
                Value rest = strip_reserved_flags(resolved);
                if (!rest.empty()) {
                    body = rest;
                    has_body = true;
                }
            }
            set_content_type(headers, kind);
        }
    }

    Value request_details = {
        {"method", method},
        {"url", url},
        {"headers", headers},
        {"queryParams", query_params},
        {"body", body}
    };

    HttpResponse response;
    try {
        if (is_absolute_url(url)) {
            if (!transport_) {
                throw ConfigurationError("No HTTP transport configured for absolute URL " + url);
            }
            HttpRequest request;
            request.method = method;
            request.url = url;
            request.headers = headers;
            if (has_body && (method == "POST" || method == "PUT" || method == "PATCH")) {
                if (body.is_string()) {
                    request.body = body.get<std::string>();
                } else {
                    request.body = body.dump();
                    if (!find_header(request.headers, "Content-Type")) {
                        request.headers["Content-Type"] = "application/json";
                    }
                }
            }
            response = transport_->send(request);
        } else {
            if (call.context.api_client == nullptr) {
                throw ConfigurationError("No API client configured for relative endpoint " + url);
            }
            ApiClient& client = *call.context.api_client;
            HttpRequestConfig config;
            config.headers = headers;
            if (method == "GET") {
                response = client.get(url, config);
            } else if (method == "POST") {
                response = client.post(url, body, config);
            } else if (method == "PUT" || method == "PATCH") {
                config.method = method;
                response = client.post(url, body, config);
            } else if (method == "DELETE") {
                config.method = method;
                response = client.get(url, config);
            } else {
                throw ConfigurationError("Unsupported HTTP method: " + method);
            }
        }
    } catch (NetworkError& e) {
        e.attach_request(request_details);
        e.attach_response(network_error_envelope(e.what()));
        throw;
    } catch (ConfigurationError& e) {
        e.attach_request(request_details);
        throw;
    }

    Value response_details = response_envelope(response);
    if (!response.ok()) {
        HttpError error("HTTP " + std::to_string(response.status) + ": " + response.status_text, response.status);
        error.attach_request(request_details);
        error.attach_response(response_details);
        throw error;
    }

    ExecutionResult result;
    result.data = response.data;
    result.request = request_details;
    result.response = response_details;
    return result;
}

} // namespace pipeflow
