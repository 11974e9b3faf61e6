// src/library/schema.cpp
#include "pipeflow/library/schema.h"
#include "pipeflow/core/errors.h"

namespace pipeflow {

namespace {

Value field_or_null(const Value& obj, const char* key) {
    auto it = obj.find(key);
    return it == obj.end() ? Value() : *it;
}

std::vector<HandleDefinition> parse_handles(const NodeTypeName& type, const Value& list, const char* side) {
    std::vector<HandleDefinition> handles;
    if (list.is_null()) return handles;
    if (!list.is_array()) {
        throw ConfigurationError("Node config for " + type + " has non-array handles." + side);
    }
    for (const auto& item : list) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            throw ConfigurationError("Node config for " + type + " has a handle without id in handles." + side);
        }
        HandleDefinition handle;
        handle.id = item["id"].get<std::string>();
        if (item.contains("dataType") && item["dataType"].is_string() &&
            !item["dataType"].get_ref<const std::string&>().empty()) {
            handle.data_type = item["dataType"].get<std::string>();
        }
        handles.push_back(std::move(handle));
    }
    return handles;
}

ExecutionDescriptor parse_execution(const NodeTypeName& type, const Value& exec) {
    if (!exec.is_object() || !exec.contains("type") || !exec["type"].is_string()) {
        throw ConfigurationError("Node config for " + type + " has no execution type");
    }
    const std::string kind = exec["type"].get<std::string>();

    ExecutionDescriptor descriptor;
    if (kind == "api_call") {
        ApiCallStrategy api;
        api.endpoint = field_or_null(exec, "endpoint");
        api.method = field_or_null(exec, "method");
        api.headers = field_or_null(exec, "headers");
        api.query_params = field_or_null(exec, "queryParams");
        api.payload = field_or_null(exec, "payload");
        descriptor.strategy = std::move(api);
        descriptor.inputs_optional = true;
    } else if (kind == "file_check") {
        FileCheckStrategy check;
        check.identifying_field = exec.value("identifyingField", check.identifying_field);
        check.descriptor_type = exec.value("descriptorType", check.descriptor_type);
        if (exec.contains("carriedFields") && exec["carriedFields"].is_array()) {
            check.carried_fields = exec["carriedFields"].get<std::vector<std::string>>();
        }
        descriptor.strategy = std::move(check);
    } else if (kind == "log") {
        descriptor.strategy = LogStrategy{field_or_null(exec, "message")};
    } else if (kind == "code_execution") {
        descriptor.strategy = CodeExecutionStrategy{field_or_null(exec, "code")};
    } else {
        throw ConfigurationError("Unknown execution type: " + kind);
    }

    if (exec.contains("inputsOptional") && exec["inputsOptional"].is_boolean()) {
        descriptor.inputs_optional = exec["inputsOptional"].get<bool>();
    }
    return descriptor;
}

} // namespace

std::string ExecutionDescriptor::type_name() const {
    struct Namer {
        std::string operator()(const ApiCallStrategy&) const { return "api_call"; }
        std::string operator()(const FileCheckStrategy&) const { return "file_check"; }
        std::string operator()(const LogStrategy&) const { return "log"; }
        std::string operator()(const CodeExecutionStrategy&) const { return "code_execution"; }
    };
    return std::visit(Namer{}, strategy);
}

NodeDefinition parse_node_definition(const NodeTypeName& type, const Value& doc) {
    if (!doc.is_object()) {
        throw ConfigurationError("Node config for " + type + " is not an object");
    }
    for (const char* key : {"schema", "handles", "execution", "defaultConfig"}) {
        if (!doc.contains(key) || doc[key].is_null()) {
            throw ConfigurationError("Node config for " + type + " is missing " + key);
        }
    }

    NodeDefinition def;
    def.type = type;

    if (doc.contains("metadata") && doc["metadata"].is_object()) {
        const auto& meta = doc["metadata"];
        if (meta.contains("type") && meta["type"].is_string() && meta["type"].get<std::string>() != type) {
            throw ConfigurationError("Node config type mismatch: expected " + type + ", got " +
                                     meta["type"].get<std::string>());
        }
        def.metadata.label = meta.value("label", type);
        def.metadata.description = meta.value("description", "");
        def.metadata.category = meta.value("category", "");
    } else {
        def.metadata.label = type;
    }

    const auto& schema = doc["schema"];
    if (!schema.is_object()) {
        throw ConfigurationError("Node config for " + type + " has a non-object schema");
    }
    for (auto it = schema.begin(); it != schema.end(); ++it) {
        FieldSchema field;
        if (it->is_object()) {
            field.type = it->value("type", field.type);
            field.required = it->value("required", false);
            field.default_value = field_or_null(*it, "default");
            field.label = it->value("label", it.key());
        }
        def.schema.emplace(it.key(), std::move(field));
    }

    const auto& handles = doc["handles"];
    def.inputs = parse_handles(type, field_or_null(handles, "inputs"), "inputs");
    def.outputs = parse_handles(type, field_or_null(handles, "outputs"), "outputs");

    def.execution = parse_execution(type, doc["execution"]);

    if (!doc["defaultConfig"].is_object()) {
        throw ConfigurationError("Node config for " + type + " has a non-object defaultConfig");
    }
    def.default_config = doc["defaultConfig"];

    if (doc.contains("resultFileType") && doc["resultFileType"].is_string()) {
        def.result_file_type = doc["resultFileType"].get<std::string>();
    }
    return def;
}

} // namespace pipeflow
