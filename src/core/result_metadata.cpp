// src/core/result_metadata.cpp
#include "pipeflow/core/result_metadata.h"
#include "common/utils.h"

namespace pipeflow {

namespace {

const Value* truthy_member(const Value& obj, const char* key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(key);
    if (it == obj.end() || !is_truthy(*it)) return nullptr;
    return &*it;
}

// Look at the top level first, then one level down under "data"
const Value* promoted(const Value& result, const char* key) {
    if (const Value* v = truthy_member(result, key)) return v;
    if (const Value* nested = truthy_member(result, "data")) {
        return truthy_member(*nested, key);
    }
    return nullptr;
}

std::string basename_of(const std::string& path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

Value file_descriptor_metadata(const Value& descriptor, const std::string& default_type) {
    Value meta = Value::object();
    meta["file_info"] = descriptor;
    meta["type"] = descriptor.value("type", default_type);
    for (const char* key : {"filename", "file_id", "file_url"}) {
        if (descriptor.contains(key)) meta[key] = descriptor[key];
    }
    meta["data"] = descriptor;
    return meta;
}

} // namespace

std::optional<Value> extract_result_metadata(const NodeDefinition& definition, const Value& data) {
    if (data.is_null()) return std::nullopt;
    if (!data.is_object()) {
        return Value{{"value", data}};
    }

    if (const auto* check = std::get_if<FileCheckStrategy>(&definition.execution.strategy)) {
        return file_descriptor_metadata(data, check->descriptor_type);
    }

    Value meta = Value::object();
    if (const Value* file = promoted(data, "output_file")) {
        meta["output_file"] = *file;
    } else if (const Value* file = promoted(data, "file")) {
        meta["output_file"] = *file;
    } else if (definition.result_file_type.has_value()) {
        if (const Value* path = promoted(data, "filepath"); path && path->is_string()) {
            const std::string filepath = path->get<std::string>();
            Value descriptor = {
                {"type", *definition.result_file_type},
                {"filepath", filepath},
                {"filename", basename_of(filepath)}
            };
            if (const Value* id = promoted(data, "file_id")) descriptor["file_id"] = *id;
            if (const Value* url = promoted(data, "file_url")) descriptor["file_url"] = *url;
            meta["output_file"] = descriptor;
        }
    }
    for (const char* key : {"sequence", "message"}) {
        if (const Value* v = promoted(data, key)) meta[key] = *v;
    }
    if (const Value* v = truthy_member(data, "data")) {
        meta["data"] = *v;
    }

    if (meta.empty()) {
        meta = data;
    }
    return meta;
}

} // namespace pipeflow
