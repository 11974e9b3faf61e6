// src/library/loader.cpp
#include "pipeflow/library/loader.h"
#include "pipeflow/core/errors.h"
#include "common/utils.h"
#include <filesystem>
#include <iostream>

namespace pipeflow {

NodeDefinitionRegistry::NodeDefinitionRegistry()
    : builtin_(builtin_node_documents()) {}

NodeDefinitionPtr NodeDefinitionRegistry::load_node_config(const NodeTypeName& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = cache_.find(type);
    if (cached != cache_.end()) {
        return cached->second;
    }

    Value doc = find_document(type);
    if (doc.is_null()) {
        throw NotFoundError("Unknown node type: " + type);
    }

    NodeDefinitionPtr def;
    try {
        def = std::make_shared<const NodeDefinition>(parse_node_definition(type, doc));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Node config for " + type + " is malformed: " + e.what());
    }
    cache_[type] = def;
    return def;
}

Value NodeDefinitionRegistry::get_default_node_config(const NodeTypeName& type) {
    return load_node_config(type)->default_config;
}

PipelineNode NodeDefinitionRegistry::create_node(const NodeTypeName& type, const NodeId& id, const std::string& label) {
    auto def = load_node_config(type);
    PipelineNode node;
    node.id = id;
    node.type = type;
    node.label = label.empty() ? def->metadata.label : label;
    node.config = def->default_config;
    node.status = NodeStatus::IDLE;
    return node;
}

void NodeDefinitionRegistry::register_definition(const NodeTypeName& type, Value document) {
    std::lock_guard<std::mutex> lock(mutex_);
    registered_[type] = std::move(document);
    cache_.erase(type);
}

void NodeDefinitionRegistry::add_search_directory(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    search_dirs_.push_back(dir);
}

bool NodeDefinitionRegistry::has_type(const NodeTypeName& type) {
    try {
        load_node_config(type);
        return true;
    } catch (const NotFoundError&) {
        return false;
    }
}

std::vector<NodeTypeName> NodeDefinitionRegistry::available_types() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<NodeTypeName, bool> seen;
    for (const auto& [type, doc] : builtin_) seen[type] = true;
    for (const auto& [type, doc] : registered_) seen[type] = true;

    std::vector<NodeTypeName> types;
    types.reserve(seen.size());
    for (const auto& [type, flag] : seen) types.push_back(type);
    return types;
}

void NodeDefinitionRegistry::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

Value NodeDefinitionRegistry::find_document(const NodeTypeName& type) const {
    auto reg = registered_.find(type);
    if (reg != registered_.end()) {
        return reg->second;
    }
    Value from_disk = load_from_directories(type);
    if (!from_disk.is_null()) {
        return from_disk;
    }
    auto builtin = builtin_.find(type);
    if (builtin != builtin_.end()) {
        return builtin->second;
    }
    return nullptr;
}

Value NodeDefinitionRegistry::load_from_directories(const NodeTypeName& type) const {
    namespace fs = std::filesystem;
    for (const auto& dir : search_dirs_) {
        if (!fs::exists(dir) || !fs::is_directory(dir)) continue;

        const fs::path base(dir);
        const fs::path candidates[] = {
            base / type / "node.json",
            base / type / "node.yaml",
            base / type / "node.yml",
            base / (type + ".json"),
            base / (type + ".yaml"),
            base / (type + ".yml"),
        };
        for (const auto& candidate : candidates) {
            if (!fs::is_regular_file(candidate)) continue;
            try {
                std::cout << "[INFO] Loading node definition '" << type << "' from " << candidate.string() << std::endl;
                return load_document(candidate.string());
            } catch (const std::runtime_error& e) {
                throw ConfigurationError("Failed to load node config for " + type + ": " + e.what());
            }
        }
    }
    return nullptr;
}

} // namespace pipeflow
