// pipeflow/library/loader.h
#ifndef PIPEFLOW_LIBRARY_LOADER_H
#define PIPEFLOW_LIBRARY_LOADER_H

#include "pipeflow/library/schema.h"
#include "pipeflow/core/pipeline.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pipeflow {

// Shared so a definition stays alive for a running node while the registry is re-registered
using NodeDefinitionPtr = std::shared_ptr<const NodeDefinition>;

/**
 * NodeDefinitionRegistry: per-type definition documents, parsed once and cached.
 * Lookup order: registered documents, search directories, built-in catalog.
 */
class NodeDefinitionRegistry {
public:
    NodeDefinitionRegistry();

    // Throws NotFoundError for unknown types, ConfigurationError for broken documents
    NodeDefinitionPtr load_node_config(const NodeTypeName& type);

    // Fresh copy of defaultConfig; callers may mutate it freely
    Value get_default_node_config(const NodeTypeName& type);

    // A node whose config is seeded from defaultConfig
    PipelineNode create_node(const NodeTypeName& type, const NodeId& id, const std::string& label = "");

    void register_definition(const NodeTypeName& type, Value document);
    void add_search_directory(const std::string& dir);

    bool has_type(const NodeTypeName& type);
    std::vector<NodeTypeName> available_types() const;

    void clear_cache();

private:
    Value find_document(const NodeTypeName& type) const;
    Value load_from_directories(const NodeTypeName& type) const;

    std::map<NodeTypeName, Value> registered_;
    std::map<NodeTypeName, Value> builtin_;
    std::vector<std::string> search_dirs_;
    std::map<NodeTypeName, NodeDefinitionPtr> cache_;
    mutable std::mutex mutex_;
};

// Definition documents shipped with the library, keyed by node type
std::map<NodeTypeName, Value> builtin_node_documents();

} // namespace pipeflow

#endif // PIPEFLOW_LIBRARY_LOADER_H
