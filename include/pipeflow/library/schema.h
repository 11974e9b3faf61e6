// pipeflow/library/schema.h
#ifndef PIPEFLOW_LIBRARY_SCHEMA_H
#define PIPEFLOW_LIBRARY_SCHEMA_H

#include "common/types.h"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pipeflow {

struct FieldSchema {
    std::string type = "string";
    bool required = false;
    Value default_value = nullptr;
    std::string label;
};

struct HandleDefinition {
    std::string id;
    std::optional<std::string> data_type; // absent: untyped, accepts whatever the producer offers
};

// Every member is a template resolved against {input, config, node}
struct ApiCallStrategy {
    Value endpoint = nullptr;
    Value method = nullptr;
    Value headers = nullptr;
    Value query_params = nullptr;
    Value payload = nullptr;
};

struct FileCheckStrategy {
    std::string identifying_field = "filename";
    std::string descriptor_type = "pdb_file";
    // Config keys copied into the descriptor when present
    std::vector<std::string> carried_fields = {
        "chains", "total_residues", "suggested_contigs", "chain_residue_counts", "atoms"
    };
};

struct LogStrategy {
    Value message = nullptr;
};

struct CodeExecutionStrategy {
    Value code = nullptr;
};

using ExecutionStrategy = std::variant<ApiCallStrategy, FileCheckStrategy, LogStrategy, CodeExecutionStrategy>;

struct ExecutionDescriptor {
    ExecutionStrategy strategy;
    bool inputs_optional = false;

    std::string type_name() const;
};

struct NodeMetadata {
    std::string label;
    std::string description;
    std::string category;
};

struct NodeDefinition {
    NodeTypeName type;
    NodeMetadata metadata;
    std::map<std::string, FieldSchema> schema;
    std::vector<HandleDefinition> inputs;
    std::vector<HandleDefinition> outputs;
    ExecutionDescriptor execution;
    Value default_config = Value::object();
    std::optional<std::string> result_file_type; // descriptor type synthesized from a "filepath" result
};

// Parse a definition document (already converted to JSON). Throws ConfigurationError.
NodeDefinition parse_node_definition(const NodeTypeName& type, const Value& document);

} // namespace pipeflow

#endif // PIPEFLOW_LIBRARY_SCHEMA_H
