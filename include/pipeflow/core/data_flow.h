// pipeflow/core/data_flow.h
#ifndef PIPEFLOW_CORE_DATA_FLOW_H
#define PIPEFLOW_CORE_DATA_FLOW_H

#include "pipeflow/core/pipeline.h"
#include "pipeflow/library/schema.h"
#include "common/types.h"
#include <string>
#include <vector>

namespace pipeflow {

/**
 * DataFlowResolver: projects upstream result_metadata onto typed input handles.
 *
 * Per producer result, in order:
 *   1. a descriptor object tagged with the handle's dataType (file_info, output_file, any member)
 *   2. a conventionally named field (pdb_file -> output_file, sequence, message, <dataType>)
 *   3. the whole blob for "any" and untyped handles
 */
class DataFlowResolver {
public:
    // null when nothing upstream produced data for this handle
    static Value get_input_data(const NodeId& node_id, const std::string& handle_id,
                                const HandleDefinition& handle, const Pipeline& pipeline);

    // {handle_id: value} over every declared input; null values omitted
    static Value get_all_input_data(const PipelineNode& node, const NodeDefinition& definition,
                                    const Pipeline& pipeline);

    // Throws ValidationError naming the first missing typed input unless inputs are optional
    static void validate_inputs(const PipelineNode& node, const NodeDefinition& definition, const Value& inputs);

    // Typed input handles with no data; empty when inputs are optional
    static std::vector<std::string> missing_inputs(const NodeDefinition& definition, const Value& inputs);

    // Projection of a single producer result onto a data type
    static Value project(const Value& result_metadata, const std::optional<std::string>& data_type);

private:
    static const Edge* find_incoming_edge(const NodeId& node_id, const std::string& handle_id,
                                          const Pipeline& pipeline);
};

} // namespace pipeflow

#endif // PIPEFLOW_CORE_DATA_FLOW_H
