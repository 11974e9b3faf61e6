// pipeflow/core/result_metadata.h
#ifndef PIPEFLOW_CORE_RESULT_METADATA_H
#define PIPEFLOW_CORE_RESULT_METADATA_H

#include "pipeflow/library/schema.h"
#include "common/types.h"
#include <optional>

namespace pipeflow {

// Normalize a node's raw result into the result_metadata shape read by DataFlowResolver.
// nullopt when the node produced nothing.
std::optional<Value> extract_result_metadata(const NodeDefinition& definition, const Value& data);

} // namespace pipeflow

#endif // PIPEFLOW_CORE_RESULT_METADATA_H
