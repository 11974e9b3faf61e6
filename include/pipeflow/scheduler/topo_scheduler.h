// pipeflow/scheduler/topo_scheduler.h
#ifndef PIPEFLOW_SCHEDULER_TOPO_SCHEDULER_H
#define PIPEFLOW_SCHEDULER_TOPO_SCHEDULER_H

#include "pipeflow/core/pipeline.h"
#include "common/types.h"
#include <vector>

namespace pipeflow {

// Kahn's algorithm. Edges whose endpoints are not in `nodes` are ignored; ties are broken
// by position in `nodes`. A result shorter than `nodes` means a cycle.
std::vector<NodeId> topological_sort(const std::vector<PipelineNode>& nodes, const std::vector<Edge>& edges);

// Nodes never reached by the sort (members of a cycle or downstream of one), in node order
std::vector<NodeId> find_cycle_nodes(const std::vector<PipelineNode>& nodes, const std::vector<Edge>& edges);

// Full order for a run; throws CycleError when the graph is not a DAG
std::vector<NodeId> execution_order(const Pipeline& pipeline);

} // namespace pipeflow

#endif // PIPEFLOW_SCHEDULER_TOPO_SCHEDULER_H
