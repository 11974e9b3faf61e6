// src/scheduler/topo_scheduler.cpp
#include "pipeflow/scheduler/topo_scheduler.h"
#include "pipeflow/core/errors.h"
#include <queue>
#include <unordered_map>
#include <unordered_set>

namespace pipeflow {

std::vector<NodeId> topological_sort(const std::vector<PipelineNode>& nodes, const std::vector<Edge>& edges) {
    std::unordered_map<NodeId, int> in_degree;
    std::unordered_map<NodeId, std::vector<NodeId>> adjacency;

    // Every node starts at in-degree 0
    for (const auto& node : nodes) {
        in_degree[node.id] = 0;
        adjacency[node.id] = {};
    }

    for (const auto& edge : edges) {
        if (in_degree.count(edge.source) == 0 || in_degree.count(edge.target) == 0) {
            continue;
        }
        adjacency[edge.source].push_back(edge.target);
        in_degree[edge.target]++;
    }

    std::queue<NodeId> ready_queue;
    for (const auto& node : nodes) {
        if (in_degree[node.id] == 0) {
            ready_queue.push(node.id);
        }
    }

    std::vector<NodeId> order;
    order.reserve(nodes.size());
    while (!ready_queue.empty()) {
        NodeId current = ready_queue.front();
        ready_queue.pop();
        order.push_back(current);

        // Release successors
        for (const auto& succ : adjacency[current]) {
            if (--in_degree[succ] == 0) {
                ready_queue.push(succ);
            }
        }
    }
    return order;
}

std::vector<NodeId> find_cycle_nodes(const std::vector<PipelineNode>& nodes, const std::vector<Edge>& edges) {
    auto order = topological_sort(nodes, edges);
    std::unordered_set<NodeId> visited(order.begin(), order.end());

    std::vector<NodeId> unvisited;
    for (const auto& node : nodes) {
        if (visited.count(node.id) == 0) {
            unvisited.push_back(node.id);
        }
    }
    return unvisited;
}

std::vector<NodeId> execution_order(const Pipeline& pipeline) {
    auto order = topological_sort(pipeline.nodes, pipeline.edges);
    if (order.size() < pipeline.nodes.size()) {
        auto cyclic = find_cycle_nodes(pipeline.nodes, pipeline.edges);
        std::string listed;
        for (const auto& id : cyclic) {
            if (!listed.empty()) listed += ", ";
            listed += id;
        }
        throw CycleError("Pipeline contains a cycle involving nodes: " + listed, std::move(cyclic));
    }
    return order;
}

} // namespace pipeflow
