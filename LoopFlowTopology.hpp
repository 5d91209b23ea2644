// LoopFlow topology analysis
//
// Computes the evaluation order used by every built-in strategy:
// strongly connected components (iterative Tarjan), a condensed component
// DAG, Kahn's sort over that DAG, then a flatten step. Nodes that share a
// cycle come out contiguous; everything else respects edge direction.
#pragma once
#include "LoopFlowGraph.hpp"
#include <vector>

namespace LoopFlow {

using Component = std::vector<NodeId>;
// Successor component indices per component, first-seen order, no duplicates
using ComponentGraph = std::vector<std::vector<size_t>>;

// SCCs in completion order. Members of each SCC are listed in DFS discovery
// order (the node the cycle was entered through comes first).
std::vector<Component> findStronglyConnectedComponents(const Graph& graph);

// One vertex per SCC; an arc a->b iff some edge crosses from SCC a into SCC b.
// Intra-component edges (self-loops included) are dropped.
ComponentGraph condenseComponents(const Graph& graph, const std::vector<Component>& components);

// Kahn's algorithm, frontier seeded in component index order.
std::vector<size_t> sortComponents(const ComponentGraph& componentGraph);

// Full pipeline: SCCs -> condense -> sort -> flatten
std::vector<NodeId> computeEvaluationOrder(const Graph& graph);

} // namespace LoopFlow
