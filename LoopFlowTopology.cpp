// LoopFlowTopology.cpp
//
// Tarjan runs over dense indices (graph insertion order) with an explicit
// frame stack, so deep chains never touch native recursion.
#include "LoopFlowTopology.hpp"
#include <algorithm>
#include <unordered_map>

namespace LoopFlow {

namespace {

struct DenseGraph {
    std::vector<NodeId> ids;                 // index -> id
    std::unordered_map<NodeId, size_t> index; // id -> index
    std::vector<std::vector<size_t>> successors;
};

DenseGraph buildDenseGraph(const Graph& graph) {
    DenseGraph dense;
    dense.ids = graph.nodeIds();
    dense.successors.resize(dense.ids.size());
    for (size_t i = 0; i < dense.ids.size(); ++i) dense.index[dense.ids[i]] = i;
    for (const auto& e : graph.edges()) {
        auto from = dense.index.find(e.fromNodeId);
        auto to = dense.index.find(e.toNodeId);
        // Dangling references are validateGraph's concern; skip them here
        if (from == dense.index.end() || to == dense.index.end()) continue;
        dense.successors[from->second].push_back(to->second);
    }
    return dense;
}

} // namespace

std::vector<Component> findStronglyConnectedComponents(const Graph& graph) {
    const DenseGraph dense = buildDenseGraph(graph);
    const size_t n = dense.ids.size();
    constexpr size_t unvisited = static_cast<size_t>(-1);

    std::vector<size_t> indexOf(n, unvisited);
    std::vector<size_t> lowLink(n, 0);
    std::vector<bool> onStack(n, false);
    std::vector<size_t> tarjanStack;
    std::vector<Component> components;

    struct Frame {
        size_t node;
        size_t nextSuccessor;
    };
    std::vector<Frame> callStack;
    size_t nextIndex = 0;

    auto visit = [&](size_t v) {
        indexOf[v] = nextIndex;
        lowLink[v] = nextIndex;
        ++nextIndex;
        tarjanStack.push_back(v);
        onStack[v] = true;
        callStack.push_back({v, 0});
    };

    for (size_t root = 0; root < n; ++root) {
        if (indexOf[root] != unvisited) continue;
        visit(root);

        while (!callStack.empty()) {
            Frame& top = callStack.back();
            const size_t v = top.node;
            const auto& succ = dense.successors[v];

            if (top.nextSuccessor < succ.size()) {
                const size_t w = succ[top.nextSuccessor++];
                if (indexOf[w] == unvisited) {
                    visit(w); // invalidates 'top'
                } else if (onStack[w]) {
                    lowLink[v] = std::min(lowLink[v], indexOf[w]);
                }
                continue;
            }

            callStack.pop_back();
            if (lowLink[v] == indexOf[v]) {
                Component comp;
                size_t w;
                do {
                    w = tarjanStack.back();
                    tarjanStack.pop_back();
                    onStack[w] = false;
                    comp.push_back(dense.ids[w]);
                } while (w != v);
                // Popped newest-first; flip to discovery order
                std::reverse(comp.begin(), comp.end());
                components.push_back(std::move(comp));
            }
            if (!callStack.empty()) {
                const size_t parent = callStack.back().node;
                lowLink[parent] = std::min(lowLink[parent], lowLink[v]);
            }
        }
    }
    return components;
}

ComponentGraph condenseComponents(const Graph& graph, const std::vector<Component>& components) {
    std::unordered_map<NodeId, size_t> componentOf;
    for (size_t c = 0; c < components.size(); ++c) {
        for (const auto& id : components[c]) componentOf[id] = c;
    }

    ComponentGraph cg(components.size());
    for (const auto& e : graph.edges()) {
        auto from = componentOf.find(e.fromNodeId);
        auto to = componentOf.find(e.toNodeId);
        if (from == componentOf.end() || to == componentOf.end()) continue;
        if (from->second == to->second) continue;
        auto& succ = cg[from->second];
        if (std::find(succ.begin(), succ.end(), to->second) == succ.end()) {
            succ.push_back(to->second);
        }
    }
    return cg;
}

std::vector<size_t> sortComponents(const ComponentGraph& componentGraph) {
    std::vector<int> inDegree(componentGraph.size(), 0);
    for (const auto& succ : componentGraph) {
        for (size_t s : succ) ++inDegree[s];
    }

    std::vector<size_t> queue;
    queue.reserve(componentGraph.size());
    for (size_t c = 0; c < componentGraph.size(); ++c) {
        if (inDegree[c] == 0) queue.push_back(c);
    }

    // queue doubles as the output: BFS emission order
    for (size_t head = 0; head < queue.size(); ++head) {
        for (size_t next : componentGraph[queue[head]]) {
            if (--inDegree[next] == 0) queue.push_back(next);
        }
    }
    return queue;
}

std::vector<NodeId> computeEvaluationOrder(const Graph& graph) {
    const auto components = findStronglyConnectedComponents(graph);
    const auto componentOrder = sortComponents(condenseComponents(graph, components));

    std::vector<NodeId> order;
    order.reserve(graph.size());
    for (size_t c : componentOrder) {
        const auto& members = components[c];
        order.insert(order.end(), members.begin(), members.end());
    }
    return order;
}

} // namespace LoopFlow
