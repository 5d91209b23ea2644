// LoopFlowCore.cpp
//
// Implements the iteration loop and the forward/back-edge input resolution.
// The engine keeps nothing between calls: state, outputs and the strategy
// clone all live on the stack of one run.
#include "LoopFlowCore.hpp"
#include "LoopFlowErrors.hpp"
#include "LoopFlowLog.hpp"
#include <chrono>
#include <fmt/core.h>
#include <string>
#include <unordered_map>
#include <utility>

namespace LoopFlow {

namespace {

using IncomingEdges = std::unordered_map<NodeId, std::vector<const Edge*>>;
using OrderIndex = std::unordered_map<NodeId, size_t>;

std::string joinIds(const std::vector<NodeId>& ids) {
    std::string s;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) s += ",";
        s += ids[i];
    }
    return s;
}

// Both endpoints of every edge must exist in the graph
void checkEdgesAgainstGraph(const Graph& graph) {
    for (const auto& e : graph.edges()) {
        if (!graph.contains(e.fromNodeId)) {
            throw ConsistencyError(fmt::format("Source node \"{}\" of edge \"{}\" not found in graph",
                                               e.fromNodeId, e.id));
        }
        if (!graph.contains(e.toNodeId)) {
            throw ConsistencyError(fmt::format("Target node \"{}\" of edge \"{}\" not found in graph",
                                               e.toNodeId, e.id));
        }
    }
}

// ...and must be scheduled by the strategy's order for this iteration
void checkEdgesAgainstOrder(const Graph& graph, const OrderIndex& position) {
    for (const auto& e : graph.edges()) {
        if (!position.count(e.fromNodeId)) {
            throw ConsistencyError(fmt::format("Source node \"{}\" of edge \"{}\" not found in execution order",
                                               e.fromNodeId, e.id));
        }
        if (!position.count(e.toNodeId)) {
            throw ConsistencyError(fmt::format("Target node \"{}\" of edge \"{}\" not found in execution order",
                                               e.toNodeId, e.id));
        }
    }
}

// Sum of resolved edge values per input port. Ports without edges stay absent.
// Edge endpoints were checked by checkEdgesAgainstOrder.
Record gatherInputs(const Node& node, size_t idx, const IncomingEdges& incoming,
                    const OrderIndex& position, const OutputMap& current,
                    const BackEdgeValues& backEdges, RunStats& stats) {
    std::unordered_map<PortId, double> sums;
    auto edgesIt = incoming.find(node.id);
    if (edgesIt != incoming.end()) {
        for (const Edge* edge : edgesIt->second) {
            const size_t srcIdx = position.at(edge->fromNodeId);
            if (!node.findInput(edge->toPortId)) {
                logDebug("edge {} targets undeclared input {}.{}; skipped", edge->id, node.id, edge->toPortId);
                continue;
            }

            double value = 0.0;
            if (srcIdx < idx) {
                // Forward: source already ran this iteration
                auto out = current.find(edge->fromNodeId);
                if (out != current.end()) {
                    auto field = out->second.find(edge->fromPortId);
                    double produced = 0.0;
                    if (field != out->second.end() && numericValue(field->second, produced)) value = produced;
                }
                ++stats.forwardEdgesResolved;
            } else {
                // Back edge (self-loops included): strategy-supplied default
                auto it = backEdges.find(backEdgeKey(edge->fromNodeId, edge->fromPortId));
                if (it != backEdges.end()) value = it->second;
                ++stats.backEdgesResolved;
            }
            sums[edge->toPortId] += value;
        }
    }

    Record inputs;
    for (const auto& [portId, sum] : sums) inputs[portId] = sum;
    return inputs;
}

ExecutionResult runLoop(const Graph& graph, const StateMap* initialState, const ExecutionStrategy& prototype) {
    auto t0 = std::chrono::steady_clock::now();
    auto strategy = prototype.clone();
    ExecutionResult result;

    for (const auto& nodeId : graph.nodeIds()) {
        if (initialState) {
            auto it = initialState->find(nodeId);
            if (it != initialState->end()) {
                result.state[nodeId] = it->second;
                continue;
            }
        }
        result.state[nodeId] = graph.findNode(nodeId)->state;
    }

    checkEdgesAgainstGraph(graph);
    IncomingEdges incoming;
    for (const auto& e : graph.edges()) incoming[e.toNodeId].push_back(&e);

    OutputMap previous;
    bool havePrevious = false;
    int iteration = 0;
    while (true) {
        ++iteration;
        const std::vector<NodeId> order = strategy->order(graph);
        const BackEdgeValues backEdges = strategy->backEdgeDefaults(iteration, havePrevious ? &previous : nullptr);
        if (logEnabled(LogLevel::Debug)) {
            logDebug("{} iteration {}: order=[{}] backEdgeDefaults={}", strategy->name(), iteration,
                     joinIds(order), backEdges.size());
        }

        OrderIndex position;
        for (size_t i = 0; i < order.size(); ++i) position.emplace(order[i], i);
        checkEdgesAgainstOrder(graph, position);

        OutputMap current;
        for (size_t idx = 0; idx < order.size(); ++idx) {
            const NodeId& nodeId = order[idx];
            const Node* node = graph.findNode(nodeId);
            if (!node) {
                throw ConsistencyError(fmt::format("Node \"{}\" not found in graph", nodeId));
            }
            if (!node->compute) {
                throw ConsistencyError(fmt::format("Node \"{}\" has no compute function", nodeId));
            }

            Record inputs = gatherInputs(*node, idx, incoming, position, current, backEdges, result.stats);
            ExecutionContext ctx(nodeId, iteration, result.state);
            Record outputs = node->compute(inputs, ctx);
            ++result.stats.nodesEvaluated;

            current[nodeId] = outputs;
            result.outputs[nodeId] = std::move(outputs);
        }

        const bool again = strategy->shouldContinue(iteration, current);
        previous = std::move(current);
        havePrevious = true;
        if (!again) break;
    }

    result.iterations = iteration;
    auto t1 = std::chrono::steady_clock::now();
    result.stats.evalTimeNs = (unsigned long long)std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
    logInfo("{} run finished: iterations={} nodesEvaluated={} backEdges={} timeNs={}", strategy->name(),
            result.iterations, result.stats.nodesEvaluated, result.stats.backEdgesResolved, result.stats.evalTimeNs);
    return result;
}

} // namespace

LoopEngine::LoopEngine(std::unique_ptr<ExecutionStrategy> strategy) : prototype(std::move(strategy)) {
    if (!prototype) {
        throw ConfigurationError("LoopEngine requires an execution strategy");
    }
}

ExecutionResult LoopEngine::execute(const Graph& graph) const {
    return runLoop(graph, nullptr, *prototype);
}

ExecutionResult LoopEngine::execute(const Graph& graph, const StateMap& initialState) const {
    return runLoop(graph, &initialState, *prototype);
}

std::future<ExecutionResult> LoopEngine::executeAsync(Graph graph) const {
    auto proto = prototype;
    return std::async(std::launch::async, [proto, graph = std::move(graph)]() {
        return runLoop(graph, nullptr, *proto);
    });
}

std::future<ExecutionResult> LoopEngine::executeAsync(Graph graph, StateMap initialState) const {
    auto proto = prototype;
    return std::async(std::launch::async, [proto, graph = std::move(graph), state = std::move(initialState)]() {
        return runLoop(graph, &state, *proto);
    });
}

} // namespace LoopFlow
