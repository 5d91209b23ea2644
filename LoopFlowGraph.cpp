// LoopFlowGraph.cpp
//
// Graph construction helpers, structural validation, and the execution
// context handed to node compute functions.
#include "LoopFlowGraph.hpp"
#include "LoopFlowErrors.hpp"
#include <fmt/core.h>
#include <unordered_set>

namespace LoopFlow {

bool numericValue(const Value& v, double& out) {
    if (std::holds_alternative<double>(v)) { out = std::get<double>(v); return true; }
    if (std::holds_alternative<float>(v)) { out = static_cast<double>(std::get<float>(v)); return true; }
    if (std::holds_alternative<int>(v)) { out = static_cast<double>(std::get<int>(v)); return true; }
    return false;
}

const char* portKindName(PortKind kind) {
    return kind == PortKind::Input ? "input" : "output";
}

ExecutionContext::ExecutionContext(NodeId nodeId, int iteration, StateMap& stateMap)
    : boundNode(std::move(nodeId)), currentIteration(iteration), states(stateMap) {}

Record ExecutionContext::getState() const {
    auto it = states.find(boundNode);
    if (it == states.end()) return Record{};
    return it->second;
}

void ExecutionContext::setState(Record next) {
    states[boundNode] = std::move(next);
}

const Port* Node::findInput(const PortId& portId) const {
    for (const auto& p : inputs) if (p.id == portId) return &p;
    return nullptr;
}

const Port* Node::findOutput(const PortId& portId) const {
    for (const auto& p : outputs) if (p.id == portId) return &p;
    return nullptr;
}

const Node* Graph::findNode(const NodeId& id) const {
    auto it = nodes.find(id);
    if (it == nodes.end()) return nullptr;
    return it->second.get();
}

Graph createGraph() {
    return Graph{};
}

Graph addNode(Graph graph, NodePtr node) {
    if (!node) {
        throw StructuralError("Cannot add null node to graph");
    }
    if (graph.contains(node->id)) {
        throw StructuralError(fmt::format("Node with id \"{}\" already exists in graph", node->id));
    }
    const NodeId id = node->id;
    graph.order.push_back(id);
    graph.nodes.emplace(id, std::move(node));
    return graph;
}

Graph addEdge(Graph graph, Edge edge) {
    graph.edgeList.push_back(std::move(edge));
    return graph;
}

namespace {

void validatePorts(const Node& node, PortKind expected, const std::vector<Port>& ports) {
    std::unordered_set<PortId> seen;
    for (const auto& port : ports) {
        if (port.kind != expected) {
            throw StructuralError(fmt::format("Port \"{}\" on node \"{}\" has kind \"{}\", expected \"{}\"",
                                              port.id, node.id, portKindName(port.kind), portKindName(expected)));
        }
        if (!seen.insert(port.id).second) {
            throw StructuralError(fmt::format("Duplicate port id \"{}\" in {} ports of node \"{}\"",
                                              port.id, portKindName(expected), node.id));
        }
    }
}

} // namespace

void validateGraph(const Graph& graph) {
    for (const auto& nodeId : graph.nodeIds()) {
        const Node* node = graph.findNode(nodeId);
        validatePorts(*node, PortKind::Input, node->inputs);
        validatePorts(*node, PortKind::Output, node->outputs);
        if (!node->compute) {
            throw StructuralError(fmt::format("Node \"{}\" has no compute function", nodeId));
        }
    }

    for (const auto& edge : graph.edges()) {
        const Node* from = graph.findNode(edge.fromNodeId);
        if (!from) {
            throw StructuralError(fmt::format("Edge \"{}\" references missing fromNodeId \"{}\"", edge.id, edge.fromNodeId));
        }
        const Node* to = graph.findNode(edge.toNodeId);
        if (!to) {
            throw StructuralError(fmt::format("Edge \"{}\" references missing toNodeId \"{}\"", edge.id, edge.toNodeId));
        }
        if (!from->findOutput(edge.fromPortId)) {
            throw StructuralError(fmt::format("Edge \"{}\" references missing output port \"{}\" on node \"{}\"",
                                              edge.id, edge.fromPortId, edge.fromNodeId));
        }
        if (!to->findInput(edge.toPortId)) {
            throw StructuralError(fmt::format("Edge \"{}\" references missing input port \"{}\" on node \"{}\"",
                                              edge.id, edge.toPortId, edge.toNodeId));
        }
    }
}

} // namespace LoopFlow
