// LoopFlow graph model
//
// This header defines the in-memory causal-loop graph (nodes, ports, edges),
// the per-node execution context handed to compute functions, and the
// value-returning helpers used to build and validate a graph. Nodes refer to
// each other only through string ids, so cyclic diagrams never turn into
// cyclic ownership.
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace LoopFlow {

using NodeId = std::string;
using PortId = std::string;
// Scalar value carried in records. int/float/double count as numeric.
using Value = std::variant<int, float, double, std::string>;
// String-keyed bag of values: node inputs, outputs, state and parameters.
// Input/output records are keyed by port id.
using Record = std::unordered_map<std::string, Value>;
using StateMap = std::unordered_map<NodeId, Record>;
using OutputMap = std::unordered_map<NodeId, Record>;

// True when v holds a number; stores it widened to double in out.
bool numericValue(const Value& v, double& out);

enum class PortKind { Input, Output };

const char* portKindName(PortKind kind);

struct Port {
    PortId id;
    std::string displayName;
    PortKind kind;
};

struct Edge {
    std::string id;
    NodeId fromNodeId;
    PortId fromPortId;
    NodeId toNodeId;
    PortId toPortId;
};

// Per-(node, iteration) view onto the run's state map. Only the bound node's
// slot is reachable.
class ExecutionContext {
public:
    ExecutionContext(NodeId nodeId, int iteration, StateMap& stateMap);

    const NodeId& nodeId() const { return boundNode; }
    int iteration() const { return currentIteration; }

    Record getState() const;
    void setState(Record next);

private:
    NodeId boundNode;
    int currentIteration;
    StateMap& states;
};

using ComputeFunc = std::function<Record(const Record& inputs, ExecutionContext& ctx)>;

struct Node {
    NodeId id;
    std::string type;
    Record state; // default state used when the caller supplies none
    std::vector<Port> inputs;
    std::vector<Port> outputs;
    ComputeFunc compute;

    const Port* findInput(const PortId& portId) const;
    const Port* findOutput(const PortId& portId) const;
};

using NodePtr = std::shared_ptr<const Node>;

// Immutable-by-convention graph value. Copies share Node objects; the
// builder functions below take the graph by value and return the extended
// copy, so an lvalue argument is never modified. Move the graph in when
// building incrementally.
class Graph {
public:
    Graph() = default;

    size_t size() const { return order.size(); }
    bool contains(const NodeId& id) const { return nodes.count(id) != 0; }
    // nullptr when the id is unknown
    const Node* findNode(const NodeId& id) const;
    // Node ids in insertion order
    const std::vector<NodeId>& nodeIds() const { return order; }
    const std::vector<Edge>& edges() const { return edgeList; }

private:
    friend Graph addNode(Graph graph, NodePtr node);
    friend Graph addEdge(Graph graph, Edge edge);

    std::unordered_map<NodeId, NodePtr> nodes;
    std::vector<NodeId> order;
    std::vector<Edge> edgeList;
};

Graph createGraph();
// Throws StructuralError for a null node or if node->id is already present
Graph addNode(Graph graph, NodePtr node);
// No reference checks here; see validateGraph
Graph addEdge(Graph graph, Edge edge);
// Throws StructuralError describing the first violated invariant
void validateGraph(const Graph& graph);

} // namespace LoopFlow
