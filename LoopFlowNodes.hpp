// LoopFlow reference nodes
//
// Two small node kinds used by the runner and the tests, plus a registry that
// maps a type tag to a factory so flow descriptions can name node kinds.
// Hosts register their own kinds alongside the built-ins.
#pragma once
#include "LoopFlowGraph.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LoopFlow {

// Accumulator: state {value}; adds its summed "delta" input to value and
// emits the same delta on output "delta".
NodePtr makeVariableNode(const NodeId& id, double initialValue = 0.0);

// Emits a fixed "delta" every iteration; no inputs, empty state.
NodePtr makeConstantNode(const NodeId& id, double value);

using NodeFactory = std::function<NodePtr(const NodeId& id, const Record& parameters)>;

class NodeRegistry {
public:
    // "variable" (parameter "initial") and "constant" (parameter "value")
    static NodeRegistry withBuiltins();

    // Replaces any factory already registered under type
    void registerKind(const std::string& type, NodeFactory factory);
    bool knows(const std::string& type) const { return factories.count(type) != 0; }
    std::vector<std::string> kinds() const;

    // Throws StructuralError for an unknown type
    NodePtr create(const std::string& type, const NodeId& id, const Record& parameters) const;

private:
    std::unordered_map<std::string, NodeFactory> factories;
};

} // namespace LoopFlow
