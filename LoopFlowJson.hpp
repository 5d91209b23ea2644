// LoopFlow JSON flow descriptions
//
// Reads a flow document (nodes, connections, optional strategy block and
// initial state) into a validated Graph, and renders execution results back
// to JSON for hosts and the command-line runner.
#pragma once
#include "LoopFlowCore.hpp"
#include "LoopFlowGraph.hpp"
#include "LoopFlowNodes.hpp"
#include "LoopFlowStrategy.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace LoopFlow {

struct FlowDescription {
    Graph graph;
    StrategyConfig strategy;
    StateMap initialState;
};

// Throws StructuralError naming the offending field, or whatever
// validateGraph/NodeRegistry raise for the assembled graph.
FlowDescription loadFlow(const nlohmann::json& json, const NodeRegistry& registry);
FlowDescription loadFlowFile(const std::string& path, const NodeRegistry& registry);

// {"kind": "...", "maxIterations": N, "threshold": X}; every field optional
StrategyConfig strategyFromJson(const nlohmann::json& json);

// Object of string/int/float/bool leaves; bools become int 0/1
Record recordFromJson(const nlohmann::json& json, const std::string& where);
nlohmann::json valueToJson(const Value& v);
nlohmann::json recordToJson(const Record& record);

// {"iterations", "outputs", "state", "stats"}; keys come out sorted
nlohmann::json resultToJson(const ExecutionResult& result);

} // namespace LoopFlow
