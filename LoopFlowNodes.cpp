// LoopFlowNodes.cpp
#include "LoopFlowNodes.hpp"
#include "LoopFlowErrors.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <memory>

namespace LoopFlow {

namespace {

double numberParam(const NodeId& id, const Record& parameters, const std::string& key, double defVal) {
    auto it = parameters.find(key);
    if (it == parameters.end()) return defVal;
    double v = 0.0;
    if (!numericValue(it->second, v)) {
        throw StructuralError(fmt::format("Parameter \"{}\" of node \"{}\" must be numeric", key, id));
    }
    return v;
}

} // namespace

NodePtr makeVariableNode(const NodeId& id, double initialValue) {
    auto node = std::make_shared<Node>();
    node->id = id;
    node->type = "variable";
    node->state = Record{{"value", initialValue}};
    node->inputs = {Port{"delta", "delta", PortKind::Input}};
    node->outputs = {Port{"delta", "delta", PortKind::Output}};
    node->compute = [](const Record& inputs, ExecutionContext& ctx) {
        double delta = 0.0;
        auto in = inputs.find("delta");
        if (in != inputs.end() && !numericValue(in->second, delta)) delta = 0.0;

        Record state = ctx.getState();
        double current = 0.0;
        auto it = state.find("value");
        if (it != state.end() && !numericValue(it->second, current)) current = 0.0;
        state["value"] = current + delta;
        ctx.setState(std::move(state));

        return Record{{"delta", delta}};
    };
    return node;
}

NodePtr makeConstantNode(const NodeId& id, double value) {
    auto node = std::make_shared<Node>();
    node->id = id;
    node->type = "constant";
    node->outputs = {Port{"delta", "delta", PortKind::Output}};
    node->compute = [value](const Record& /*inputs*/, ExecutionContext& /*ctx*/) {
        return Record{{"delta", value}};
    };
    return node;
}

NodeRegistry NodeRegistry::withBuiltins() {
    NodeRegistry registry;
    registry.registerKind("variable", [](const NodeId& id, const Record& params) {
        return makeVariableNode(id, numberParam(id, params, "initial", 0.0));
    });
    registry.registerKind("constant", [](const NodeId& id, const Record& params) {
        return makeConstantNode(id, numberParam(id, params, "value", 0.0));
    });
    return registry;
}

void NodeRegistry::registerKind(const std::string& type, NodeFactory factory) {
    factories[type] = std::move(factory);
}

std::vector<std::string> NodeRegistry::kinds() const {
    std::vector<std::string> out;
    out.reserve(factories.size());
    for (const auto& kv : factories) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

NodePtr NodeRegistry::create(const std::string& type, const NodeId& id, const Record& parameters) const {
    auto it = factories.find(type);
    if (it == factories.end()) {
        throw StructuralError(fmt::format("Unknown node type \"{}\" for node \"{}\"", type, id));
    }
    return it->second(id, parameters);
}

} // namespace LoopFlow
