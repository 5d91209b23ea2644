// LoopFlowStrategy.cpp
//
// Built-in strategies. All three order nodes with computeEvaluationOrder;
// they differ in how many passes run and what back edges see.
#include "LoopFlowStrategy.hpp"
#include "LoopFlowErrors.hpp"
#include "LoopFlowTopology.hpp"
#include <cmath>
#include <fmt/core.h>

namespace LoopFlow {

std::string backEdgeKey(const NodeId& nodeId, const PortId& portId) {
    return nodeId + "." + portId;
}

BackEdgeValues collectBackEdgeValues(int iteration, const OutputMap* previousOutputs) {
    BackEdgeValues values;
    if (iteration == 1 || !previousOutputs) return values;
    for (const auto& [nodeId, record] : *previousOutputs) {
        for (const auto& [field, v] : record) {
            double d = 0.0;
            if (numericValue(v, d)) values[backEdgeKey(nodeId, field)] = d;
        }
    }
    return values;
}

// SinglePassStrategy

std::vector<NodeId> SinglePassStrategy::order(const Graph& graph) const {
    return computeEvaluationOrder(graph);
}

bool SinglePassStrategy::shouldContinue(int iteration, const OutputMap& /*currentOutputs*/) {
    return iteration < 1;
}

BackEdgeValues SinglePassStrategy::backEdgeDefaults(int /*iteration*/, const OutputMap* /*previousOutputs*/) const {
    return BackEdgeValues{};
}

std::unique_ptr<ExecutionStrategy> SinglePassStrategy::clone() const {
    return std::make_unique<SinglePassStrategy>();
}

// MultiPassStrategy

MultiPassStrategy::MultiPassStrategy(int maxIterations) : maxIter(maxIterations) {
    if (maxIterations < 1) {
        throw ConfigurationError(fmt::format("maxIterations must be at least 1 (got {})", maxIterations));
    }
}

std::vector<NodeId> MultiPassStrategy::order(const Graph& graph) const {
    return computeEvaluationOrder(graph);
}

bool MultiPassStrategy::shouldContinue(int iteration, const OutputMap& /*currentOutputs*/) {
    return iteration < maxIter;
}

BackEdgeValues MultiPassStrategy::backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const {
    return collectBackEdgeValues(iteration, previousOutputs);
}

std::unique_ptr<ExecutionStrategy> MultiPassStrategy::clone() const {
    return std::make_unique<MultiPassStrategy>(maxIter);
}

// ConvergenceStrategy

ConvergenceStrategy::ConvergenceStrategy(double threshold, int maxIterations)
    : epsilon(threshold), maxIter(maxIterations) {
    if (threshold < 0.0) {
        throw ConfigurationError(fmt::format("threshold must be non-negative (got {})", threshold));
    }
    if (maxIterations < 1) {
        throw ConfigurationError(fmt::format("maxIterations must be at least 1 (got {})", maxIterations));
    }
}

std::vector<NodeId> ConvergenceStrategy::order(const Graph& graph) const {
    return computeEvaluationOrder(graph);
}

bool ConvergenceStrategy::shouldContinue(int iteration, const OutputMap& currentOutputs) {
    if (iteration >= maxIter) return false;

    if (!haveBaseline) {
        lastSnapshot = currentOutputs;
        haveBaseline = true;
        return true;
    }

    const bool converged = hasConverged(lastSnapshot, currentOutputs);
    lastSnapshot = currentOutputs;
    return !converged;
}

bool ConvergenceStrategy::hasConverged(const OutputMap& previous, const OutputMap& current) const {
    for (const auto& [nodeId, record] : current) {
        auto prevIt = previous.find(nodeId);
        if (prevIt == previous.end()) return false;
        const Record& prevRecord = prevIt->second;

        for (const auto& [field, v] : record) {
            double now = 0.0;
            if (!numericValue(v, now)) continue;
            auto fieldIt = prevRecord.find(field);
            double before = 0.0;
            if (fieldIt == prevRecord.end() || !numericValue(fieldIt->second, before)) return false;
            if (std::fabs(now - before) >= epsilon) return false;
        }
    }
    return previous.size() == current.size();
}

BackEdgeValues ConvergenceStrategy::backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const {
    return collectBackEdgeValues(iteration, previousOutputs);
}

std::unique_ptr<ExecutionStrategy> ConvergenceStrategy::clone() const {
    return std::make_unique<ConvergenceStrategy>(epsilon, maxIter);
}

// Configuration

StrategyKind parseStrategyKind(const std::string& text) {
    if (text == "single-pass") return StrategyKind::SinglePass;
    if (text == "multi-pass") return StrategyKind::MultiPass;
    if (text == "convergence") return StrategyKind::Convergence;
    throw ConfigurationError(fmt::format("Unknown strategy '{}' (expected single-pass|multi-pass|convergence)", text));
}

const char* strategyKindName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::SinglePass: return "single-pass";
        case StrategyKind::MultiPass: return "multi-pass";
        case StrategyKind::Convergence: return "convergence";
    }
    return "?";
}

std::unique_ptr<ExecutionStrategy> makeStrategy(const StrategyConfig& config) {
    switch (config.kind) {
        case StrategyKind::SinglePass: return std::make_unique<SinglePassStrategy>();
        case StrategyKind::MultiPass: return std::make_unique<MultiPassStrategy>(config.maxIterations);
        case StrategyKind::Convergence: return std::make_unique<ConvergenceStrategy>(config.threshold, config.maxIterations);
    }
    throw ConfigurationError("Unknown strategy kind");
}

} // namespace LoopFlow
