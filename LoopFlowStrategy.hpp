// LoopFlow execution strategies
//
// A strategy decides three things for the engine: the node order of each
// iteration, whether another iteration runs, and which values stand in for
// back edges (edges whose source is scheduled at or after its destination).
#pragma once
#include "LoopFlowGraph.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace LoopFlow {

// Keyed "nodeId.portId"
using BackEdgeValues = std::unordered_map<std::string, double>;

std::string backEdgeKey(const NodeId& nodeId, const PortId& portId);

class ExecutionStrategy {
public:
    virtual ~ExecutionStrategy() = default;

    virtual std::vector<NodeId> order(const Graph& graph) const = 0;
    // iteration is the number of iterations completed so far
    virtual bool shouldContinue(int iteration, const OutputMap& currentOutputs) = 0;
    // previousOutputs is null on the first pass
    virtual BackEdgeValues backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const = 0;

    virtual const char* name() const = 0;
    // Fresh instance with the same configuration and no accumulated history
    virtual std::unique_ptr<ExecutionStrategy> clone() const = 0;
};

// Every numeric field of every node's previous output, keyed nodeId.field.
// Empty on iteration 1 or without history.
BackEdgeValues collectBackEdgeValues(int iteration, const OutputMap* previousOutputs);

class SinglePassStrategy : public ExecutionStrategy {
public:
    std::vector<NodeId> order(const Graph& graph) const override;
    bool shouldContinue(int iteration, const OutputMap& currentOutputs) override;
    BackEdgeValues backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const override;
    const char* name() const override { return "single-pass"; }
    std::unique_ptr<ExecutionStrategy> clone() const override;
};

class MultiPassStrategy : public ExecutionStrategy {
public:
    // Throws ConfigurationError if maxIterations < 1
    explicit MultiPassStrategy(int maxIterations);

    std::vector<NodeId> order(const Graph& graph) const override;
    bool shouldContinue(int iteration, const OutputMap& currentOutputs) override;
    BackEdgeValues backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const override;
    const char* name() const override { return "multi-pass"; }
    std::unique_ptr<ExecutionStrategy> clone() const override;

    int maxIterations() const { return maxIter; }

private:
    int maxIter;
};

class ConvergenceStrategy : public ExecutionStrategy {
public:
    static constexpr int defaultMaxIterations = 100;

    // Throws ConfigurationError if threshold < 0 or maxIterations < 1
    explicit ConvergenceStrategy(double threshold, int maxIterations = defaultMaxIterations);

    std::vector<NodeId> order(const Graph& graph) const override;
    bool shouldContinue(int iteration, const OutputMap& currentOutputs) override;
    BackEdgeValues backEdgeDefaults(int iteration, const OutputMap* previousOutputs) const override;
    const char* name() const override { return "convergence"; }
    std::unique_ptr<ExecutionStrategy> clone() const override;

    double threshold() const { return epsilon; }
    int maxIterations() const { return maxIter; }

private:
    bool hasConverged(const OutputMap& previous, const OutputMap& current) const;

    double epsilon;
    int maxIter;
    bool haveBaseline = false;
    OutputMap lastSnapshot;
};

enum class StrategyKind { SinglePass, MultiPass, Convergence };

struct StrategyConfig {
    StrategyKind kind = StrategyKind::SinglePass;
    int maxIterations = ConvergenceStrategy::defaultMaxIterations;
    double threshold = 0.0;
};

// "single-pass" | "multi-pass" | "convergence"; ConfigurationError otherwise
StrategyKind parseStrategyKind(const std::string& text);
const char* strategyKindName(StrategyKind kind);
std::unique_ptr<ExecutionStrategy> makeStrategy(const StrategyConfig& config);

} // namespace LoopFlow
