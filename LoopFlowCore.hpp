// LoopFlow execution engine
//
// LoopEngine drives iterations over a validated Graph. Each iteration asks
// the strategy for an order and for back-edge defaults, evaluates nodes one
// at a time, then asks the strategy whether to go again. Inputs are resolved
// per edge: a source scheduled earlier in the order contributes its output
// from this iteration (forward edge); a source scheduled at or after the
// destination contributes the strategy's default (back edge).
#pragma once
#include "LoopFlowGraph.hpp"
#include "LoopFlowStrategy.hpp"
#include <future>
#include <memory>

namespace LoopFlow {

// Per-run counters (zero-alloc, filled by execute)
struct RunStats {
    unsigned long long nodesEvaluated = 0;
    unsigned long long forwardEdgesResolved = 0;
    unsigned long long backEdgesResolved = 0;
    unsigned long long evalTimeNs = 0;
};

struct ExecutionResult {
    StateMap state;    // final state per node
    OutputMap outputs; // outputs from the last executed iteration
    int iterations = 0;
    RunStats stats;
};

class LoopEngine {
public:
    // Throws ConfigurationError on a null strategy
    explicit LoopEngine(std::unique_ptr<ExecutionStrategy> strategy);

    // Every call runs on a fresh clone of the strategy, so an engine can be
    // reused and shared across threads.
    ExecutionResult execute(const Graph& graph) const;
    ExecutionResult execute(const Graph& graph, const StateMap& initialState) const;

    // Same algorithm on a std::async thread; graph and state are copied.
    std::future<ExecutionResult> executeAsync(Graph graph) const;
    std::future<ExecutionResult> executeAsync(Graph graph, StateMap initialState) const;

    const ExecutionStrategy& strategy() const { return *prototype; }

private:
    std::shared_ptr<const ExecutionStrategy> prototype;
};

} // namespace LoopFlow
