// main.cpp
//
// Headless LoopFlow runner. Parses CLI (CLI11), loads the JSON flow, applies
// any strategy overrides from the command line, runs the engine once and
// prints the result JSON on stdout. Diagnostics go to stderr.
#include "LoopFlowCore.hpp"
#include "LoopFlowJson.hpp"
#include "LoopFlowLog.hpp"
#include "LoopFlowNodes.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <exception>
#include <string>

int main(int argc, char** argv) {
    std::string flowPath;
    std::string strategyKind;  // empty = use the flow's strategy block
    int maxIterations = 0;     // 0 = keep flow value
    double threshold = -1.0;   // <0 = keep flow value
    std::string logLevel = "warn";
    int indent = 2;            // -1 = compact

    CLI::App app{"LoopFlow cyclic dataflow runner"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file")->required()->check(CLI::ExistingFile);
        app.add_option("--strategy", strategyKind, "Override strategy: single-pass|multi-pass|convergence")
            ->check(CLI::IsMember({"single-pass", "multi-pass", "convergence"}));
        app.add_option("--max-iterations", maxIterations, "Override iteration cap (multi-pass, convergence)")
            ->check(CLI::PositiveNumber);
        app.add_option("--threshold", threshold, "Override convergence threshold")->check(CLI::NonNegativeNumber);
        app.add_option("--log-level", logLevel, "Log level: error|warn|info|debug")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}));
        app.add_option("--indent", indent, "JSON indentation (-1 = compact)");
        app.allow_extras(false);
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    try {
        LoopFlow::setLogLevel(LoopFlow::parseLogLevel(logLevel));

        const auto registry = LoopFlow::NodeRegistry::withBuiltins();
        LoopFlow::FlowDescription flow = LoopFlow::loadFlowFile(flowPath, registry);

        LoopFlow::StrategyConfig config = flow.strategy;
        if (!strategyKind.empty()) config.kind = LoopFlow::parseStrategyKind(strategyKind);
        if (maxIterations > 0) config.maxIterations = maxIterations;
        if (threshold >= 0.0) config.threshold = threshold;

        LoopFlow::logInfo("flow '{}': nodes={} edges={} strategy={}", flowPath, flow.graph.size(),
                          flow.graph.edges().size(), LoopFlow::strategyKindName(config.kind));

        LoopFlow::LoopEngine engine(LoopFlow::makeStrategy(config));
        const LoopFlow::ExecutionResult result = engine.execute(flow.graph, flow.initialState);

        fmt::print("{}\n", LoopFlow::resultToJson(result).dump(indent));
    } catch (const std::exception& e) {
        LoopFlow::logError("{}", e.what());
        return 1;
    }
    return 0;
}
