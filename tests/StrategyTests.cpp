// tests/StrategyTests.cpp
// Strategy construction, continuation rules, back-edge defaults and the
// configuration factory.

#include "LoopFlowErrors.hpp"
#include "LoopFlowStrategy.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace LoopFlow;
using namespace LoopFlowTest;

namespace {

OutputMap outputsOf(double a, double b) {
    OutputMap out;
    out["A"] = Record{{"delta", a}};
    out["B"] = Record{{"delta", b}};
    return out;
}

} // namespace

// =============================================================================
// SinglePass
// =============================================================================

TEST(SinglePass, StopsAfterFirstIteration) {
    SinglePassStrategy s;
    EXPECT_TRUE(s.shouldContinue(0, {}));
    EXPECT_FALSE(s.shouldContinue(1, {}));
    EXPECT_FALSE(s.shouldContinue(2, {}));
}

TEST(SinglePass, NeverSuppliesBackEdgeValues) {
    SinglePassStrategy s;
    const OutputMap prev = outputsOf(1.0, 2.0);
    EXPECT_TRUE(s.backEdgeDefaults(1, nullptr).empty());
    EXPECT_TRUE(s.backEdgeDefaults(2, &prev).empty());
}

TEST(SinglePass, OrderMatchesTopology) {
    SinglePassStrategy s;
    EXPECT_EQ(s.order(feedbackGraph()), (std::vector<NodeId>{"INPUT", "A", "B", "C"}));
}

// =============================================================================
// MultiPass
// =============================================================================

TEST(MultiPass, RejectsNonPositiveIterations) {
    EXPECT_THROW(MultiPassStrategy(0), ConfigurationError);
    EXPECT_THROW(MultiPassStrategy(-3), ConfigurationError);
    EXPECT_NO_THROW(MultiPassStrategy(1));
}

TEST(MultiPass, ContinuesUntilLimit) {
    MultiPassStrategy s(3);
    EXPECT_EQ(s.maxIterations(), 3);
    EXPECT_TRUE(s.shouldContinue(1, {}));
    EXPECT_TRUE(s.shouldContinue(2, {}));
    EXPECT_FALSE(s.shouldContinue(3, {}));
}

TEST(MultiPass, BackEdgeDefaultsFromPreviousOutputs) {
    MultiPassStrategy s(5);
    OutputMap prev = outputsOf(1.5, -2.0);
    prev["B"]["label"] = std::string("ignored");
    prev["C"] = Record{{"count", 4}};

    EXPECT_TRUE(s.backEdgeDefaults(1, &prev).empty());
    EXPECT_TRUE(s.backEdgeDefaults(2, nullptr).empty());

    const BackEdgeValues values = s.backEdgeDefaults(2, &prev);
    EXPECT_EQ(values.size(), 3u);
    EXPECT_DOUBLE_EQ(values.at("A.delta"), 1.5);
    EXPECT_DOUBLE_EQ(values.at("B.delta"), -2.0);
    EXPECT_DOUBLE_EQ(values.at("C.count"), 4.0);
    EXPECT_EQ(values.count("B.label"), 0u);
}

// =============================================================================
// Convergence
// =============================================================================

TEST(Convergence, RejectsBadArguments) {
    EXPECT_THROW(ConvergenceStrategy(-0.1), ConfigurationError);
    EXPECT_THROW(ConvergenceStrategy(0.1, 0), ConfigurationError);
    ConvergenceStrategy s(0.25);
    EXPECT_DOUBLE_EQ(s.threshold(), 0.25);
    EXPECT_EQ(s.maxIterations(), ConvergenceStrategy::defaultMaxIterations);
}

TEST(Convergence, FirstCallStoresBaseline) {
    ConvergenceStrategy s(1.0, 10);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));
    // Within threshold of the baseline
    EXPECT_FALSE(s.shouldContinue(2, outputsOf(1.5, 1.2)));
}

TEST(Convergence, ContinuesWhileOutputsMove) {
    ConvergenceStrategy s(0.1, 10);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));
    EXPECT_TRUE(s.shouldContinue(2, outputsOf(2.0, 1.0)));
    EXPECT_TRUE(s.shouldContinue(3, outputsOf(2.05, 1.5)));
    EXPECT_FALSE(s.shouldContinue(4, outputsOf(2.06, 1.51)));
}

TEST(Convergence, DifferenceEqualToThresholdIsNotConverged) {
    ConvergenceStrategy s(0.5, 10);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));
    EXPECT_TRUE(s.shouldContinue(2, outputsOf(1.5, 1.0)));
}

TEST(Convergence, ZeroThresholdNeverConverges) {
    ConvergenceStrategy s(0.0, 4);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));
    EXPECT_TRUE(s.shouldContinue(2, outputsOf(1.0, 1.0)));
    EXPECT_TRUE(s.shouldContinue(3, outputsOf(1.0, 1.0)));
    EXPECT_FALSE(s.shouldContinue(4, outputsOf(1.0, 1.0)));
}

TEST(Convergence, StopsAtLimitEvenWhenMoving) {
    ConvergenceStrategy s(0.1, 2);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));
    EXPECT_FALSE(s.shouldContinue(2, outputsOf(100.0, -100.0)));
}

TEST(Convergence, ShapeChangesAreNotConverged) {
    ConvergenceStrategy s(1.0, 10);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));

    // New node absent from the previous snapshot
    OutputMap grown = outputsOf(1.0, 1.0);
    grown["C"] = Record{{"delta", 0.0}};
    EXPECT_TRUE(s.shouldContinue(2, grown));

    // Node dropped: sizes differ
    EXPECT_TRUE(s.shouldContinue(3, outputsOf(1.0, 1.0)));

    // Non-numeric current fields are not compared
    OutputMap typed = outputsOf(1.0, 1.0);
    typed["A"]["delta"] = std::string("n/a");
    EXPECT_FALSE(s.shouldContinue(4, typed));

    // Numeric field that was a string before
    EXPECT_TRUE(s.shouldContinue(5, outputsOf(1.0, 1.0)));

    // Stable again
    EXPECT_FALSE(s.shouldContinue(6, outputsOf(1.0, 1.0)));
}

TEST(Convergence, CloneStartsWithoutHistory) {
    ConvergenceStrategy s(1.0, 10);
    EXPECT_TRUE(s.shouldContinue(1, outputsOf(1.0, 1.0)));

    auto fresh = s.clone();
    EXPECT_STREQ(fresh->name(), "convergence");
    // A fresh instance treats its first call as the baseline
    EXPECT_TRUE(fresh->shouldContinue(1, outputsOf(1.0, 1.0)));
    EXPECT_FALSE(fresh->shouldContinue(2, outputsOf(1.0, 1.0)));
}

// =============================================================================
// Configuration
// =============================================================================

TEST(StrategyConfig, ParsesKnownKinds) {
    EXPECT_EQ(parseStrategyKind("single-pass"), StrategyKind::SinglePass);
    EXPECT_EQ(parseStrategyKind("multi-pass"), StrategyKind::MultiPass);
    EXPECT_EQ(parseStrategyKind("convergence"), StrategyKind::Convergence);
    EXPECT_THROW(parseStrategyKind("fixed-point"), ConfigurationError);
    EXPECT_STREQ(strategyKindName(StrategyKind::MultiPass), "multi-pass");
}

TEST(StrategyConfig, FactoryBuildsEachVariant) {
    StrategyConfig config;
    EXPECT_STREQ(makeStrategy(config)->name(), "single-pass");

    config.kind = StrategyKind::MultiPass;
    config.maxIterations = 7;
    auto multi = makeStrategy(config);
    ASSERT_NE(dynamic_cast<MultiPassStrategy*>(multi.get()), nullptr);
    EXPECT_EQ(static_cast<MultiPassStrategy&>(*multi).maxIterations(), 7);

    config.kind = StrategyKind::Convergence;
    config.threshold = 0.01;
    auto conv = makeStrategy(config);
    ASSERT_NE(dynamic_cast<ConvergenceStrategy*>(conv.get()), nullptr);
    EXPECT_DOUBLE_EQ(static_cast<ConvergenceStrategy&>(*conv).threshold(), 0.01);
    EXPECT_EQ(static_cast<ConvergenceStrategy&>(*conv).maxIterations(), 7);
}

TEST(StrategyConfig, FactoryPropagatesBadArguments) {
    StrategyConfig config;
    config.kind = StrategyKind::MultiPass;
    config.maxIterations = 0;
    EXPECT_THROW(makeStrategy(config), ConfigurationError);

    config.kind = StrategyKind::Convergence;
    config.maxIterations = 10;
    config.threshold = -1.0;
    EXPECT_THROW(makeStrategy(config), ConfigurationError);
}
