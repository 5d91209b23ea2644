// tests/NodesTests.cpp
// Reference node kinds and the type-tag registry.

#include "LoopFlowErrors.hpp"
#include "LoopFlowNodes.hpp"
#include "TestSupport.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace LoopFlow;
using namespace LoopFlowTest;

TEST(VariableNode, AccumulatesDeltaIntoState) {
    NodePtr node = makeVariableNode("V", 2.0);
    EXPECT_EQ(node->type, "variable");
    EXPECT_DOUBLE_EQ(number(node->state, "value"), 2.0);
    ASSERT_NE(node->findInput("delta"), nullptr);
    ASSERT_NE(node->findOutput("delta"), nullptr);

    StateMap states{{"V", node->state}};
    ExecutionContext ctx("V", 1, states);
    const Record out = node->compute(Record{{"delta", 3}}, ctx);
    EXPECT_DOUBLE_EQ(number(out, "delta"), 3.0);
    EXPECT_DOUBLE_EQ(number(states.at("V"), "value"), 5.0);
}

TEST(VariableNode, MissingOrTextDeltaCountsAsZero) {
    NodePtr node = makeVariableNode("V");
    StateMap states;
    ExecutionContext ctx("V", 1, states);

    EXPECT_DOUBLE_EQ(number(node->compute(Record{}, ctx), "delta"), 0.0);
    EXPECT_DOUBLE_EQ(number(node->compute(Record{{"delta", std::string("x")}}, ctx), "delta"), 0.0);
    EXPECT_DOUBLE_EQ(number(states.at("V"), "value"), 0.0);
}

TEST(ConstantNode, EmitsFixedValue) {
    NodePtr node = makeConstantNode("K", -1.25);
    EXPECT_TRUE(node->inputs.empty());
    EXPECT_TRUE(node->state.empty());

    StateMap states;
    ExecutionContext ctx("K", 7, states);
    EXPECT_DOUBLE_EQ(number(node->compute(Record{{"delta", 100.0}}, ctx), "delta"), -1.25);
    EXPECT_TRUE(states.empty());
}

TEST(NodeRegistry, BuiltinsCreateConfiguredNodes) {
    const NodeRegistry registry = NodeRegistry::withBuiltins();
    EXPECT_EQ(registry.kinds(), (std::vector<std::string>{"constant", "variable"}));
    EXPECT_TRUE(registry.knows("variable"));
    EXPECT_FALSE(registry.knows("oscillator"));

    NodePtr v = registry.create("variable", "V", Record{{"initial", 1.5f}});
    EXPECT_EQ(v->id, "V");
    EXPECT_DOUBLE_EQ(number(v->state, "value"), 1.5);

    NodePtr k = registry.create("constant", "K", Record{});
    StateMap states;
    ExecutionContext ctx("K", 1, states);
    EXPECT_DOUBLE_EQ(number(k->compute(Record{}, ctx), "delta"), 0.0);
}

TEST(NodeRegistry, UnknownTypeRejected) {
    const NodeRegistry registry = NodeRegistry::withBuiltins();
    try {
        registry.create("oscillator", "P", Record{});
        FAIL() << "expected StructuralError";
    } catch (const StructuralError& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("oscillator"), std::string::npos);
        EXPECT_NE(msg.find("\"P\""), std::string::npos);
    }
}

TEST(NodeRegistry, NonNumericParameterRejected) {
    const NodeRegistry registry = NodeRegistry::withBuiltins();
    EXPECT_THROW(registry.create("constant", "K", Record{{"value", std::string("five")}}), StructuralError);
}

TEST(NodeRegistry, CustomKindsCanReplaceBuiltins) {
    NodeRegistry registry = NodeRegistry::withBuiltins();
    registry.registerKind("constant", [](const NodeId& id, const Record&) { return makeConstantNode(id, 42.0); });
    registry.registerKind("seed", [](const NodeId& id, const Record&) { return makeVariableNode(id, 9.0); });

    EXPECT_EQ(registry.kinds(), (std::vector<std::string>{"constant", "seed", "variable"}));

    NodePtr k = registry.create("constant", "K", Record{{"value", 1}});
    StateMap states;
    ExecutionContext ctx("K", 1, states);
    EXPECT_DOUBLE_EQ(number(k->compute(Record{}, ctx), "delta"), 42.0);
    EXPECT_DOUBLE_EQ(number(registry.create("seed", "S", Record{})->state, "value"), 9.0);
}
