#include <circsim/blocks/cblocks.hpp>
#include <circsim/blocks/input.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

using namespace circsim::core;
using namespace circsim::blocks;
using circsim::test::virtual_options;

class CBlocksTest : public ::testing::Test {
protected:
    Input& input(const std::string& name, Value initdef) {
        return circuit.add<Input>(BlockOptions{.name = name}, Input::Config{.initdef = std::move(initdef)});
    }

    Circuit circuit{virtual_options()};
};

// ============================================================================
// FuncBlock
// ============================================================================

TEST_F(CBlocksTest, FuncBlockNamedInputsAndGroups) {
    auto& x = input("x", 2);
    input("y", 3);
    auto& f = circuit.add<FuncBlock>(BlockOptions{.name = "f"}, FuncBlock::Config{.func = [](const FuncArgs& args) {
        int64_t sum = args.named.at("a").as_int() * 100 + args.named.at("b").as_int() * 10;
        for (const auto& item : args.named.at("rest").as_list()) {
            sum += item.as_int();
        }
        return Value(sum);
    }});
    f.connect(Connections{}.input("a", "x").input("b", "y").group("rest", {"x", 1}));

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(f.output(), Value(233));

    x.put(4);
    ASSERT_TRUE(circuit.settle());
    EXPECT_EQ(f.output(), Value(435));
}

TEST_F(CBlocksTest, FuncBlockPositional) {
    input("x", 2.5);
    auto& f = circuit.add<FuncBlock>(BlockOptions{.name = "f"}, FuncBlock::Config{.func = [](const FuncArgs& args) {
        return Value(args.positional.at(0).as_double() * args.positional.at(1).as_double());
    }});
    f.connect({"x", 4});

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(f.output(), Value(10.0));
}

TEST_F(CBlocksTest, FuncBlockRequiresFunction) {
    EXPECT_THROW(circuit.add<FuncBlock>(BlockOptions{.name = "f"}, FuncBlock::Config{}), ConfigurationError);
}

TEST_F(CBlocksTest, FuncBlockSignature) {
    input("x", 1);
    auto& f = circuit.add<FuncBlock>(BlockOptions{.name = "f"}, FuncBlock::Config{
        .func = [](const FuncArgs& /*args*/) { return Value(0); },
        .signature = std::vector<SignatureItem>{SignatureItem::single("a")},
    });
    f.connect(Connections{}.input("b", "x"));

    EXPECT_THROW(circuit.initialize(), SignatureError);
}

// ============================================================================
// Logic gates
// ============================================================================

TEST_F(CBlocksTest, AndOr) {
    auto& a = input("a", true);
    auto& b = input("b", false);
    auto& gate_and = circuit.add<And>(BlockOptions{.name = "and"});
    gate_and.connect({"a", "b", true});
    auto& gate_or = circuit.add<Or>(BlockOptions{.name = "or"});
    gate_or.connect({"a", "b"});

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(gate_and.output(), Value(false));
    EXPECT_EQ(gate_or.output(), Value(true));

    a.put(false);
    ASSERT_TRUE(circuit.settle());
    EXPECT_EQ(gate_or.output(), Value(false));

    b.put(true);
    a.put(true);
    ASSERT_TRUE(circuit.settle());
    EXPECT_EQ(gate_and.output(), Value(true));
    EXPECT_EQ(gate_or.output(), Value(true));
}

TEST_F(CBlocksTest, InvertedInput) {
    input("a", true);
    auto& gate = circuit.add<And>(BlockOptions{.name = "gate"});
    gate.connect({"_not_a", true});

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(gate.output(), Value(false));
}

// ============================================================================
// Compare
// ============================================================================

TEST_F(CBlocksTest, CompareHysteresis) {
    auto& temp = input("temp", 23.0);
    auto& cmp = circuit.add<Compare>(BlockOptions{.name = "cmp"}, Compare::Config{.low = 22.0, .high = 24.0});
    cmp.connect({"temp"});

    ASSERT_TRUE(circuit.initialize());
    // the first evaluation compares with the midpoint
    EXPECT_EQ(cmp.output(), Value(true));

    const std::vector<std::pair<double, bool>> steps{
        {22.5, true}, {21.9, false}, {23.9, false}, {24.0, true}, {22.0, true}, {10, false},
    };
    for (const auto& [value, expected] : steps) {
        temp.put(value);
        ASSERT_TRUE(circuit.settle());
        EXPECT_EQ(cmp.output(), Value(expected)) << "input " << value;
    }
}

TEST_F(CBlocksTest, CompareInvalidThresholds) {
    EXPECT_THROW(circuit.add<Compare>(BlockOptions{.name = "cmp"}, Compare::Config{.low = 5.0, .high = 4.0}),
                 ConfigurationError);
}

TEST_F(CBlocksTest, CompareSingleInput) {
    input("temp", 23.0);
    circuit.add<Compare>(BlockOptions{.name = "cmp"}, Compare::Config{.low = 1.0, .high = 2.0})
        .connect({"temp", "temp"});

    EXPECT_THROW(circuit.initialize(), SignatureError);
}

// ============================================================================
// Override
// ============================================================================

TEST_F(CBlocksTest, Override) {
    input("sensor", 20);
    auto& manual = input("manual", nullptr);
    auto& ovr = circuit.add<Override>(BlockOptions{.name = "ovr"});
    ovr.connect(Connections{}.input("input", "sensor").input("override", "manual"));

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(ovr.output(), Value(20));

    manual.put(5);
    ASSERT_TRUE(circuit.settle());
    EXPECT_EQ(ovr.output(), Value(5));

    manual.put(nullptr);
    ASSERT_TRUE(circuit.settle());
    EXPECT_EQ(ovr.output(), Value(20));
}

TEST_F(CBlocksTest, OverrideCustomNullValue) {
    input("sensor", 20);
    input("manual", "auto");
    auto& ovr = circuit.add<Override>(BlockOptions{.name = "ovr"}, Override::Config{.null_value = "auto"});
    ovr.connect(Connections{}.input("input", "sensor").input("override", "manual"));

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(ovr.output(), Value(20));
}
