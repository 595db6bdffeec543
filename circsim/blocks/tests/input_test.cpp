#include <circsim/blocks/input.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <stdexcept>

using namespace circsim::core;
using namespace circsim::blocks;
using circsim::test::LogCapture;
using circsim::test::virtual_options;

class InputTest : public ::testing::Test {
protected:
    LogCapture logs;
    Circuit circuit{virtual_options()};
};

TEST_F(InputTest, InitialValue) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{.initdef = "idle"});

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(in.output(), Value("idle"));
}

TEST_F(InputTest, PutSetsOutput) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{.initdef = 0});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.put(7), Value(true));
    EXPECT_EQ(in.output(), Value(7));
}

TEST_F(InputTest, PutWithoutValue) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{.initdef = 0});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_THROW(in.event("put"), BlockError);
}

TEST_F(InputTest, MissingInitialValue) {
    circuit.add<Input>(BlockOptions{.name = "in"});

    EXPECT_THROW(circuit.initialize(), InitializationError);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(InputTest, AllowedValues) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = "off",
        .allowed = std::vector<Value>{"on", "off", "auto"},
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.put("auto"), Value(true));
    EXPECT_EQ(in.put("maybe"), Value(false));
    EXPECT_EQ(in.output(), Value("auto"));
    EXPECT_TRUE(logs.contains("<Input 'in'>: Validation error: 'maybe' is not among allowed values"));
}

TEST_F(InputTest, CheckFunction) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = 0,
        .check = [](const Value& v) { return v.is_number() && v.as_double() >= 0.0; },
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.put(-1), Value(false));
    EXPECT_EQ(in.output(), Value(0));
    EXPECT_TRUE(logs.contains("Validation function rejected value -1"));
}

TEST_F(InputTest, SchemaConvertsValue) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = 0,
        .schema = [](const Value& v) {
            if (!v.is_number()) {
                throw std::invalid_argument("not a number");
            }
            return Value(static_cast<int64_t>(v.as_double()));
        },
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.put(3.7), Value(true));
    EXPECT_EQ(in.output(), Value(3));
    EXPECT_TRUE(in.output().is_int());

    EXPECT_EQ(in.put("x"), Value(false));
    EXPECT_TRUE(logs.contains("Validation schema rejected value 'x' with error: not a number"));
}

TEST_F(InputTest, InvalidInitialValue) {
    EXPECT_THROW(circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
                     .initdef = 5,
                     .allowed = std::vector<Value>{1, 2},
                 }),
                 ConfigurationError);
}

TEST_F(InputTest, AllowedValuesInConfiguration) {
    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = 1,
        .allowed = std::vector<Value>{1, 2},
    });

    EventData conf = in.get_conf();
    EXPECT_EQ(get_or(conf, "allowed"), Value(Value::List{1, 2}));
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(InputTest, RestoredValueIsValidated) {
    MemoryStore store;
    store.set(std::string(STOP_TIME_KEY), 1000.0);
    store.set("<Input 'in'>", "broken");
    circuit.set_persistent_store(&store);

    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = "off",
        .allowed = std::vector<Value>{"on", "off"},
        .persistence = {.persistent = true},
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.output(), Value("off"));
}

TEST_F(InputTest, RestoredValue) {
    MemoryStore store;
    store.set(std::string(STOP_TIME_KEY), 1000.0);
    store.set("<Input 'in'>", "on");
    circuit.set_persistent_store(&store);

    auto& in = circuit.add<Input>(BlockOptions{.name = "in"}, Input::Config{
        .initdef = "off",
        .persistence = {.persistent = true},
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(in.output(), Value("on"));
}
