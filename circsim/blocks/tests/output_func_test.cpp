#include <circsim/blocks/input.hpp>
#include <circsim/blocks/output_func.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <stdexcept>
#include <vector>

using namespace circsim::core;
using namespace circsim::blocks;
using circsim::test::EventLog;
using circsim::test::LogCapture;
using circsim::test::virtual_options;

class OutputFuncTest : public ::testing::Test {
protected:
    LogCapture logs;
    Circuit circuit{virtual_options()};
    std::vector<EventData> calls;
};

TEST_F(OutputFuncTest, CalledWithPayload) {
    auto& out = circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{
        .func = [this](const EventData& data) {
            calls.push_back(data);
            return Value(get_or(data, "value").as_int() * 2);
        },
    });
    circuit.add<Input>(BlockOptions{.name = "in", .on_output = {Event("out")}}, Input::Config{.initdef = 1});

    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(out.output(), Value(false));
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(get_or(calls[0], "source"), Value("in"));
    EXPECT_EQ(get_or(calls[0], "trigger"), Value("output"));
    EXPECT_EQ(get_or(calls[0], "value"), Value(1));

    EXPECT_EQ(out.put(21), Value(Value::List{"result", 42}));
}

TEST_F(OutputFuncTest, SuccessEvents) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    auto& out = circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{
        .func = [](const EventData& /*data*/) { return Value("ok"); },
        .on_success = {Event("log", "done")},
        .on_error = {Event("log", "failed")},
    });
    ASSERT_TRUE(circuit.initialize());

    (void)out.put(1);
    ASSERT_EQ(log.entries.size(), 1U);
    EXPECT_EQ(log.entries[0].etype, "done");
    EXPECT_EQ(get_or(log.entries[0].data, "value"), Value("ok"));
    EXPECT_EQ(get_or(log.entries[0].data, "trigger"), Value("success"));
}

TEST_F(OutputFuncTest, ErrorDoesNotStopCircuit) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    auto& out = circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{
        .func = [](const EventData& /*data*/) -> Value { throw std::runtime_error("device busy"); },
        .on_success = {Event("log", "done")},
        .on_error = {Event("log", "failed")},
    });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(out.put(1), Value(Value::List{"error", "device busy"}));
    EXPECT_TRUE(circuit.is_ready());
    ASSERT_EQ(log.entries.size(), 1U);
    EXPECT_EQ(log.entries[0].etype, "failed");
    EXPECT_EQ(get_or(log.entries[0].data, "error"), Value("device busy"));
    EXPECT_TRUE(logs.contains("<OutputFunc 'out'>: output function failed"));
}

TEST_F(OutputFuncTest, StopData) {
    circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{
        .func = [this](const EventData& data) {
            calls.push_back(data);
            return Value();
        },
        .stop_data = EventData{{"value", "off"}},
    });
    ASSERT_TRUE(circuit.initialize());
    EXPECT_TRUE(calls.empty());

    circuit.shutdown();
    ASSERT_EQ(calls.size(), 1U);
    EXPECT_EQ(get_or(calls[0], "value"), Value("off"));
}

TEST_F(OutputFuncTest, UnknownEventDestination) {
    circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{
        .func = [](const EventData& /*data*/) { return Value(); },
        .on_success = {Event("missing")},
    });

    EXPECT_THROW(circuit.finalize(), ConfigurationError);
}

TEST_F(OutputFuncTest, RequiresFunction) {
    EXPECT_THROW(circuit.add<OutputFunc>(BlockOptions{.name = "out"}, OutputFunc::Config{}), ConfigurationError);
}
