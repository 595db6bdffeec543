#include <circsim/blocks/repeat.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <chrono>
#include <thread>

using namespace circsim::core;
using namespace circsim::blocks;
using circsim::test::EventLog;
using circsim::test::LogCapture;
using circsim::test::TestInput;

class RepeatTest : public ::testing::Test {
protected:
    Repeat& repeat(std::optional<int64_t> count, double interval = 0.02) {
        return circuit.add<Repeat>(BlockOptions{.name = "rep"}, Repeat::Config{
            .event = Event("log", "ping"),
            .interval = duration_from_seconds(interval),
            .count = count,
        });
    }

    // let the repetitions arrive, then process them
    void wait(int ms) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        ASSERT_TRUE(circuit.settle());
    }

    LogCapture logs;
    Circuit circuit;
    EventLog& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
};

TEST_F(RepeatTest, ForwardsAndRepeats) {
    auto& rep = repeat(2);
    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(rep.output(), Value(0));

    EXPECT_EQ(rep.event("ping", {{"value", 5}}), Value(true));
    ASSERT_EQ(log.entries.size(), 1U);
    EXPECT_EQ(log.entries[0].etype, "ping");
    EXPECT_EQ(get_or(log.entries[0].data, "repeat"), Value(0));

    wait(200);
    ASSERT_EQ(log.entries.size(), 3U);
    EXPECT_EQ(get_or(log.entries[1].data, "repeat"), Value(1));
    EXPECT_EQ(get_or(log.entries[2].data, "repeat"), Value(2));
    EXPECT_EQ(get_or(log.entries[2].data, "value"), Value(5));
    EXPECT_EQ(get_or(log.entries[2].data, "source"), Value("rep"));
    EXPECT_EQ(rep.output(), Value(2));

    // the count is exhausted
    wait(100);
    EXPECT_EQ(log.entries.size(), 3U);
    circuit.shutdown();
}

TEST_F(RepeatTest, NewEventRestartsRepetition) {
    auto& rep = repeat(1);
    ASSERT_TRUE(circuit.initialize());

    (void)rep.event("ping", {{"value", "a"}});
    wait(150);
    (void)rep.event("ping", {{"value", "b"}});
    EXPECT_EQ(rep.output(), Value(0));
    wait(150);

    ASSERT_EQ(log.entries.size(), 4U);
    EXPECT_EQ(get_or(log.entries[1].data, "value"), Value("a"));
    EXPECT_EQ(get_or(log.entries[2].data, "value"), Value("b"));
    EXPECT_EQ(get_or(log.entries[2].data, "repeat"), Value(0));
    EXPECT_EQ(get_or(log.entries[3].data, "value"), Value("b"));
    EXPECT_EQ(get_or(log.entries[3].data, "repeat"), Value(1));
    circuit.shutdown();
}

TEST_F(RepeatTest, OriginalSourceIsPassedOn) {
    repeat(0);
    auto& src = circuit.add<TestInput>(BlockOptions{.name = "src", .on_output = {Event("rep", "ping")}}, 0);
    ASSERT_TRUE(circuit.initialize());
    log.entries.clear();

    (void)src.event("put", {{"value", 1}});
    ASSERT_EQ(log.entries.size(), 1U);
    EXPECT_EQ(get_or(log.entries[0].data, "orig_source"), Value("src"));
    EXPECT_EQ(get_or(log.entries[0].data, "source"), Value("rep"));

    // count 0 forwards without repeating
    wait(100);
    EXPECT_EQ(log.entries.size(), 1U);
    circuit.shutdown();
}

TEST_F(RepeatTest, OtherEventsAreUnknown) {
    auto& rep = repeat(std::nullopt);
    ASSERT_TRUE(circuit.initialize());

    EXPECT_THROW((void)rep.event("put", {{"value", 1}}), UnknownEventError);
    circuit.shutdown();
}

TEST_F(RepeatTest, InvalidConfiguration) {
    EXPECT_THROW(circuit.add<Repeat>(BlockOptions{.name = "a"}, Repeat::Config{
                     .event = Event("log"),
                     .interval = Duration::zero(),
                 }),
                 ConfigurationError);
    EXPECT_THROW(circuit.add<Repeat>(BlockOptions{.name = "b"}, Repeat::Config{
                     .event = Event("log"),
                     .interval = duration_from_seconds(1.0),
                     .count = -1,
                 }),
                 ConfigurationError);
}
