#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <stdexcept>
#include <vector>

using namespace circsim::core;
using namespace circsim::test;

class TimerTest : public ::testing::Test {
protected:
    void SetUp() override {
        circuit.add<TestInput>(BlockOptions{.name = "in"}, 0);
        ASSERT_TRUE(circuit.initialize());
    }

    TimePoint time(double seconds) { return time_from_seconds(seconds); }
    Duration seconds(double s) { return duration_from_seconds(s); }

    Circuit circuit{virtual_options(100.0)};
};

TEST_F(TimerTest, FiresInTimeOrder) {
    std::vector<int> fired;
    circuit.add_timer(time(103.0), [&fired] { fired.push_back(3); });
    circuit.add_timer(time(101.0), [&fired] { fired.push_back(1); });
    circuit.add_timer(time(102.0), [&fired] { fired.push_back(2); });
    EXPECT_EQ(circuit.pending_timers(), 3U);

    ASSERT_TRUE(circuit.run_until(time(110.0)));
    EXPECT_EQ(fired, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(circuit.pending_timers(), 0U);
    EXPECT_EQ(circuit.now(), time(110.0));
}

TEST_F(TimerTest, SameTimeKeepsInsertionOrder) {
    std::vector<int> fired;
    for (int i = 0; i < 5; ++i) {
        circuit.add_timer(time(101.0), [&fired, i] { fired.push_back(i); });
    }

    ASSERT_TRUE(circuit.advance(seconds(1.0)));
    EXPECT_EQ(fired, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(TimerTest, VirtualClockJumpsToTimer) {
    std::vector<TimePoint> seen;
    circuit.add_timer(seconds(2.5), [this, &seen] { seen.push_back(circuit.now()); });

    ASSERT_TRUE(circuit.advance(seconds(2.0)));
    EXPECT_TRUE(seen.empty());
    EXPECT_EQ(circuit.now(), time(102.0));

    ASSERT_TRUE(circuit.advance(seconds(2.0)));
    ASSERT_EQ(seen.size(), 1U);
    EXPECT_EQ(seen[0], time(102.5));
    EXPECT_EQ(circuit.now(), time(104.0));
}

TEST_F(TimerTest, Cancel) {
    bool fired = false;
    TimerId id = circuit.add_timer(seconds(1.0), [&fired] { fired = true; });
    EXPECT_TRUE(id.valid());
    EXPECT_EQ(id.when(), time(101.0));

    circuit.cancel_timer(id);
    EXPECT_FALSE(id.valid());
    // cancelling an invalid timer has no effect
    circuit.cancel_timer(id);

    ASSERT_TRUE(circuit.advance(seconds(5.0)));
    EXPECT_FALSE(fired);
}

TEST_F(TimerTest, TimerCanScheduleTimer) {
    int count = 0;
    std::function<void()> tick = [&] {
        if (++count < 3) {
            circuit.add_timer(seconds(1.0), tick);
        }
    };
    circuit.add_timer(seconds(1.0), tick);

    ASSERT_TRUE(circuit.advance(seconds(10.0)));
    EXPECT_EQ(count, 3);
}

TEST_F(TimerTest, InfiniteDelayIsRejected) {
    EXPECT_THROW(circuit.add_timer(Duration::infinite(), [] {}), std::invalid_argument);
}

TEST_F(TimerTest, TimerErrorStopsCircuit) {
    circuit.add_timer(seconds(1.0), [] { throw CircuitError("timer failure"); });

    EXPECT_THROW(circuit.advance(seconds(2.0)), CircuitError);
    EXPECT_EQ(circuit.state(), CircuitState::Terminated);
}

TEST_F(TimerTest, TerminationClearsTimers) {
    circuit.add_timer(seconds(1.0), [] {});
    circuit.shutdown();
    EXPECT_EQ(circuit.pending_timers(), 0U);
}

TEST(RealTimeTimerTest, RunUntilWaitsForTimer) {
    Circuit circuit;
    circuit.add<TestInput>(BlockOptions{.name = "in"}, 0);
    ASSERT_TRUE(circuit.initialize());

    TimePoint start = circuit.now();
    bool fired = false;
    circuit.add_timer(duration_from_milliseconds(30), [&fired] { fired = true; });

    ASSERT_TRUE(circuit.run_until(start + duration_from_milliseconds(60)));
    EXPECT_TRUE(fired);
    EXPECT_GE(circuit.now() - start, duration_from_milliseconds(60));
    circuit.shutdown();
}
