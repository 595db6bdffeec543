#include <circsim/blocks/counter.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <stdexcept>
#include <string>

using namespace circsim::core;
using namespace circsim::blocks;
using circsim::test::LogCapture;
using circsim::test::virtual_options;

class CounterTest : public ::testing::Test {
protected:
    Counter& counter(Counter::Config config = {}) {
        auto& blk = circuit.add<Counter>(BlockOptions{.name = "cnt"}, std::move(config));
        if (!circuit.initialize()) {
            throw std::logic_error("circuit stopped");
        }
        return blk;
    }

    LogCapture logs;
    Circuit circuit{virtual_options()};
};

TEST_F(CounterTest, DefaultConfiguration) {
    auto& cnt = circuit.add<Counter>(BlockOptions{.name = "plain"});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(cnt.output(), Value(0));
    EXPECT_EQ(cnt.event("dec"), Value(-1));
}

TEST_F(CounterTest, CountUpAndDown) {
    auto& cnt = counter();
    EXPECT_EQ(cnt.output(), Value(0));

    EXPECT_EQ(cnt.event("inc"), Value(1));
    EXPECT_EQ(cnt.event("inc", {{"amount", 5}}), Value(6));
    EXPECT_EQ(cnt.event("dec"), Value(5));
    EXPECT_EQ(cnt.event("dec", {{"amount", 10}}), Value(-5));
    EXPECT_EQ(cnt.output(), Value(-5));
}

TEST_F(CounterTest, PutAndReset) {
    auto& cnt = counter(Counter::Config{.initdef = 10});
    EXPECT_EQ(cnt.output(), Value(10));

    EXPECT_EQ(cnt.put(42), Value(42));
    EXPECT_EQ(cnt.event("reset"), Value(10));
}

TEST_F(CounterTest, FloatingPointAmount) {
    auto& cnt = counter();

    EXPECT_EQ(cnt.event("inc", {{"amount", 0.5}}), Value(0.5));
    EXPECT_TRUE(cnt.output().is_double());
}

TEST_F(CounterTest, Modulo) {
    auto& cnt = counter(Counter::Config{.modulo = Value(4)});

    for (int i = 0; i < 5; ++i) {
        (void)cnt.event("inc");
    }
    EXPECT_EQ(cnt.output(), Value(1));

    // the result has the sign of the modulus
    EXPECT_EQ(cnt.event("dec", {{"amount", 3}}), Value(2));
    EXPECT_EQ(cnt.put(-1), Value(3));
}

TEST_F(CounterTest, NegativeModulo) {
    auto& cnt = counter(Counter::Config{.modulo = Value(-3)});

    EXPECT_EQ(cnt.put(4), Value(-2));
    EXPECT_EQ(cnt.put(-3), Value(0));
}

TEST_F(CounterTest, FloatingPointModulo) {
    auto& cnt = counter(Counter::Config{.modulo = Value(1.5)});

    EXPECT_EQ(cnt.put(4.0), Value(1.0));
    EXPECT_EQ(cnt.put(-1.0), Value(0.5));
}

TEST_F(CounterTest, InvalidModulo) {
    EXPECT_THROW(circuit.add<Counter>(BlockOptions{.name = "a"}, Counter::Config{.modulo = Value(0)}),
                 ConfigurationError);
    EXPECT_THROW(circuit.add<Counter>(BlockOptions{.name = "b"}, Counter::Config{.modulo = Value("x")}),
                 ConfigurationError);
}

TEST_F(CounterTest, InvalidAmount) {
    auto& cnt = counter();

    try {
        (void)cnt.event("inc", {{"amount", "many"}});
        FAIL() << "expected BlockError";
    } catch (const BlockError& e) {
        EXPECT_NE(std::string(e.what()).find("'amount' must be a number, got 'many'"), std::string::npos);
    }
}

TEST_F(CounterTest, Persistence) {
    MemoryStore store;
    store.set(std::string(STOP_TIME_KEY), 1000.0);
    store.set("<Counter 'cnt'>", 17);
    circuit.set_persistent_store(&store);

    auto& cnt = counter(Counter::Config{.persistence = {.persistent = true}});
    EXPECT_EQ(cnt.output(), Value(17));

    (void)cnt.event("inc");
    EXPECT_EQ(store.get("<Counter 'cnt'>"), Value(18));
}
