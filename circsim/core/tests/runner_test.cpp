#include <circsim/core/error.hpp>
#include <circsim/core/runner.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

using namespace circsim::core;
using namespace circsim::test;

namespace {

void wait_for_stop(const std::stop_token& token) {
    std::mutex mutex;
    std::condition_variable_any cond;
    std::unique_lock lock(mutex);
    cond.wait(lock, token, [] { return false; });
}

} // anonymous namespace

class RunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        in = &circuit.add<TestInput>(BlockOptions{.name = "in"}, 0);
    }

    LogCapture logs;
    Circuit circuit;
    TestInput* in{nullptr};
};

TEST_F(RunnerTest, FinishedTaskStopsSimulation) {
    run(circuit, {[this](std::stop_token /*token*/) {
        circuit.wait_init();
        circuit.send_event("in", "put", {{"value", 3}}).get();
    }});

    EXPECT_EQ(circuit.state(), CircuitState::Terminated);
    EXPECT_EQ(in->output(), Value(3));
    EXPECT_TRUE(logs.contains("Normal circuit simulation stop"));
}

TEST_F(RunnerTest, OtherTasksAreStopped) {
    std::atomic<bool> stopped{false};

    run(circuit, {
        [&stopped](std::stop_token token) {
            wait_for_stop(token);
            stopped = true;
        },
        [this](std::stop_token /*token*/) { circuit.wait_init(); },
    });

    EXPECT_TRUE(stopped);
}

TEST_F(RunnerTest, FailedTaskAbortsSimulation) {
    try {
        run(circuit, {[this](std::stop_token /*token*/) {
            circuit.wait_init();
            throw std::runtime_error("console closed");
        }});
        FAIL() << "expected SupportingTaskError";
    } catch (const SupportingTaskError& e) {
        EXPECT_EQ(std::string(e.what()), "supporting task #0 failed: console closed");
    }
    EXPECT_EQ(circuit.state(), CircuitState::Terminated);
}

TEST_F(RunnerTest, SimulationErrorStopsTasks) {
    std::atomic<bool> stopped{false};

    EXPECT_THROW(run(circuit, {[this, &stopped](std::stop_token token) {
        circuit.wait_init();
        circuit.abort(CircuitError("fatal"));
        wait_for_stop(token);
        stopped = true;
    }}), CircuitError);

    EXPECT_TRUE(stopped);
}

TEST_F(RunnerTest, ShutdownFromOutside) {
    std::jthread controller([this] {
        circuit.wait_init();
        circuit.shutdown();
    });

    run(circuit);
    EXPECT_EQ(circuit.state(), CircuitState::Terminated);
}
