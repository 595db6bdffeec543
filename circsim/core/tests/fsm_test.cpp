#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>
#include <circsim/core/fsm.hpp>

#include <gtest/gtest.h>

#include "test_blocks.hpp"

#include <string>
#include <vector>

using namespace circsim::core;
using namespace circsim::test;

namespace {

class Door : public Fsm {
public:
    Door(Circuit& circuit, BlockOptions options, FsmOptions fsm_options = {})
        : Fsm(circuit, control_table(), std::move(options), std::move(fsm_options)) {}

    static const FsmTable& control_table() {
        static const FsmTable table = FsmBuilder("Door")
            .states({"closed", "open", "locked"})
            .transition("open", "closed", "open")
            .transition("close", "open", "closed")
            .transition("lock", "closed", "locked")
            .transition("unlock", "locked", "closed")
            .cond("lock", &Door::cond_lock)
            .enter("open", &Door::enter_open)
            .exit("open", &Door::exit_open)
            .build();
        return table;
    }

    bool allow_lock{true};
    std::vector<std::string> actions;

private:
    bool cond_lock(const EventData& /*data*/) { return allow_lock; }
    void enter_open(const EventData& /*data*/) { actions.emplace_back("enter open"); }
    void exit_open(const EventData& /*data*/) { actions.emplace_back("exit open"); }
};

// "on" is a timed state returning to "off"
class Pulse : public Fsm {
public:
    Pulse(Circuit& circuit, BlockOptions options, FsmOptions fsm_options = {})
        : Fsm(circuit, control_table(), std::move(options), std::move(fsm_options)) {}

    static const FsmTable& control_table() {
        static const FsmTable table = FsmBuilder("Pulse")
            .states({"off"})
            .timer("on", duration_from_seconds(2.0), go_to("off"))
            .timer("pending", std::nullopt, "fire")
            .transition("fire", "off", "on")
            .transition("fire", "pending", "on")
            .transition("arm", "off", "pending")
            .build();
        return table;
    }

protected:
    [[nodiscard]] Value calc_output() const override { return state() == "on"; }
};

// entering "a" or "b" immediately requests the next state
class Chain : public Fsm {
public:
    Chain(Circuit& circuit, BlockOptions options, FsmOptions fsm_options = {})
        : Fsm(circuit, control_table(), std::move(options), std::move(fsm_options)) {}

    static const FsmTable& control_table() {
        static const FsmTable table = FsmBuilder("Chain")
            .states({"idle", "a", "b", "done", "loop1", "loop2", "split"})
            .transition("go", "idle", "a")
            .transition("next", "a", "b")
            .transition("next", "b", "done")
            .transition("spin", "idle", "loop1")
            .transition("spin", "loop1", "loop2")
            .transition("spin", "loop2", "loop1")
            .transition("twice", "idle", "split")
            .transition_any("reset", "idle")
            .enter("a", &Chain::request_next)
            .enter("b", &Chain::request_next)
            .enter("loop1", &Chain::request_spin)
            .enter("loop2", &Chain::request_spin)
            .enter("split", &Chain::request_two)
            .exit("a", &Chain::record_exit)
            .build();
        return table;
    }

    int exits{0};

private:
    void request_next(const EventData& /*data*/) { event("next"); }
    void request_spin(const EventData& /*data*/) { event("spin"); }
    void request_two(const EventData& /*data*/) {
        event("reset");
        event("reset");
    }
    void record_exit(const EventData& /*data*/) { ++exits; }
};

// a transition from one state shadows the transition from any state
class Tiers : public Fsm {
public:
    Tiers(Circuit& circuit, BlockOptions options)
        : Fsm(circuit, control_table(), std::move(options)) {}

    static const FsmTable& control_table() {
        static const FsmTable table = FsmBuilder("Tiers")
            .states({"s1", "s2", "s3", "s4"})
            .transition("ev", "s1", "s2")
            .transition_any("ev", "s3")
            .build();
        return table;
    }
};

} // anonymous namespace

class FsmTest : public ::testing::Test {
protected:
    Circuit circuit{virtual_options()};

    Duration seconds(double s) { return duration_from_seconds(s); }
};

// ============================================================================
// Table construction
// ============================================================================

TEST_F(FsmTest, BuilderRejectsInvalidTables) {
    EXPECT_THROW((void)FsmBuilder("T").build(), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a", "a"}).build(), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).transition("e", "a", "b").build(), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).transition("e", "x", "a").build(), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).transition("", "a", "a").build(), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).transition("e", "", "a"), ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T")
                     .states({"a", "b"})
                     .transition("e", "a", "b")
                     .transition("e", "a", "a")
                     .build(),
                 ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).timer("a", seconds(1), "nothing").build(),
                 ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).timer("a", seconds(1), go_to("b")).build(),
                 ConfigurationError);
    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).timer("a", seconds(-1), go_to("a")).build(),
                 ConfigurationError);
}

TEST_F(FsmTest, EventNameCollidesWithHandler) {
    auto& in = circuit.add<TestInput>(BlockOptions{.name = "in"}, 0);

    EXPECT_THROW((void)FsmBuilder("T").states({"a"}).transition("put", "a", "a").build(in.handlers()),
                 ConfigurationError);
}

TEST_F(FsmTest, TableQueries) {
    const FsmTable& table = Pulse::control_table();

    EXPECT_EQ(table.type_name(), "Pulse");
    EXPECT_EQ(table.default_state(), "off");
    EXPECT_EQ(table.states(), (std::vector<std::string>{"off", "on", "pending"}));
    EXPECT_TRUE(table.has_event("arm"));
    EXPECT_FALSE(table.has_event("on"));
    EXPECT_NE(table.timed_state("on"), nullptr);
    EXPECT_EQ(table.timed_state("off"), nullptr);
    EXPECT_EQ(table.chain_limit(), 9U);
}

TEST_F(FsmTest, InvalidInstanceOptions) {
    EXPECT_THROW(circuit.add<Door>(BlockOptions{.name = "d1"}, FsmOptions{.initdef = "ajar"}),
                 ConfigurationError);
    EXPECT_THROW(circuit.add<Door>(BlockOptions{.name = "d2"}, FsmOptions{.on_enter = {{"ajar", {}}}}),
                 ConfigurationError);
    EXPECT_THROW(circuit.add<Door>(BlockOptions{.name = "d3"}, FsmOptions{.durations = {{"open", seconds(1)}}}),
                 ConfigurationError);
    EXPECT_THROW(circuit.add<Door>(BlockOptions{.name = "d4"},
                                   FsmOptions{.cond = {{"push", [](Fsm&, const EventData&) { return true; }}}}),
                 ConfigurationError);
}

// ============================================================================
// Transitions
// ============================================================================

TEST_F(FsmTest, InitialState) {
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"});
    auto& locked = circuit.add<Door>(BlockOptions{.name = "locked"}, FsmOptions{.initdef = "locked"});

    EXPECT_FALSE(door.state().has_value());
    ASSERT_TRUE(circuit.initialize());
    EXPECT_EQ(door.state(), "closed");
    EXPECT_EQ(door.output(), Value("closed"));
    EXPECT_EQ(locked.state(), "locked");
}

TEST_F(FsmTest, TransitionsAndActions) {
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(door.event("open"), Value(true));
    EXPECT_EQ(door.state(), "open");
    EXPECT_EQ(door.event("close"), Value(true));
    EXPECT_EQ(door.state(), "closed");
    EXPECT_EQ(door.actions, (std::vector<std::string>{"enter open", "exit open"}));
}

TEST_F(FsmTest, NoTransition) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"},
                                   FsmOptions{.on_notrans = {Event("log", "notrans")}});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(door.event("close"), Value(false));
    EXPECT_EQ(door.state(), "closed");
    ASSERT_EQ(log.entries.size(), 1U);
    EXPECT_EQ(get_or(log.entries[0].data, "event"), Value("close"));
    EXPECT_EQ(get_or(log.entries[0].data, "state"), Value("closed"));
    EXPECT_EQ(get_or(log.entries[0].data, "trigger"), Value("notrans"));
}

TEST_F(FsmTest, UnknownEvent) {
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_THROW(door.event("kick"), UnknownEventError);
}

TEST_F(FsmTest, GuardsMustAllApprove) {
    bool instance_ok = true;
    auto& door = circuit.add<Door>(
        BlockOptions{.name = "door"},
        FsmOptions{.cond = {{"lock", [&instance_ok](Fsm&, const EventData&) { return instance_ok; }}}});
    ASSERT_TRUE(circuit.initialize());

    door.allow_lock = false;
    EXPECT_EQ(door.event("lock"), Value(false));
    EXPECT_EQ(door.state(), "closed");

    door.allow_lock = true;
    instance_ok = false;
    EXPECT_EQ(door.event("lock"), Value(false));

    instance_ok = true;
    EXPECT_EQ(door.event("lock"), Value(true));
    EXPECT_EQ(door.state(), "locked");
}

TEST_F(FsmTest, GotoBypassesGuards) {
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"});
    ASSERT_TRUE(circuit.initialize());
    door.allow_lock = false;

    door.event(go_to("locked"));
    EXPECT_EQ(door.state(), "locked");
    EXPECT_THROW(door.event(go_to("ajar")), CircuitError);
}

TEST_F(FsmTest, EntryAndExitEvents) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    auto& door = circuit.add<Door>(
        BlockOptions{.name = "door"},
        FsmOptions{
            .on_enter = {{"closed", {Event("log", "enter_closed")}}, {"open", {Event("log", "enter_open")}}},
            .on_exit = {{"closed", {Event("log", "exit_closed")}}},
        });
    ASSERT_TRUE(circuit.initialize());

    // no entry event for the initial state
    EXPECT_TRUE(log.entries.empty());

    door.event("open");
    ASSERT_EQ(log.entries.size(), 2U);
    EXPECT_EQ(log.entries[0].etype, "exit_closed");
    EXPECT_EQ(get_or(log.entries[0].data, "trigger"), Value("exit"));
    EXPECT_EQ(log.entries[1].etype, "enter_open");
    EXPECT_EQ(get_or(log.entries[1].data, "state"), Value("open"));
    EXPECT_EQ(get_or(log.entries[1].data, "value"), Value("open"));
}

TEST_F(FsmTest, InitialEntryRunsEnterCallbacks) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    int instance_calls = 0;
    auto& door = circuit.add<Door>(
        BlockOptions{.name = "door"},
        FsmOptions{
            .enter = {{"open", [&instance_calls](Fsm&, const EventData&) { ++instance_calls; }}},
            .on_enter = {{"open", {Event("log", "enter_open")}}},
            .initdef = "open",
        });
    ASSERT_TRUE(circuit.initialize());

    EXPECT_EQ(door.state(), "open");
    EXPECT_EQ(instance_calls, 1);
    EXPECT_EQ(door.actions, (std::vector<std::string>{"enter open"}));
    EXPECT_TRUE(log.entries.empty());
}

TEST_F(FsmTest, InstanceActionsRunBeforeClassActions) {
    std::vector<std::string> order;
    auto& door = circuit.add<Door>(
        BlockOptions{.name = "door"},
        FsmOptions{.enter = {{"open", [&order](Fsm& fsm, const EventData&) {
            order.push_back("instance");
            order.push_back(std::to_string(static_cast<Door&>(fsm).actions.size()));
        }}}});
    ASSERT_TRUE(circuit.initialize());

    door.event("open");
    EXPECT_EQ(order, (std::vector<std::string>{"instance", "0"}));
    EXPECT_EQ(door.actions.size(), 1U);
}

// ============================================================================
// Timed states
// ============================================================================

TEST_F(FsmTest, TimedStateExpires) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"});
    ASSERT_TRUE(circuit.initialize());

    TimePoint start = circuit.now();
    pulse.event("fire");
    EXPECT_EQ(pulse.output(), Value(true));
    ASSERT_TRUE(pulse.timer_expiration().has_value());
    EXPECT_EQ(*pulse.timer_expiration(), start + seconds(2.0));

    ASSERT_TRUE(circuit.advance(seconds(1.5)));
    EXPECT_EQ(pulse.state(), "on");
    ASSERT_TRUE(circuit.advance(seconds(1.0)));
    EXPECT_EQ(pulse.state(), "off");
    EXPECT_FALSE(pulse.timer_expiration().has_value());
}

TEST_F(FsmTest, DurationFromEventData) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"});
    ASSERT_TRUE(circuit.initialize());

    pulse.event("fire", {{"duration", 10.0}});
    ASSERT_TRUE(circuit.advance(seconds(5.0)));
    EXPECT_EQ(pulse.state(), "on");
    ASSERT_TRUE(circuit.advance(seconds(5.0)));
    EXPECT_EQ(pulse.state(), "off");
}

TEST_F(FsmTest, DurationOverride) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"},
                                     FsmOptions{.durations = {{"on", seconds(0.5)}}});
    ASSERT_TRUE(circuit.initialize());

    pulse.event("fire");
    ASSERT_TRUE(circuit.advance(seconds(0.6)));
    EXPECT_EQ(pulse.state(), "off");
}

TEST_F(FsmTest, ZeroDurationLeavesStateAtOnce) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"},
                                     FsmOptions{.durations = {{"pending", Duration::zero()}}});
    ASSERT_TRUE(circuit.initialize());

    pulse.event("arm");
    EXPECT_EQ(pulse.state(), "on");
}

TEST_F(FsmTest, InfiniteDurationStartsNoTimer) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"},
                                     FsmOptions{.durations = {{"on", Duration::infinite()}}});
    ASSERT_TRUE(circuit.initialize());

    pulse.event("fire");
    EXPECT_FALSE(pulse.timer_expiration().has_value());
    EXPECT_EQ(circuit.pending_timers(), 0U);
}

TEST_F(FsmTest, UnsetDuration) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"});
    ASSERT_TRUE(circuit.initialize());

    EXPECT_THROW(pulse.event("arm"), CircuitError);
}

TEST_F(FsmTest, LeavingTimedStateCancelsTimer) {
    auto& pulse = circuit.add<Pulse>(BlockOptions{.name = "pulse"});
    ASSERT_TRUE(circuit.initialize());

    pulse.event("fire");
    EXPECT_EQ(circuit.pending_timers(), 1U);
    pulse.event(go_to("off"));
    EXPECT_EQ(circuit.pending_timers(), 0U);
}

// ============================================================================
// Chained transitions
// ============================================================================

TEST_F(FsmTest, ChainedTransitions) {
    auto& chain = circuit.add<Chain>(BlockOptions{.name = "chain"});
    ASSERT_TRUE(circuit.initialize());

    chain.event("go");
    EXPECT_EQ(chain.state(), "done");
    EXPECT_EQ(chain.output(), Value("done"));
    EXPECT_EQ(chain.exits, 1);
}

TEST_F(FsmTest, ChainedTransitionsNotifyOnlyTheFinalState) {
    auto& log = circuit.add<EventLog>(BlockOptions{.name = "log"});
    auto& chain = circuit.add<Chain>(
        BlockOptions{.name = "chain", .on_output = {Event("log", "out")}},
        FsmOptions{.on_enter = {
            {"a", {Event("log", "enterA")}},
            {"b", {Event("log", "enterB")}},
            {"done", {Event("log", "enterDone")}},
        }});
    ASSERT_TRUE(circuit.initialize());
    log.entries.clear();

    chain.event("go");
    EXPECT_EQ(chain.state(), "done");
    std::vector<std::string> etypes;
    for (const auto& entry : log.entries) {
        etypes.push_back(entry.etype);
    }
    EXPECT_EQ(etypes, (std::vector<std::string>{"out", "enterDone"}));
    EXPECT_EQ(get_or(log.entries[0].data, "value"), Value("done"));
}

TEST_F(FsmTest, StateTransitionTakesPrecedenceOverAnyState) {
    auto& fsm = circuit.add<Tiers>(BlockOptions{.name = "tiers"});
    ASSERT_TRUE(circuit.initialize());
    ASSERT_EQ(fsm.state(), "s1");

    fsm.event("ev");
    EXPECT_EQ(fsm.state(), "s2");
    fsm.event("ev");
    EXPECT_EQ(fsm.state(), "s3");

    fsm.event(go_to("s4"));
    fsm.event("ev");
    EXPECT_EQ(fsm.state(), "s3");

    fsm.event(go_to("s1"));
    fsm.event("ev");
    EXPECT_EQ(fsm.state(), "s2");
}

TEST_F(FsmTest, ChainLimit) {
    auto& chain = circuit.add<Chain>(BlockOptions{.name = "chain"});
    ASSERT_TRUE(circuit.initialize());

    try {
        chain.event("spin");
        FAIL() << "expected CircuitError";
    } catch (const CircuitError& e) {
        EXPECT_NE(std::string(e.what()).find("Chained state transition limit reached"), std::string::npos);
    }
}

TEST_F(FsmTest, EventMultiplication) {
    auto& chain = circuit.add<Chain>(BlockOptions{.name = "chain"});
    ASSERT_TRUE(circuit.initialize());

    try {
        chain.event("twice");
        FAIL() << "expected CircuitError";
    } catch (const CircuitError& e) {
        EXPECT_NE(std::string(e.what()).find("Forbidden event multiplication"), std::string::npos);
    }
}

TEST_F(FsmTest, Configuration) {
    auto& door = circuit.add<Door>(BlockOptions{.name = "door"});

    EventData conf = door.get_conf();
    EXPECT_EQ(get_or(conf, "class"), Value("Door"));
    EXPECT_EQ(get_or(conf, "states"), Value(Value::List{"closed", "open", "locked"}));
    EXPECT_EQ(get_or(conf, "fsm_events"), Value(Value::List{"close", "lock", "open", "unlock"}));
}
