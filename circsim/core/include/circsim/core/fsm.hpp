#pragma once

#include <circsim/core/sblock.hpp>
#include <circsim/core/timer.hpp>

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace circsim::core {

class Fsm;

/// @brief Transition guard: returns false to reject the transition.
using FsmGuard = std::function<bool(Fsm&, const EventData&)>;

/// @brief State entry or exit action.
using FsmAction = std::function<void(Fsm&, const EventData&)>;

/// @brief Timer configuration of a timed state.
struct TimedState {
    /// Default duration; nullopt means it must be set per instance or per event.
    std::optional<Duration> duration;
    /// Event raised on timer expiry; a named FSM event or a go_to().
    EventType on_expiry;
};

/// @brief Compiled, immutable control tables of an FSM type.
///
/// Built and validated by FsmBuilder. A table is shared by all FSM
/// instances of its type and must outlive them; the usual place is a
/// function-local static.
///
/// @see FsmBuilder, Fsm
/// @ingroup core_fsm
class FsmTable {
public:
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }

    /// @brief All states: declared states followed by additional timed states.
    [[nodiscard]] const std::vector<std::string>& states() const noexcept { return states_; }
    [[nodiscard]] const std::set<std::string, std::less<>>& events() const noexcept { return events_; }
    [[nodiscard]] const std::string& default_state() const noexcept { return states_.front(); }

    [[nodiscard]] bool has_state(std::string_view state) const;
    [[nodiscard]] bool has_event(std::string_view event) const { return events_.contains(event); }

    /// @throws ConfigurationError for an unknown state.
    void check_state(std::string_view state) const;

    /// @brief Maximum length of a chain of state transitions.
    [[nodiscard]] std::size_t chain_limit() const noexcept { return 3 * states_.size(); }

    /// @brief Next state for @p event in @p state (nullptr while uninitialized).
    ///
    /// A transition defined for the specific state takes precedence over
    /// a transition defined for any state.
    ///
    /// @return The next state, or nullptr if no transition is defined.
    [[nodiscard]] const std::string* find_transition(std::string_view event, const std::string* state) const;

    /// @brief Timer configuration of @p state, nullptr if not a timed state.
    [[nodiscard]] const TimedState* timed_state(std::string_view state) const;

    [[nodiscard]] const FsmGuard* guard(std::string_view event) const;
    [[nodiscard]] const FsmAction* enter_action(std::string_view state) const;
    [[nodiscard]] const FsmAction* exit_action(std::string_view state) const;

private:
    friend class FsmBuilder;

    FsmTable() = default;

    // key: (event, from-state); an empty from-state means any state
    using TransitionKey = std::pair<std::string, std::string>;

    std::string type_name_;
    std::vector<std::string> states_;
    std::set<std::string, std::less<>> events_;
    std::map<TransitionKey, std::string> transitions_;
    std::map<std::string, TimedState, std::less<>> timers_;
    std::map<std::string, FsmGuard, std::less<>> guards_;
    std::map<std::string, FsmAction, std::less<>> enter_;
    std::map<std::string, FsmAction, std::less<>> exit_;
};

/// @brief Declarative construction of FSM control tables.
///
/// @code
/// static const FsmTable table = FsmBuilder("Turnstile")
///     .states({"locked", "unlocked"})
///     .transition("coin", {"locked", "unlocked"}, "unlocked")
///     .transition("push", "unlocked", "locked")
///     .build();
/// @endcode
///
/// @ingroup core_fsm
class FsmBuilder {
public:
    explicit FsmBuilder(std::string type_name);

    /// @brief Declare states; the first declared state is the default initial state.
    FsmBuilder& states(std::vector<std::string> names);

    /// @brief Make @p state a timed state.
    /// @param duration Default duration; nullopt = unset, Duration::infinite() = no timer.
    FsmBuilder& timer(std::string state, std::optional<Duration> duration, EventType on_expiry);

    /// @brief Transition on @p event from @p from to @p next.
    FsmBuilder& transition(std::string event, std::string from, std::string next);
    FsmBuilder& transition(std::string event, std::vector<std::string> from, std::string next);

    /// @brief Transition on @p event from any state without a specific entry.
    FsmBuilder& transition_any(std::string event, std::string next);

    template<typename T>
    FsmBuilder& cond(std::string event, bool (T::*method)(const EventData&)) {
        static_assert(std::is_base_of_v<Fsm, T>, "guards must be Fsm members");
        guards_.emplace_back(std::move(event), [method](Fsm& fsm, const EventData& data) {
            return (static_cast<T&>(fsm).*method)(data);
        });
        return *this;
    }

    template<typename T>
    FsmBuilder& enter(std::string state, void (T::*method)(const EventData&)) {
        static_assert(std::is_base_of_v<Fsm, T>, "actions must be Fsm members");
        enter_.emplace_back(std::move(state), bind_action(method));
        return *this;
    }

    template<typename T>
    FsmBuilder& exit(std::string state, void (T::*method)(const EventData&)) {
        static_assert(std::is_base_of_v<Fsm, T>, "actions must be Fsm members");
        exit_.emplace_back(std::move(state), bind_action(method));
        return *this;
    }

    /// @brief Validate the declarations and compile the tables.
    /// @param handlers Named handlers of the block class; FSM events must
    ///        not reuse their names.
    /// @throws ConfigurationError describing the first problem found.
    [[nodiscard]] FsmTable build(const HandlerTable& handlers = {}) const;

private:
    struct Transition {
        std::string event;
        std::string from;  // empty = any state
        std::string next;
    };

    template<typename T>
    static FsmAction bind_action(void (T::*method)(const EventData&)) {
        return [method](Fsm& fsm, const EventData& data) {
            (static_cast<T&>(fsm).*method)(data);
        };
    }

    std::string type_name_;
    std::vector<std::string> states_;
    std::vector<std::pair<std::string, TimedState>> timers_;
    std::vector<Transition> transitions_;
    std::vector<std::pair<std::string, FsmGuard>> guards_;
    std::vector<std::pair<std::string, FsmAction>> enter_;
    std::vector<std::pair<std::string, FsmAction>> exit_;
};

/// @brief Per-instance FSM configuration.
///
/// Keys are validated against the control table when the FSM is created.
struct FsmOptions {
    /// Timer duration overrides per timed state; nullopt keeps the table default.
    std::map<std::string, std::optional<Duration>> durations;
    /// Guards per event, combined with the class guard (both must approve).
    std::map<std::string, FsmGuard> cond;
    /// Entry actions per state, run in addition to the class action.
    std::map<std::string, FsmAction> enter;
    /// Exit actions per state, run in addition to the class action.
    std::map<std::string, FsmAction> exit;
    /// Events sent after a state was entered.
    std::map<std::string, std::vector<Event>> on_enter;
    /// Events sent before a state is left.
    std::map<std::string, std::vector<Event>> on_exit;
    /// Events sent when an event has no transition in the current state.
    std::vector<Event> on_notrans;
    /// Initial state; empty selects the table's default state.
    std::string initdef;
    PersistenceOptions persistence;
};

/// @brief Finite-state machine block.
///
/// Accepts the FSM events of its table and go_to() events. The default
/// output is the state name; subclasses override calc_output().
///
/// Entering a timed state starts its timer. The duration is taken from
/// `data["duration"]` (seconds) of the triggering event, then from the
/// instance options, then from the table; an infinite duration starts no
/// timer and a zero duration raises the expiry event immediately.
///
/// An entry action may request one chained transition by sending an
/// event to its own block; the intermediate state is exited at once.
///
/// @see FsmTable, FsmBuilder
/// @ingroup core_fsm
class Fsm : public SBlock, public Persistent, public ValueInit {
public:
    /// @throws ConfigurationError for options not matching @p table.
    Fsm(Circuit& circuit, const FsmTable& table, BlockOptions options, FsmOptions fsm_options = {});
    ~Fsm() override;

    [[nodiscard]] const FsmTable& table() const noexcept { return table_; }

    /// @brief Current state; nullopt while uninitialized.
    [[nodiscard]] const std::optional<std::string>& state() const noexcept { return state_; }

    /// @brief Expiration time of the running timer, if any.
    [[nodiscard]] std::optional<TimePoint> timer_expiration() const noexcept;

    /// @brief `[state, expiry-seconds | null]`
    [[nodiscard]] Value get_state() const override;

    /// @brief Resume a state saved by get_state() without running entry
    /// actions or sending entry events.
    void restore_state(const Value& state) override;

    /// @brief Enter the state named by @p value.
    void init_from_value(const Value& value) override;

    void stop() override;

    [[nodiscard]] EventData get_conf() const override;

protected:
    Value handle_event(const EventType& etype, const EventData& data) override;

    void resolve_references() override;

    /// @brief Output for the current state; UNDEF leaves the output unchanged.
    [[nodiscard]] virtual Value calc_output() const;

private:
    struct Pending {
        std::string event;
        EventData data;
        std::string state;
    };

    [[nodiscard]] Value state_value() const;
    [[nodiscard]] bool run_guards(const std::string& event, const EventData& data);
    void run_enter(const EventData& data);
    void run_exit(const EventData& data);
    void send_state_events(std::map<std::string, std::vector<Event>>& events, std::string_view trigger);
    void start_timer(const Value& duration, const EventType& on_expiry);
    void set_timer(Duration duration, const EventType& on_expiry);
    void stop_timer();

    const FsmTable& table_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    FsmOptions options_;
    std::optional<std::string> state_;
    TimerId timer_;
    bool fsm_event_active_{false};
    std::optional<Pending> next_;
};

} // namespace circsim::core
