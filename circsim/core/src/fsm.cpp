#include <circsim/core/fsm.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>

namespace circsim::core {

namespace {

class ActiveScope {
public:
    explicit ActiveScope(bool& flag) noexcept : flag_(flag) { flag_ = true; }
    ~ActiveScope() { flag_ = false; }

    ActiveScope(const ActiveScope&) = delete;
    ActiveScope& operator=(const ActiveScope&) = delete;

private:
    bool& flag_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

std::string initial_state(const FsmTable& table, const FsmOptions& options) {
    if (options.initdef.empty()) {
        return table.default_state();
    }
    table.check_state(options.initdef);
    return options.initdef;
}

template<typename Map, typename Valid>
void check_keys(const Map& map, std::string_view what, const FsmTable& table, Valid valid) {
    for (const auto& [key, value] : map) {
        if (!valid(key)) {
            throw ConfigurationError(fmt::format("FSM type {}: invalid {} '{}'", table.type_name(), what, key));
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------- FsmTable

bool FsmTable::has_state(std::string_view state) const {
    return std::find(states_.begin(), states_.end(), state) != states_.end();
}

void FsmTable::check_state(std::string_view state) const {
    if (!has_state(state)) {
        throw ConfigurationError(fmt::format("FSM type {}: Unknown state '{}'", type_name_, state));
    }
}

const std::string* FsmTable::find_transition(std::string_view event, const std::string* state) const {
    if (state != nullptr) {
        auto it = transitions_.find(TransitionKey(event, *state));
        if (it != transitions_.end()) {
            return &it->second;
        }
    }
    auto it = transitions_.find(TransitionKey(event, ""));
    return it == transitions_.end() ? nullptr : &it->second;
}

const TimedState* FsmTable::timed_state(std::string_view state) const {
    auto it = timers_.find(state);
    return it == timers_.end() ? nullptr : &it->second;
}

const FsmGuard* FsmTable::guard(std::string_view event) const {
    auto it = guards_.find(event);
    return it == guards_.end() ? nullptr : &it->second;
}

const FsmAction* FsmTable::enter_action(std::string_view state) const {
    auto it = enter_.find(state);
    return it == enter_.end() ? nullptr : &it->second;
}

const FsmAction* FsmTable::exit_action(std::string_view state) const {
    auto it = exit_.find(state);
    return it == exit_.end() ? nullptr : &it->second;
}

// -------------------------------------------------------------- FsmBuilder

FsmBuilder::FsmBuilder(std::string type_name)
    : type_name_(std::move(type_name)) {}

FsmBuilder& FsmBuilder::states(std::vector<std::string> names) {
    for (auto& name : names) {
        states_.push_back(std::move(name));
    }
    return *this;
}

FsmBuilder& FsmBuilder::timer(std::string state, std::optional<Duration> duration, EventType on_expiry) {
    timers_.emplace_back(std::move(state), TimedState{duration, std::move(on_expiry)});
    return *this;
}

FsmBuilder& FsmBuilder::transition(std::string event, std::string from, std::string next) {
    if (from.empty()) {
        throw ConfigurationError(fmt::format("FSM type {}: empty source state of event '{}'", type_name_, event));
    }
    transitions_.push_back({std::move(event), std::move(from), std::move(next)});
    return *this;
}

FsmBuilder& FsmBuilder::transition(std::string event, std::vector<std::string> from, std::string next) {
    for (auto& state : from) {
        transition(event, std::move(state), next);
    }
    return *this;
}

FsmBuilder& FsmBuilder::transition_any(std::string event, std::string next) {
    transitions_.push_back({std::move(event), "", std::move(next)});
    return *this;
}

FsmTable FsmBuilder::build(const HandlerTable& handlers) const {
    auto fail = [this](const std::string& message) {
        return ConfigurationError(fmt::format("FSM type {}: {}", type_name_, message));
    };

    FsmTable table;
    table.type_name_ = type_name_;
    for (const auto& state : states_) {
        if (state.empty()) {
            throw fail("FSM state name must be a non-empty string");
        }
        if (table.has_state(state)) {
            throw fail(fmt::format("Duplicate state '{}'", state));
        }
        table.states_.push_back(state);
    }
    for (const auto& [state, timed] : timers_) {
        if (state.empty()) {
            throw fail("FSM state name must be a non-empty string");
        }
        if (!table.has_state(state)) {
            table.states_.push_back(state);
        }
    }
    if (table.states_.empty()) {
        throw fail("Cannot create a state machine with no states");
    }

    for (const auto& tr : transitions_) {
        if (tr.event.empty()) {
            throw fail("FSM event name must be a non-empty string");
        }
        if (handlers.contains(tr.event)) {
            throw fail(fmt::format(
                "Ambiguous event '{}': the name is used for both FSM and SBlock event", tr.event));
        }
        if (!tr.from.empty() && !table.has_state(tr.from)) {
            throw fail(fmt::format("Unknown state '{}'", tr.from));
        }
        if (!table.has_state(tr.next)) {
            throw fail(fmt::format("Unknown state '{}'", tr.next));
        }
        table.events_.insert(tr.event);
        auto [it, inserted] = table.transitions_.emplace(FsmTable::TransitionKey(tr.event, tr.from), tr.next);
        if (!inserted) {
            throw fail(fmt::format("Multiple transitions defined for event '{}' in state {}",
                                   tr.event, tr.from.empty() ? "<any>" : fmt::format("'{}'", tr.from)));
        }
    }

    for (const auto& [state, timed] : timers_) {
        if (timed.duration && *timed.duration < Duration::zero()) {
            throw fail(fmt::format("timer of state '{}': negative duration", state));
        }
        if (timed.on_expiry.is_goto()) {
            if (!table.has_state(timed.on_expiry.name())) {
                throw fail(fmt::format("timer of state '{}': Unknown state '{}'", state, timed.on_expiry.name()));
            }
        } else if (!timed.on_expiry.is_named() || !table.has_event(timed.on_expiry.name())) {
            throw fail(fmt::format("timer of state '{}': undefined event '{}'", state, timed.on_expiry.to_string()));
        }
        if (!table.timers_.emplace(state, timed).second) {
            throw fail(fmt::format("Duplicate timer of state '{}'", state));
        }
    }

    for (const auto& [event, guard] : guards_) {
        if (!table.has_event(event)) {
            throw fail(fmt::format("guard of undefined event '{}'", event));
        }
        table.guards_.insert_or_assign(event, guard);
    }
    for (const auto& [state, action] : enter_) {
        if (!table.has_state(state)) {
            throw fail(fmt::format("entry action of Unknown state '{}'", state));
        }
        table.enter_.insert_or_assign(state, action);
    }
    for (const auto& [state, action] : exit_) {
        if (!table.has_state(state)) {
            throw fail(fmt::format("exit action of Unknown state '{}'", state));
        }
        table.exit_.insert_or_assign(state, action);
    }
    return table;
}

// --------------------------------------------------------------------- Fsm

Fsm::Fsm(Circuit& circuit, const FsmTable& table, BlockOptions options, FsmOptions fsm_options)
    : SBlock(circuit, table.type_name(), std::move(options))
    , Persistent(fsm_options.persistence)
    , ValueInit(initial_state(table, fsm_options))
    , table_(table)
    , options_(std::move(fsm_options)) {
    check_keys(options_.durations, "duration override of state", table_,
               [this](const std::string& state) { return table_.timed_state(state) != nullptr; });
    check_keys(options_.cond, "guard of event", table_,
               [this](const std::string& event) { return table_.has_event(event); });
    auto valid_state = [this](const std::string& state) { return table_.has_state(state); };
    check_keys(options_.enter, "entry action of state", table_, valid_state);
    check_keys(options_.exit, "exit action of state", table_, valid_state);
    check_keys(options_.on_enter, "on_enter events of state", table_, valid_state);
    check_keys(options_.on_exit, "on_exit events of state", table_, valid_state);
}

Fsm::~Fsm() = default;

std::optional<TimePoint> Fsm::timer_expiration() const noexcept {
    if (!timer_.valid()) {
        return std::nullopt;
    }
    return timer_.when();
}

Value Fsm::state_value() const {
    return state_ ? Value(*state_) : Value(nullptr);
}

Value Fsm::get_state() const {
    auto expiration = timer_expiration();
    return Value::List{
        state_value(),
        expiration ? Value(time_to_seconds(*expiration)) : Value(nullptr),
    };
}

void Fsm::restore_state(const Value& saved) {
    if (!saved.is_list() || saved.as_list().size() < 2 || !saved.as_list()[0].is_string()) {
        throw CircuitError(fmt::format("{}: invalid saved state {}", to_string(), saved));
    }
    const std::string& state = saved.as_list()[0].as_string();
    const Value& expiry = saved.as_list()[1];
    table_.check_state(state);
    if (!expiry.is_null()) {
        if (!expiry.is_number()) {
            throw CircuitError(fmt::format("{}: invalid timer expiration {}", to_string(), expiry));
        }
        Duration remaining = time_from_seconds(expiry.as_double()) - circuit().now();
        if (remaining <= Duration::zero()) {
            log_warning("restore state: ignoring expired state '{}'", state);
            return;
        }
        const TimedState* timed = table_.timed_state(state);
        if (timed == nullptr) {
            throw CircuitError(
                fmt::format("{}: cannot set a timer for a not timed state '{}'", to_string(), state));
        }
        set_timer(remaining, timed->on_expiry);
    }
    state_ = state;
    log_debug("state: <UNDEF> -> {}", state);
    Value output = calc_output();
    if (!output.is_undef()) {
        set_output(std::move(output));
    }
}

void Fsm::init_from_value(const Value& value) {
    if (!value.is_string()) {
        throw ConfigurationError(fmt::format("{}: initial state must be a string, got {}", to_string(), value));
    }
    event(go_to(value.as_string()));
}

void Fsm::stop() {
    stop_timer();
    SBlock::stop();
}

EventData Fsm::get_conf() const {
    EventData conf = SBlock::get_conf();
    Value::List states;
    for (const auto& state : table_.states()) {
        states.emplace_back(state);
    }
    conf.insert_or_assign("states", std::move(states));
    Value::List events;
    for (const auto& event : table_.events()) {
        events.emplace_back(event);
    }
    conf.insert_or_assign("fsm_events", std::move(events));
    return conf;
}

void Fsm::resolve_references() {
    SBlock::resolve_references();
    for (auto* events : {&options_.on_enter, &options_.on_exit}) {
        for (auto& [state, list] : *events) {
            for (auto& event : list) {
                event.resolve(circuit());
            }
        }
    }
    for (auto& event : options_.on_notrans) {
        event.resolve(circuit());
    }
}

Value Fsm::calc_output() const {
    return state_ ? Value(*state_) : Value(UNDEF);
}

bool Fsm::run_guards(const std::string& event, const EventData& data) {
    bool approved = true;
    if (auto it = options_.cond.find(event); it != options_.cond.end() && it->second) {
        approved = it->second(*this, data) && approved;
    }
    if (const FsmGuard* guard = table_.guard(event)) {
        approved = (*guard)(*this, data) && approved;
    }
    return approved;
}

void Fsm::run_enter(const EventData& data) {
    if (auto it = options_.enter.find(*state_); it != options_.enter.end() && it->second) {
        it->second(*this, data);
    }
    if (const FsmAction* action = table_.enter_action(*state_)) {
        (*action)(*this, data);
    }
}

void Fsm::run_exit(const EventData& data) {
    if (auto it = options_.exit.find(*state_); it != options_.exit.end() && it->second) {
        it->second(*this, data);
    }
    if (const FsmAction* action = table_.exit_action(*state_)) {
        (*action)(*this, data);
    }
}

void Fsm::send_state_events(std::map<std::string, std::vector<Event>>& events, std::string_view trigger) {
    auto it = events.find(*state_);
    if (it == events.end()) {
        return;
    }
    for (auto& event : it->second) {
        event.send(*this, {
            {"trigger", trigger},
            {"state", *state_},
            {"value", output()},
        });
    }
}

void Fsm::set_timer(Duration duration, const EventType& on_expiry) {
    log_debug("timer: {:.3f}s before {}", duration.seconds(), on_expiry.to_string());
    timer_ = circuit().add_timer(duration, [this, on_expiry] {
        timer_.clear();
        event(on_expiry);
    });
}

void Fsm::start_timer(const Value& duration_value, const EventType& on_expiry) {
    Duration duration;
    if (!duration_value.is_undef() && !duration_value.is_null()) {
        if (!duration_value.is_number()) {
            throw CircuitError(fmt::format("{}: invalid timer duration {}", to_string(), duration_value));
        }
        duration = duration_from_seconds(duration_value.as_double());
    } else {
        std::optional<Duration> configured;
        if (auto it = options_.durations.find(*state_); it != options_.durations.end() && it->second) {
            configured = it->second;
        } else {
            configured = table_.timed_state(*state_)->duration;
        }
        if (!configured) {
            throw CircuitError(fmt::format("{}: Timer duration for state '{}' not set", to_string(), *state_));
        }
        duration = *configured;
    }
    if (duration.is_infinite()) {
        return;
    }
    if (duration <= Duration::zero()) {
        log_debug("timer: zero delay before {}", on_expiry.to_string());
        event(on_expiry);
        return;
    }
    set_timer(duration, on_expiry);
}

void Fsm::stop_timer() {
    if (timer_.valid()) {
        circuit().cancel_timer(timer_);
        log_debug("timer: cancelled");
    }
}

Value Fsm::handle_event(const EventType& etype, const EventData& data) {
    std::string newstate;
    if (etype.is_goto()) {
        table_.check_state(etype.name());
        newstate = etype.name();
    } else {
        if (!table_.has_event(etype.name())) {
            return SBlock::handle_event(etype, data);
        }
        const std::string* next = table_.find_transition(etype.name(), state_ ? &*state_ : nullptr);
        if (next == nullptr) {
            log_debug("No transition defined for event {} in state {}", etype.name(), state_value());
            for (auto& event : options_.on_notrans) {
                event.send(*this, {
                    {"trigger", "notrans"},
                    {"event", etype.name()},
                    {"state", state_value()},
                });
            }
            return false;
        }
        newstate = *next;
        if (state_ && !run_guards(etype.name(), data)) {
            log_debug("not executing event {} ({} -> {}), condition not satisfied",
                      etype.name(), *state_, newstate);
            return false;
        }
    }

    if (fsm_event_active_) {
        if (next_) {
            throw CircuitError(fmt::format(
                "{}: Forbidden event multiplication; Two events ({} and {}) were generated "
                "while handling a single event", to_string(), next_->event, etype.to_string()));
        }
        next_ = Pending{etype.to_string(), data, std::move(newstate)};
        return true;
    }

    ActiveScope active(fsm_event_active_);
    const bool initial = !state_;
    if (!initial) {
        run_exit(data);
        send_state_events(options_.on_exit, "exit");
        stop_timer();
    }
    next_.reset();
    std::string current_event = etype.to_string();
    EventData current_data = data;
    bool settled = false;
    for (std::size_t i = 0; i < table_.chain_limit(); ++i) {
        if (next_) {
            // intermediate state: exit at once, no events
            run_exit(current_data);
            current_event = std::move(next_->event);
            current_data = std::move(next_->data);
            newstate = std::move(next_->state);
            next_.reset();
        }
        log_debug("state: {} -> {} (event: {})", state_value(), newstate, current_event);
        circuit().trace([&](TraceWriter& w) {
            w.type("state");
            w.field("block", name());
            w.field("from", state_ ? std::string_view(*state_) : std::string_view("<UNDEF>"));
            w.field("to", newstate);
            w.field("event", current_event);
        });
        state_ = newstate;
        {
            EventGuardRelax relax(*this);
            run_enter(current_data);
        }
        if (next_) {
            continue;
        }
        if (const TimedState* timed = table_.timed_state(*state_)) {
            EventGuardRelax relax(*this);
            start_timer(get_or(current_data, "duration"), timed->on_expiry);
        }
        if (next_) {
            continue;
        }
        settled = true;
        break;
    }
    if (!settled) {
        next_.reset();
        throw CircuitError(fmt::format("{}: Chained state transition limit reached (infinite loop?)", to_string()));
    }
    Value output = calc_output();
    if (!output.is_undef()) {
        set_output(std::move(output));
    }
    if (!initial) {
        send_state_events(options_.on_enter, "enter");
    }
    return true;
}

} // namespace circsim::core
