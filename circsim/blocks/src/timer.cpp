#include <circsim/blocks/timer.hpp>

namespace circsim::blocks {

using core::Value;

namespace {

core::FsmOptions make_options(Timer::Config& config) {
    core::FsmOptions options;
    options.durations.emplace("on", config.t_on);
    options.durations.emplace("off", config.t_off);
    options.initdef = std::move(config.initdef);
    options.persistence = config.persistence;
    return options;
}

} // anonymous namespace

const core::FsmTable& Timer::control_table() {
    static const core::FsmTable table = core::FsmBuilder("Timer")
        .states({"off", "on"})
        .timer("on", core::Duration::infinite(), "stop")
        .timer("off", core::Duration::infinite(), "start")
        .transition_any("start", "on")
        .transition_any("stop", "off")
        .transition("toggle", "on", "off")
        .transition("toggle", "off", "on")
        .cond("start", &Timer::cond_start)
        .cond("stop", &Timer::cond_stop)
        .build();
    return table;
}

Timer::Timer(core::Circuit& circuit, core::BlockOptions options)
    : Timer(circuit, std::move(options), Config{}) {}

Timer::Timer(core::Circuit& circuit, core::BlockOptions options, Config config)
    : Fsm(circuit, control_table(), std::move(options), make_options(config))
    , restartable_(config.restartable) {}

bool Timer::cond_start(const core::EventData& /*data*/) {
    return restartable_ || state() != "on";
}

bool Timer::cond_stop(const core::EventData& /*data*/) {
    return restartable_ || state() != "off";
}

Value Timer::calc_output() const {
    return state() == "on";
}

} // namespace circsim::blocks
