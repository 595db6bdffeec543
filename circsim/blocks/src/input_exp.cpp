#include <circsim/blocks/input_exp.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace circsim::blocks {

using core::Value;

namespace {

core::FsmOptions make_options(const InputExp::Config& config) {
    core::FsmOptions options;
    options.durations.emplace("valid", config.duration);
    options.initdef = config.initdef.is_undef() ? "expired" : "valid";
    options.persistence = config.persistence;
    return options;
}

} // anonymous namespace

const core::FsmTable& InputExp::control_table() {
    static const core::FsmTable table = core::FsmBuilder("InputExp")
        .states({"expired"})
        .timer("valid", std::nullopt, core::go_to("expired"))
        .transition_any("put", "valid")
        .cond("put", &InputExp::cond_put)
        .enter("expired", &InputExp::enter_expired)
        .build();
    return table;
}

InputExp::InputExp(core::Circuit& circuit, core::BlockOptions options, Config config)
    : Fsm(circuit, control_table(), std::move(options), make_options(config))
    , validation_{std::move(config.allowed), std::move(config.check), std::move(config.schema)} {
    if (config.duration <= core::Duration::zero()) {
        throw core::ConfigurationError(fmt::format("{}: duration must be positive", to_string()));
    }
    try {
        expired_ = validation_.validate(config.expired);
        if (!config.initdef.is_undef()) {
            input_ = validation_.validate(config.initdef);
        }
    } catch (const std::invalid_argument& e) {
        throw core::ConfigurationError(fmt::format("{}: {}", to_string(), e.what()));
    }
}

bool InputExp::cond_put(const core::EventData& data) {
    auto it = data.find("value");
    if (it == data.end()) {
        throw std::invalid_argument("missing event data item 'value'");
    }
    try {
        input_ = validation_.validate(it->second);
    } catch (const std::invalid_argument& e) {
        log_warning("{}", e.what());
        return false;
    }
    return true;
}

void InputExp::enter_expired(const core::EventData& /*data*/) {
    input_ = core::UNDEF;
}

Value InputExp::calc_output() const {
    return state() == "valid" ? input_ : expired_;
}

Value InputExp::get_state() const {
    Value::List saved = Fsm::get_state().as_list();
    saved.emplace_back(state() == "valid" ? input_ : Value(nullptr));
    return saved;
}

void InputExp::restore_state(const Value& saved) {
    Value previous = input_;
    if (saved.is_list() && saved.as_list().size() >= 3 && saved.as_list()[0] == Value("valid")) {
        try {
            input_ = validation_.validate(saved.as_list()[2]);
        } catch (const std::invalid_argument& e) {
            throw core::CircuitError(fmt::format("{}: saved value: {}", to_string(), e.what()));
        }
    }
    try {
        Fsm::restore_state(saved);
    } catch (const std::exception&) {
        input_ = std::move(previous);
        throw;
    }
    // an expired saved state leaves the block to the regular initialization
    if (state() != "valid") {
        input_ = std::move(previous);
    }
}

} // namespace circsim::blocks
