#include <circsim/blocks/input.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace circsim::blocks {

using core::Value;

Input::Input(core::Circuit& circuit, core::BlockOptions options)
    : Input(circuit, std::move(options), Config{}) {}

Input::Input(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "Input", std::move(options))
    , Persistent(config.persistence)
    , ValueInit(config.initdef)
    , config_(std::move(config))
    , validation_{config_.allowed, config_.check, config_.schema} {
    if (!initdef().is_undef()) {
        try {
            (void)validation_.validate(initdef());
        } catch (const std::invalid_argument& e) {
            throw core::ConfigurationError(fmt::format("{}: initdef: {}", to_string(), e.what()));
        }
    }
}

const core::HandlerTable& Input::handlers() const {
    static const core::HandlerTable table = core::HandlerTable{}
        .on("put", &Input::event_put);
    return table;
}

Value InputValidation::validate(const Value& value) const {
    if (allowed && std::find(allowed->begin(), allowed->end(), value) == allowed->end()) {
        throw std::invalid_argument(fmt::format("Validation error: {} is not among allowed values", value));
    }
    if (check && !check(value)) {
        throw std::invalid_argument(fmt::format("Validation function rejected value {}", value));
    }
    if (schema) {
        try {
            return schema(value);
        } catch (const std::exception& e) {
            throw std::invalid_argument(
                fmt::format("Validation schema rejected value {} with error: {}", value, e.what()));
        }
    }
    return value;
}

Value Input::event_put(const core::EventData& data) {
    auto it = data.find("value");
    if (it == data.end()) {
        throw std::invalid_argument("missing event data item 'value'");
    }
    Value value;
    try {
        value = validation_.validate(it->second);
    } catch (const std::invalid_argument& e) {
        log_warning("{}", e.what());
        return false;
    }
    set_output(std::move(value));
    return true;
}

void Input::init_from_value(const Value& value) {
    put(value);
}

void Input::restore_state(const Value& state) {
    put(state);
}

core::EventData Input::get_conf() const {
    core::EventData conf = SBlock::get_conf();
    if (config_.allowed) {
        conf.insert_or_assign("allowed", Value::List(*config_.allowed));
    }
    return conf;
}

} // namespace circsim::blocks
