#include <circsim/blocks/counter.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>

namespace circsim::blocks {

using core::Value;

namespace {

const Value& number_arg(const core::EventData& data, std::string_view key, const Value& fallback) {
    auto it = data.find(key);
    const Value& value = it == data.end() ? fallback : it->second;
    if (!value.is_number()) {
        throw std::invalid_argument(fmt::format("'{}' must be a number, got {}", key, value));
    }
    return value;
}

Value add(const Value& lhs, const Value& rhs) {
    if (lhs.is_int() && rhs.is_int()) {
        return lhs.as_int() + rhs.as_int();
    }
    return lhs.as_double() + rhs.as_double();
}

Value negate(const Value& value) {
    return value.is_int() ? Value(-value.as_int()) : Value(-value.as_double());
}

// floored modulo: the result has the sign of the modulus
Value floor_mod(const Value& value, const Value& modulus) {
    if (value.is_int() && modulus.is_int()) {
        int64_t m = modulus.as_int();
        int64_t r = value.as_int() % m;
        if (r != 0 && ((r < 0) != (m < 0))) {
            r += m;
        }
        return r;
    }
    double m = modulus.as_double();
    double r = std::fmod(value.as_double(), m);
    if (r != 0.0 && ((r < 0.0) != (m < 0.0))) {
        r += m;
    }
    return r;
}

const Value ONE{1};

} // anonymous namespace

Counter::Counter(core::Circuit& circuit, core::BlockOptions options)
    : Counter(circuit, std::move(options), Config{}) {}

Counter::Counter(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "Counter", std::move(options))
    , Persistent(config.persistence)
    , ValueInit(config.initdef)
    , modulo_(std::move(config.modulo)) {
    if (modulo_) {
        if (!modulo_->is_number()) {
            throw core::ConfigurationError(fmt::format("{}: modulo must be a number", to_string()));
        }
        if (modulo_->as_double() == 0.0) {
            throw core::ConfigurationError(fmt::format("{}: modulo must not be zero", to_string()));
        }
    }
}

const core::HandlerTable& Counter::handlers() const {
    static const core::HandlerTable table = core::HandlerTable{}
        .on("inc", &Counter::event_inc)
        .on("dec", &Counter::event_dec)
        .on("put", &Counter::event_put)
        .on("reset", &Counter::event_reset);
    return table;
}

Value Counter::set_counter(const Value& value) {
    if (!value.is_number()) {
        throw std::invalid_argument(fmt::format("counter value must be a number, got {}", value));
    }
    Value result = modulo_ ? floor_mod(value, *modulo_) : value;
    set_output(result);
    return result;
}

Value Counter::event_inc(const core::EventData& data) {
    return set_counter(add(output(), number_arg(data, "amount", ONE)));
}

Value Counter::event_dec(const core::EventData& data) {
    return set_counter(add(output(), negate(number_arg(data, "amount", ONE))));
}

Value Counter::event_put(const core::EventData& data) {
    auto it = data.find("value");
    if (it == data.end()) {
        throw std::invalid_argument("missing event data item 'value'");
    }
    return set_counter(it->second);
}

Value Counter::event_reset(const core::EventData& /*data*/) {
    return set_counter(initdef());
}

void Counter::init_from_value(const Value& value) {
    set_counter(value);
}

void Counter::restore_state(const Value& state) {
    set_counter(state);
}

} // namespace circsim::blocks
