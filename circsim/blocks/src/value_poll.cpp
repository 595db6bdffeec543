#include <circsim/blocks/value_poll.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <chrono>

namespace circsim::blocks {

using core::Value;

ValuePoll::ValuePoll(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "ValuePoll", std::move(options))
    , ValueInit(config.initdef)
    , AsyncInit(config.init_timeout)
    , MainTask(config.stop_timeout)
    , config_(std::move(config)) {
    if (!config_.func) {
        throw core::ConfigurationError(fmt::format("{}: no polling function given", to_string()));
    }
    if (config_.interval <= core::Duration::zero() || config_.interval.is_infinite()) {
        throw core::ConfigurationError(fmt::format("{}: interval must be positive and finite", to_string()));
    }
}

void ValuePoll::init_from_value(const Value& value) {
    set_output(value);
}

void ValuePoll::init_async(std::stop_token token) {
    std::unique_lock lock(mutex_);
    cond_.wait(lock, token, [this] { return polled_; });
}

void ValuePoll::main_task(std::stop_token token) {
    const auto interval = std::chrono::nanoseconds(config_.interval.nanoseconds());
    while (!token.stop_requested()) {
        Value value = config_.func();
        if (!value.is_undef()) {
            circuit().post([this, value] { set_output(value); });
            {
                std::lock_guard lock(mutex_);
                polled_ = true;
            }
            cond_.notify_all();
        }
        std::unique_lock lock(mutex_);
        cond_.wait_for(lock, token, interval, [] { return false; });
    }
}

} // namespace circsim::blocks
