#include <circsim/blocks/repeat.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <chrono>

namespace circsim::blocks {

using core::Value;

Repeat::Repeat(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "Repeat", std::move(options))
    , MainTask(config.stop_timeout)
    , config_(std::move(config)) {
    if (config_.interval <= core::Duration::zero() || config_.interval.is_infinite()) {
        throw core::ConfigurationError(fmt::format("{}: interval must be positive and finite", to_string()));
    }
    if (config_.count && *config_.count < 0) {
        throw core::ConfigurationError(fmt::format("{}: count must not be negative", to_string()));
    }
}

void Repeat::init_regular() {
    set_output(0);
}

void Repeat::resolve_references() {
    SBlock::resolve_references();
    config_.event.resolve(circuit());
}

Value Repeat::handle_event(const core::EventType& etype, const core::EventData& data) {
    if (etype != config_.event.etype()) {
        return SBlock::handle_event(etype, data);
    }
    core::EventData repeated = data;
    repeated.insert_or_assign("orig_source", core::get_or(data, "source", nullptr));
    set_output(0);
    // the original is sent synchronously so that a forbidden loop is not concealed
    send_repeated(repeated, 0);
    {
        std::lock_guard lock(mutex_);
        queue_.push_back(std::move(repeated));
    }
    cond_.notify_all();
    return true;
}

void Repeat::send_repeated(const core::EventData& data, int64_t repeat) {
    if (repeat > 0) {
        set_output(repeat);
    }
    core::EventData payload = data;
    payload.insert_or_assign("repeat", repeat);
    config_.event.send(*this, std::move(payload));
}

void Repeat::main_task(std::stop_token token) {
    const auto interval = std::chrono::nanoseconds(config_.interval.nanoseconds());
    core::EventData last;
    int64_t repeat = 0;
    bool repeating = false;
    std::unique_lock lock(mutex_);
    while (!token.stop_requested()) {
        const bool received = repeating
            ? cond_.wait_for(lock, token, interval, [this] { return !queue_.empty(); })
            : cond_.wait(lock, token, [this] { return !queue_.empty(); });
        if (token.stop_requested()) {
            break;
        }
        if (received) {
            last = std::move(queue_.front());
            queue_.pop_front();
            repeat = 0;
        } else {
            ++repeat;
            lock.unlock();
            circuit().post([this, data = last, repeat] { send_repeated(data, repeat); });
            lock.lock();
        }
        repeating = !config_.count || repeat < *config_.count;
    }
}

core::EventData Repeat::get_conf() const {
    core::EventData conf = SBlock::get_conf();
    conf.insert_or_assign("interval", config_.interval.seconds());
    conf.insert_or_assign("count", config_.count ? Value(*config_.count) : Value(nullptr));
    return conf;
}

} // namespace circsim::blocks
