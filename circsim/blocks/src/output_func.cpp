#include <circsim/blocks/output_func.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

namespace circsim::blocks {

using core::Value;

OutputFunc::OutputFunc(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "OutputFunc", std::move(options))
    , config_(std::move(config)) {
    if (!config_.func) {
        throw core::ConfigurationError(fmt::format("{}: no output function given", to_string()));
    }
}

const core::HandlerTable& OutputFunc::handlers() const {
    static const core::HandlerTable table = core::HandlerTable{}
        .on("put", &OutputFunc::event_put);
    return table;
}

void OutputFunc::resolve_references() {
    SBlock::resolve_references();
    for (auto& event : config_.on_success) {
        event.resolve(circuit());
    }
    for (auto& event : config_.on_error) {
        event.resolve(circuit());
    }
}

Value OutputFunc::event_put(const core::EventData& data) {
    Value result;
    try {
        result = config_.func(data);
    } catch (const std::exception& e) {
        log_error("output function failed; data: {}; error: {}", core::to_string(data), e.what());
        for (auto& event : config_.on_error) {
            event.send(*this, {{"trigger", "error"}, {"error", e.what()}});
        }
        return Value::List{"error", e.what()};
    }
    log_debug("output function returned: {}", result);
    for (auto& event : config_.on_success) {
        event.send(*this, {{"trigger", "success"}, {"value", result}});
    }
    return Value::List{"result", result};
}

void OutputFunc::init_regular() {
    set_output(false);
}

void OutputFunc::stop() {
    if (config_.stop_data) {
        event_put(*config_.stop_data);
    }
}

} // namespace circsim::blocks
