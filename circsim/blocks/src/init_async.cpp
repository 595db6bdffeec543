#include <circsim/blocks/init_async.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

namespace circsim::blocks {

using core::Value;

InitAsync::InitAsync(core::Circuit& circuit, core::BlockOptions options, Config config)
    : SBlock(circuit, "InitAsync", std::move(options))
    , ValueInit(std::move(config.initdef))
    , AsyncInit(config.init_timeout)
    , init_func_(std::move(config.init_func)) {
    if (!init_func_) {
        throw core::ConfigurationError(fmt::format("{}: no init function given", to_string()));
    }
}

void InitAsync::init_async(std::stop_token token) {
    Value result = init_func_(token);
    if (token.stop_requested() || result.is_undef()) {
        return;
    }
    circuit().post([this, result] { set_output(result); });
}

void InitAsync::init_regular() {
    if (is_initialized() || !initdef().is_undef()) {
        return;
    }
    disable_output_events();
    set_output(nullptr);
}

void InitAsync::init_from_value(const Value& value) {
    set_output(value);
}

} // namespace circsim::blocks
