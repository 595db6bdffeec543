#pragma once

#include <circsim/core/sblock.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace circsim::blocks {

/// @brief Call a function for each `put` event.
///
/// The function receives the event payload. Its result is returned as
/// `["result", value]` and sent as `value` with the on_success events. An
/// exception is logged, returned as `["error", message]` and sent as
/// `error` with the on_error events; it does not abort the circuit.
///
/// If @c stop_data is set, the function is called once more with it when
/// the simulation stops.
///
/// @ingroup blocks_sblocks
class OutputFunc : public core::SBlock {
public:
    struct Config {
        std::function<core::Value(const core::EventData&)> func;
        std::vector<core::Event> on_success;
        std::vector<core::Event> on_error;
        std::optional<core::EventData> stop_data;
    };

    /// @throws core::ConfigurationError without a function.
    OutputFunc(core::Circuit& circuit, core::BlockOptions options, Config config);

    [[nodiscard]] const core::HandlerTable& handlers() const override;

    void stop() override;

protected:
    void init_regular() override;
    void resolve_references() override;

private:
    core::Value event_put(const core::EventData& data);

    Config config_;
};

} // namespace circsim::blocks
