#pragma once

#include <circsim/core/sblock.hpp>

#include <optional>

namespace circsim::blocks {

/// @brief Up/down counter, optionally counting modulo M.
///
/// Events: `inc` and `dec` (optional `amount`, default 1), `put` (`value`)
/// and `reset` (back to initdef). Every event returns the new output.
/// The modulo result has the sign of the modulus.
///
/// @ingroup blocks_sblocks
class Counter : public core::SBlock, public core::Persistent, public core::ValueInit {
public:
    struct Config {
        /// Integer or floating point modulus; nullopt counts without wrapping.
        std::optional<core::Value> modulo;
        core::Value initdef{0};
        core::PersistenceOptions persistence;
    };

    /// @throws core::ConfigurationError for a zero or non-numeric modulo.
    Counter(core::Circuit& circuit, core::BlockOptions options, Config config);
    Counter(core::Circuit& circuit, core::BlockOptions options);

    [[nodiscard]] const core::HandlerTable& handlers() const override;

    void init_from_value(const core::Value& value) override;
    void restore_state(const core::Value& state) override;

private:
    core::Value event_inc(const core::EventData& data);
    core::Value event_dec(const core::EventData& data);
    core::Value event_put(const core::EventData& data);
    core::Value event_reset(const core::EventData& data);

    core::Value set_counter(const core::Value& value);

    std::optional<core::Value> modulo_;
};

} // namespace circsim::blocks
