#pragma once

#include <circsim/blocks/input.hpp>
#include <circsim/core/fsm.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace circsim::blocks {

/// @brief Circuit input whose value expires.
///
/// A `put` event stores a validated value for @c duration; a repeated
/// `put` restarts the period. Afterwards the output is the @c expired
/// value. Internally an FSM with states `expired` and `valid`. The saved
/// state carries the input value.
///
/// @ingroup blocks_fsm
class InputExp : public core::Fsm {
public:
    struct Config {
        /// Validity period of each value; Duration::infinite() never expires.
        core::Duration duration;
        /// Output while no value is valid.
        core::Value expired{nullptr};
        /// Initial value, valid for one period; UNDEF starts expired.
        core::Value initdef;
        std::optional<std::vector<core::Value>> allowed;
        std::function<bool(const core::Value&)> check;
        std::function<core::Value(const core::Value&)> schema;
        core::PersistenceOptions persistence;
    };

    /// @throws core::ConfigurationError for a non-positive duration or if
    ///         the initial or expired value fails the validation.
    InputExp(core::Circuit& circuit, core::BlockOptions options, Config config);

    static const core::FsmTable& control_table();

    /// @brief `[state, expiry-seconds | null, value | null]`
    [[nodiscard]] core::Value get_state() const override;
    void restore_state(const core::Value& state) override;

protected:
    [[nodiscard]] core::Value calc_output() const override;

private:
    bool cond_put(const core::EventData& data);
    void enter_expired(const core::EventData& data);

    InputValidation validation_;
    core::Value expired_;
    core::Value input_;
};

} // namespace circsim::blocks
