#pragma once

#include <circsim/core/fsm.hpp>

#include <optional>
#include <string>

namespace circsim::blocks {

/// @brief Restartable on/off timer.
///
/// An FSM with states `off` and `on`. Events `start`, `stop` and `toggle`.
/// State `on` lasts @c t_on and state `off` lasts @c t_off; both default
/// to infinity. The output is true in state `on`.
///
/// A non-restartable timer ignores `start` while on and `stop` while off,
/// so a running period is not extended.
///
/// @code
/// // monostable: 5 s pulse after each start event
/// circuit.add<blocks::Timer>(core::BlockOptions{.name = "pulse"},
///     blocks::Timer::Config{.t_on = core::duration_from_seconds(5.0)});
/// @endcode
///
/// @ingroup blocks_fsm
class Timer : public core::Fsm {
public:
    struct Config {
        std::optional<core::Duration> t_on;
        std::optional<core::Duration> t_off;
        bool restartable{true};
        /// Initial state, `off` if empty.
        std::string initdef;
        core::PersistenceOptions persistence;
    };

    Timer(core::Circuit& circuit, core::BlockOptions options, Config config);
    Timer(core::Circuit& circuit, core::BlockOptions options);

    /// @brief Control tables shared by all timers.
    static const core::FsmTable& control_table();

protected:
    [[nodiscard]] core::Value calc_output() const override;

private:
    bool cond_start(const core::EventData& data);
    bool cond_stop(const core::EventData& data);

    bool restartable_;
};

} // namespace circsim::blocks
