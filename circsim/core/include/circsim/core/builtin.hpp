#pragma once

#include <circsim/core/cblock.hpp>
#include <circsim/core/sblock.hpp>

#include <string_view>

namespace circsim::core {

/// @brief Reserved name of the automatic simulation control block.
inline constexpr std::string_view CONTROL_BLOCK_NAME = "_ctrl";

/// @brief Name prefix of automatic inverter blocks (`_not_<name>`).
inline constexpr std::string_view INVERTER_PREFIX = "_not_";

/// @brief Boolean negation of a single positional input.
///
/// Referencing `_not_<name>` anywhere in the circuit creates an inverter
/// of block `<name>` automatically when the circuit is finalized.
///
/// @ingroup core_blocks
class Not : public CBlock {
public:
    Not(Circuit& circuit, BlockOptions options);

    void start() override;
    [[nodiscard]] Value calc_output() const override;
};

/// @brief Simulation control block, created on demand under the name `_ctrl`.
///
/// Events:
/// - `shutdown`: stop the simulation normally.
/// - `abort`: stop the simulation with an error; `data["error"]` describes it.
///
/// @ingroup core_blocks
class ControlBlock : public SBlock {
public:
    ControlBlock(Circuit& circuit, BlockOptions options);

    [[nodiscard]] const HandlerTable& handlers() const override;

protected:
    void init_regular() override;

private:
    Value event_shutdown(const EventData& data);
    Value event_abort(const EventData& data);
};

} // namespace circsim::core
