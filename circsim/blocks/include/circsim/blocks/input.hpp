#pragma once

#include <circsim/core/sblock.hpp>

#include <functional>
#include <optional>
#include <vector>

namespace circsim::blocks {

/// @brief Value checks of the input blocks.
struct InputValidation {
    std::optional<std::vector<core::Value>> allowed;
    std::function<bool(const core::Value&)> check;
    /// May throw to reject a value or return a converted value.
    std::function<core::Value(const core::Value&)> schema;

    /// @brief Check @p value against allowed, then check, then apply schema.
    /// @throws std::invalid_argument describing the rejection.
    [[nodiscard]] core::Value validate(const core::Value& value) const;
};

/// @brief Circuit input with optional value validation.
///
/// Accepts `put` events; the value is checked against @c allowed, then by
/// @c check, then transformed by @c schema. A rejected value is logged
/// and the event returns false, leaving the output unchanged.
///
/// @ingroup blocks_sblocks
class Input : public core::SBlock, public core::Persistent, public core::ValueInit {
public:
    struct Config {
        core::Value initdef;
        std::optional<std::vector<core::Value>> allowed;
        std::function<bool(const core::Value&)> check;
        /// May throw to reject a value or return a converted value.
        std::function<core::Value(const core::Value&)> schema;
        core::PersistenceOptions persistence;
    };

    /// @throws core::ConfigurationError if initdef fails the validation.
    Input(core::Circuit& circuit, core::BlockOptions options, Config config);
    Input(core::Circuit& circuit, core::BlockOptions options);

    [[nodiscard]] const core::HandlerTable& handlers() const override;

    void init_from_value(const core::Value& value) override;
    void restore_state(const core::Value& state) override;

    [[nodiscard]] core::EventData get_conf() const override;

private:
    core::Value event_put(const core::EventData& data);

    Config config_;
    InputValidation validation_;
};

} // namespace circsim::blocks
