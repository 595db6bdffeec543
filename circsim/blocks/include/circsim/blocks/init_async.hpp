#pragma once

#include <circsim/core/sblock.hpp>

#include <functional>
#include <optional>
#include <stop_token>

namespace circsim::blocks {

/// @brief Block initialized once by a function run during the async init phase.
///
/// The result of @c init_func becomes the output. If the function fails or
/// times out, initdef is used; without initdef the output is set to null
/// and output events are disabled.
///
/// @ingroup blocks_sblocks
class InitAsync : public core::SBlock, public core::ValueInit, public core::AsyncInit {
public:
    struct Config {
        /// Runs on its own thread; should return early on a stop request.
        std::function<core::Value(std::stop_token)> init_func;
        core::Value initdef;
        std::optional<core::Duration> init_timeout;
    };

    /// @throws core::ConfigurationError without an init function.
    InitAsync(core::Circuit& circuit, core::BlockOptions options, Config config);

    void init_from_value(const core::Value& value) override;
    void init_async(std::stop_token token) override;

protected:
    void init_regular() override;

private:
    std::function<core::Value(std::stop_token)> init_func_;
};

} // namespace circsim::blocks
