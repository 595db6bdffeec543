#pragma once

#include <circsim/core/sblock.hpp>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace circsim::blocks {

/// @brief Source of measured or computed values.
///
/// A background task calls @c func every @c interval and sets the output
/// to each value other than UNDEF. The asynchronous initialization waits
/// for the first value, up to @c init_timeout; initdef is used if none
/// arrives in time.
///
/// @c func runs on the polling thread, not on the simulation thread.
///
/// @ingroup blocks_sblocks
class ValuePoll : public core::SBlock, public core::ValueInit, public core::AsyncInit, public core::MainTask {
public:
    struct Config {
        std::function<core::Value()> func;
        core::Duration interval;
        core::Value initdef;
        std::optional<core::Duration> init_timeout;
        std::optional<core::Duration> stop_timeout;
    };

    /// @throws core::ConfigurationError without a function or with a non-positive interval.
    ValuePoll(core::Circuit& circuit, core::BlockOptions options, Config config);

    void init_from_value(const core::Value& value) override;
    void init_async(std::stop_token token) override;
    void main_task(std::stop_token token) override;

private:
    Config config_;
    std::mutex mutex_;
    std::condition_variable_any cond_;
    bool polled_{false};
};

} // namespace circsim::blocks
