#pragma once

#include <circsim/core/event.hpp>
#include <circsim/core/sblock.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace circsim::blocks {

/// @brief Periodically repeat the last received event.
///
/// An event of the repeated type is forwarded at once with `repeat = 0`
/// and then resent every @c interval with `repeat` counting 1, 2, ...
/// until a new event arrives or @c count repetitions were sent. The
/// original sender is passed on as `orig_source`. The output is the
/// current repetition number.
///
/// @code
/// circuit.add<blocks::Repeat>(core::BlockOptions{.name = "keepalive"}, blocks::Repeat::Config{
///     .event = core::Event("link", "ping"),
///     .interval = core::duration_from_seconds(30.0),
/// });
/// @endcode
///
/// @ingroup blocks_sblocks
class Repeat : public core::SBlock, public core::MainTask {
public:
    struct Config {
        /// Destination and type of the repeated event.
        core::Event event;
        core::Duration interval;
        /// Maximum number of repetitions; nullopt repeats forever.
        std::optional<int64_t> count;
        std::optional<core::Duration> stop_timeout;
    };

    /// @throws core::ConfigurationError for a non-positive interval or a negative count.
    Repeat(core::Circuit& circuit, core::BlockOptions options, Config config);

    void main_task(std::stop_token token) override;

    [[nodiscard]] core::EventData get_conf() const override;

protected:
    void init_regular() override;
    void resolve_references() override;
    core::Value handle_event(const core::EventType& etype, const core::EventData& data) override;

private:
    void send_repeated(const core::EventData& data, int64_t repeat);

    Config config_;
    std::mutex mutex_;
    std::condition_variable_any cond_;
    std::deque<core::EventData> queue_;
};

} // namespace circsim::blocks
