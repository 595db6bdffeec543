#pragma once

#include <circsim/core/types.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <map>

namespace circsim::core {

class Circuit;

/// @brief Ordering key of the circuit timer queue.
///
/// Timers due at the same time fire in insertion order.
struct TimerKey {
    TimePoint when;
    uint64_t sequence;

    auto operator<=>(const TimerKey&) const = default;
};

/// @brief Provides O(1) timer cancellation by wrapping a map iterator.
/// @ingroup core_events
///
/// A TimerId is returned by Circuit::add_timer() and stores an iterator into
/// the circuit's ordered timer map, enabling constant-time cancellation.
/// Default-constructed instances are invalid; only the Circuit may create
/// valid identifiers.
///
/// Timer callbacks should call clear() at their entry point; the circuit
/// removes the fired timer from its map and the stored iterator dangles.
///
/// @see Circuit::add_timer()
/// @see Circuit::cancel_timer()
class TimerId {
    friend class Circuit;

public:
    TimerId() = default;

    /// @brief Check whether this timer is still valid (not fired, not cancelled).
    [[nodiscard]] bool valid() const noexcept { return valid_; }

    explicit operator bool() const noexcept { return valid_; }

    /// @brief Expiration time; meaningful only while valid().
    [[nodiscard]] TimePoint when() const noexcept { return when_; }

    /// @brief Mark the timer as no longer valid.
    void clear() noexcept { valid_ = false; }

private:
    using Iterator = std::map<TimerKey, std::function<void()>>::iterator;

    TimerId(Iterator it, TimePoint when) : it_(it), when_(when), valid_(true) {}

    void invalidate() noexcept { valid_ = false; }

    Iterator it_{};
    TimePoint when_{};
    bool valid_{false};
};

} // namespace circsim::core
