#pragma once

#include <compare>
#include <cstdint>
#include <limits>

namespace circsim::core {

/// @brief Time interval represented as an integer nanosecond count.
///
/// Duration wraps an `int64_t` nanosecond value with a private constructor.
/// All construction goes through named factories or bridge functions, ensuring
/// explicit conversions between seconds (double) and nanoseconds (int64_t).
///
/// A dedicated infinite value is used by timed FSM states which never expire.
///
/// @see duration_from_seconds, duration_from_nanoseconds, duration_to_seconds
/// @see TimePoint
/// @ingroup core_types
class Duration {
    int64_t ns_;

    explicit constexpr Duration(int64_t ns) noexcept : ns_(ns) {}

    static constexpr int64_t INFINITE_NS = std::numeric_limits<int64_t>::max();

    // Round double seconds to nearest nanosecond, saturate to infinity
    static constexpr int64_t secs_to_ns(double s) noexcept {
        if (s >= 9.2e9) {
            return INFINITE_NS;
        }
        if (s <= -9.2e9) {
            return -INFINITE_NS;
        }
        return static_cast<int64_t>(s * 1e9 + (s >= 0.0 ? 0.5 : -0.5));
    }

    // Bridge functions are friends so they can use the private constructor
    friend constexpr Duration duration_from_seconds(double s) noexcept;
    friend constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept;
    friend constexpr Duration duration_from_milliseconds(int64_t ms) noexcept;
    friend constexpr double duration_to_seconds(Duration d) noexcept;
    friend constexpr int64_t duration_to_nanoseconds(Duration d) noexcept;

public:
    /// @brief Default constructor: zero duration.
    constexpr Duration() noexcept : ns_(0) {}

    /// @brief Named factory returning a zero-length duration.
    static constexpr Duration zero() noexcept { return Duration{0}; }

    /// @brief Named factory returning a duration that never elapses.
    static constexpr Duration infinite() noexcept { return Duration{INFINITE_NS}; }

    /// @brief Check for the infinite duration.
    [[nodiscard]] constexpr bool is_infinite() const noexcept { return ns_ == INFINITE_NS; }

    /// @brief Convert to seconds (double); the infinite duration maps to +inf.
    [[nodiscard]] constexpr double seconds() const noexcept {
        if (ns_ == INFINITE_NS) {
            return std::numeric_limits<double>::infinity();
        }
        return static_cast<double>(ns_) / 1e9;
    }

    /// @brief Return the raw nanosecond count.
    [[nodiscard]] constexpr int64_t nanoseconds() const noexcept {
        return ns_;
    }

    constexpr Duration operator+(Duration rhs) const noexcept {
        return Duration{ns_ + rhs.ns_};
    }

    constexpr Duration operator-(Duration rhs) const noexcept {
        return Duration{ns_ - rhs.ns_};
    }

    constexpr Duration& operator+=(Duration rhs) noexcept {
        ns_ += rhs.ns_;
        return *this;
    }

    constexpr Duration& operator-=(Duration rhs) noexcept {
        ns_ -= rhs.ns_;
        return *this;
    }

    constexpr Duration operator-() const noexcept {
        return Duration{-ns_};
    }

    constexpr auto operator<=>(const Duration& rhs) const noexcept = default;
    constexpr bool operator==(const Duration& rhs) const noexcept = default;
};

/// @brief Absolute circuit time as a Duration offset from the UNIX epoch.
///
/// In real-time mode the circuit clock follows the system clock, so stored
/// time points (timer expirations, the persistent data stop timestamp) stay
/// meaningful across program restarts. In virtual-time mode the circuit
/// clock only moves forward when the kernel jumps to the next timer.
///
/// TimePoint supports arithmetic with Duration (TimePoint +/- Duration yields
/// TimePoint) and differencing (TimePoint - TimePoint yields Duration).
///
/// @see time_from_seconds, time_to_seconds, Duration
/// @ingroup core_types
class TimePoint {
    Duration since_epoch_;

    explicit constexpr TimePoint(Duration d) noexcept : since_epoch_(d) {}

    friend constexpr TimePoint time_from_seconds(double s) noexcept;
    friend constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept;

public:
    /// @brief Default constructor: epoch (time zero).
    constexpr TimePoint() noexcept : since_epoch_(Duration::zero()) {}

    static constexpr TimePoint epoch() noexcept {
        return TimePoint{Duration::zero()};
    }

    [[nodiscard]] constexpr Duration time_since_epoch() const noexcept {
        return since_epoch_;
    }

    constexpr TimePoint operator+(Duration d) const noexcept {
        return TimePoint{since_epoch_ + d};
    }

    constexpr TimePoint operator-(Duration d) const noexcept {
        return TimePoint{since_epoch_ - d};
    }

    constexpr TimePoint& operator+=(Duration d) noexcept {
        since_epoch_ += d;
        return *this;
    }

    constexpr Duration operator-(TimePoint rhs) const noexcept {
        return since_epoch_ - rhs.since_epoch_;
    }

    constexpr auto operator<=>(const TimePoint& rhs) const noexcept = default;
    constexpr bool operator==(const TimePoint& rhs) const noexcept = default;
};

// ============================================================================
// Conversions between Duration/TimePoint and seconds
// ============================================================================

/// @brief Create a Duration from a value in seconds (round to nearest ns).
///
/// Values too large for the nanosecond representation, including +inf,
/// become Duration::infinite().
[[nodiscard]] constexpr Duration duration_from_seconds(double s) noexcept {
    return Duration{Duration::secs_to_ns(s)};
}

[[nodiscard]] constexpr Duration duration_from_milliseconds(int64_t ms) noexcept {
    return Duration{ms * 1'000'000};
}

[[nodiscard]] constexpr Duration duration_from_nanoseconds(int64_t ns) noexcept {
    return Duration{ns};
}

[[nodiscard]] constexpr double duration_to_seconds(Duration d) noexcept {
    return d.seconds();
}

[[nodiscard]] constexpr int64_t duration_to_nanoseconds(Duration d) noexcept {
    return d.nanoseconds();
}

/// @brief Create a TimePoint from UNIX time in seconds.
[[nodiscard]] constexpr TimePoint time_from_seconds(double s) noexcept {
    return TimePoint{duration_from_seconds(s)};
}

[[nodiscard]] constexpr TimePoint time_from_nanoseconds(int64_t ns) noexcept {
    return TimePoint{duration_from_nanoseconds(ns)};
}

/// @brief Convert a TimePoint to UNIX time in seconds (double).
[[nodiscard]] constexpr double time_to_seconds(TimePoint tp) noexcept {
    return tp.time_since_epoch().seconds();
}

} // namespace circsim::core
