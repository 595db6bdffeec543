#pragma once

#include <circsim/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace circsim::core {

/// @brief Abstract interface for recording circuit activity.
/// @ingroup core
///
/// Implementations of TraceWriter serialise circuit activity to a
/// specific format (JSON, memory buffer, text, etc.).
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record at a given circuit time
///   2. type()  -- sets the record type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// Record types written by the kernel:
///   - `sim_start`, `sim_stop` (field `reason`)
///   - `output` (fields `block`, `value`)
///   - `event` (fields `source`, `dest`, `event`)
///   - `state` (fields `block`, `from`, `to`, `event`)
///   - `abort` (field `error`)
///
/// The Circuit holds an optional pointer to a TraceWriter. When no writer
/// is installed the overhead is a single null-pointer check.
///
/// @see Circuit::set_trace_writer()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given circuit time.
    virtual void begin(TimePoint time) = 0;

    /// @brief Set the record type name for the current record.
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, uint64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace circsim::core
