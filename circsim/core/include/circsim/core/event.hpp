#pragma once

#include <circsim/core/value.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace circsim::core {

class Block;
class Circuit;
class SBlock;

/// @brief Event type: a plain name, a conditional choice or a direct goto.
///
/// - Named: the usual event type, a non-empty string.
/// - Conditional: resolved by the receiving block to one of two event
///   types by the truth value of `data["value"]` (missing means false).
///   An unset branch means "no event".
/// - Goto: a direct FSM transition to the given state, bypassing the
///   transition table.
///
/// A `const char*` or `std::string` converts implicitly to a named type.
///
/// @see cond, go_to
/// @ingroup core_events
class EventType {
public:
    enum class Kind { Named, Conditional, Goto };

    /// @throws ConfigurationError for an empty name.
    EventType(const char* name);
    EventType(std::string name);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_named() const noexcept { return kind_ == Kind::Named; }
    [[nodiscard]] bool is_conditional() const noexcept { return kind_ == Kind::Conditional; }
    [[nodiscard]] bool is_goto() const noexcept { return kind_ == Kind::Goto; }

    /// @brief Event name of a Named type, target state of a Goto type.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::shared_ptr<const EventType>& on_true() const noexcept { return etrue_; }
    [[nodiscard]] const std::shared_ptr<const EventType>& on_false() const noexcept { return efalse_; }

    /// @brief Resolve a Conditional type against the payload.
    ///
    /// Nested conditional types are resolved recursively. Named and Goto
    /// types resolve to themselves.
    ///
    /// @return The effective event type, or nullopt for "no event".
    [[nodiscard]] std::optional<EventType> resolve(const EventData& data) const;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const EventType& lhs, const EventType& rhs) noexcept;

private:
    EventType(Kind kind, std::string name,
              std::shared_ptr<const EventType> etrue, std::shared_ptr<const EventType> efalse);

    friend EventType cond(std::optional<EventType> etrue, std::optional<EventType> efalse);
    friend EventType go_to(std::string state);

    Kind kind_;
    std::string name_;
    std::shared_ptr<const EventType> etrue_;
    std::shared_ptr<const EventType> efalse_;
};

/// @brief Conditional event type: @p etrue if data["value"] is true,
/// @p efalse otherwise; nullopt branches send no event.
[[nodiscard]] EventType cond(std::optional<EventType> etrue, std::optional<EventType> efalse);

/// @brief Direct FSM transition to @p state.
/// @throws ConfigurationError for an empty state name.
[[nodiscard]] EventType go_to(std::string state);

/// @brief Event filter: returns the (possibly modified) payload, or nullopt
/// to reject the event.
using EventFilter = std::function<std::optional<EventData>(EventData)>;

/// @brief Event payload key suppressing UnknownEventError.
///
/// When `data[EVENT_BYPASS]` is true, an event of an unsupported type
/// returns UNDEF instead of raising.
inline constexpr std::string_view EVENT_BYPASS = "bypass_unknown";

/// @brief An event descriptor: destination, type and filter pipeline.
///
/// The destination is a sequential block given either by reference or
/// by name; names are resolved when the circuit is finalized.
///
/// @ingroup core_events
class Event {
public:
    Event(std::string dest, EventType etype = "put", std::vector<EventFilter> filters = {});
    Event(SBlock& dest, EventType etype = "put", std::vector<EventFilter> filters = {});

    [[nodiscard]] const EventType& etype() const noexcept { return etype_; }
    [[nodiscard]] const std::string& dest_name() const noexcept { return dest_name_; }

    /// @brief Destination block; nullptr until resolved.
    [[nodiscard]] SBlock* destination() const noexcept { return dest_; }

    /// @brief Resolve the destination name.
    /// @throws ConfigurationError if the name does not refer to a sequential
    ///         block of @p circuit.
    void resolve(Circuit& circuit);

    /// @brief Deliver the event.
    ///
    /// Stamps "source" with the source block name, runs the filters in
    /// order, eagerly initializes a never-initialized destination and
    /// finally calls the destination's SBlock::event().
    ///
    /// @return The event() result, or false if a filter rejected the event.
    /// @throws CircuitError if the destination belongs to another circuit.
    Value send(Block& source, EventData data = {});

private:
    std::string dest_name_;
    SBlock* dest_{nullptr};
    EventType etype_;
    std::vector<EventFilter> filters_;
};

} // namespace circsim::core
