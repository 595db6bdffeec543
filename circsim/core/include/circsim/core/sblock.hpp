#pragma once

#include <circsim/core/block.hpp>
#include <circsim/core/types.hpp>

#include <functional>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace circsim::core {

class SBlock;

/// @brief Per-class table of named event handlers.
///
/// Handlers are registered with member function pointers and looked up by
/// SBlock::event() before falling back to SBlock::handle_event().
///
/// @code
/// const HandlerTable& Counter::handlers() const {
///     static const HandlerTable table = HandlerTable{}
///         .on("inc", &Counter::event_inc)
///         .on("dec", &Counter::event_dec);
///     return table;
/// }
/// @endcode
///
/// @ingroup core_blocks
class HandlerTable {
public:
    using Handler = std::function<Value(SBlock&, const EventData&)>;

    template<typename T>
    HandlerTable& on(std::string etype, Value (T::*method)(const EventData&)) {
        static_assert(std::is_base_of_v<SBlock, T>, "handlers must be SBlock members");
        handlers_.insert_or_assign(std::move(etype), [method](SBlock& block, const EventData& data) {
            return (static_cast<T&>(block).*method)(data);
        });
        return *this;
    }

    /// @brief Add the handlers of @p base which are not defined here.
    HandlerTable& inherit(const HandlerTable& base);

    [[nodiscard]] const Handler* find(std::string_view etype) const;
    [[nodiscard]] bool contains(std::string_view etype) const { return find(etype) != nullptr; }
    [[nodiscard]] std::vector<std::string> names() const;

private:
    std::map<std::string, Handler, std::less<>> handlers_;
};

/// @brief Sequential block.
///
/// A block with internal state changed only by events. The output is set
/// with set_output(); an output change is reported to the circuit which
/// re-evaluates the connected combinational blocks.
///
/// Optional behaviours are added by deriving from the capability
/// interfaces Persistent, ValueInit, AsyncInit, AsyncStop and MainTask.
///
/// @ingroup core_blocks
class SBlock : public Block {
public:
    /// @brief Handle an event.
    ///
    /// Conditional event types are resolved first. The handler table is
    /// searched, then handle_event() is called. A recursive call on the same
    /// block is forbidden. Errors other than UnknownEventError abort the
    /// circuit and are rethrown, wrapped into BlockError unless already a
    /// CircuitError.
    ///
    /// @return The handler's result; null if a conditional event resolved
    ///         to "no event".
    /// @throws UnknownEventError if the block does not accept the event type.
    /// @throws CircuitError on a fatal error.
    Value event(const EventType& etype, EventData data = {});

    /// @brief Shortcut for event("put", {value: @p value}).
    Value put(Value value);

    /// @brief Internal state; defaults to the output value.
    [[nodiscard]] virtual Value get_state() const { return output(); }

    /// @brief Number of completed initialization steps (0, 1 or 2).
    [[nodiscard]] int init_steps_completed() const noexcept { return init_steps_completed_; }

    /// @brief Named event handlers of this block class.
    [[nodiscard]] virtual const HandlerTable& handlers() const;

    [[nodiscard]] EventData get_conf() const override;

protected:
    SBlock(Circuit& circuit, std::string_view type_name, BlockOptions options);

    /// @brief Set the output and notify the circuit on a change.
    /// @return true if the output changed.
    bool set_output(Value value);

    /// @brief Regular initialization, called after the persistent state
    /// restore was attempted.
    virtual void init_regular() {}

    /// @brief Handle event types not found in handlers().
    ///
    /// The default implementation returns UNDEF if `data[EVENT_BYPASS]` is
    /// true and throws UnknownEventError otherwise.
    virtual Value handle_event(const EventType& etype, const EventData& data);

private:
    friend class Circuit;
    friend class EventGuardRelax;

    bool event_active_{false};
    int init_steps_completed_{0};
};

/// @brief Temporarily allow event() to be reentered on a block.
///
/// Used by the FSM engine while running entry callbacks, which may request
/// a chained transition.
class EventGuardRelax {
public:
    explicit EventGuardRelax(SBlock& block) noexcept
        : block_(block)
        , saved_(block.event_active_) {
        block_.event_active_ = false;
    }

    ~EventGuardRelax() { block_.event_active_ = saved_; }

    EventGuardRelax(const EventGuardRelax&) = delete;
    EventGuardRelax& operator=(const EventGuardRelax&) = delete;

private:
    SBlock& block_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool saved_;
};

/// @brief Default timeout of AsyncInit and AsyncStop.
inline constexpr Duration DEFAULT_ASYNC_TIMEOUT = duration_from_seconds(10.0);

/// @brief Persistence options of a sequential block.
struct PersistenceOptions {
    /// Save the state to the circuit's persistent store.
    bool persistent{false};
    /// Save after each event; otherwise only when the simulation stops.
    bool sync_state{true};
    /// Saved states older than this are discarded; <= 0 discards always.
    std::optional<Duration> expiration;
};

/// @brief Capability: the internal state can be saved and restored.
///
/// The state returned by SBlock::get_state() is stored under the key
/// `<Type 'name'>` and passed back to restore_state() at the next start.
///
/// @ingroup core_blocks
class Persistent {
public:
    virtual ~Persistent() = default;

    [[nodiscard]] bool persistence_enabled() const noexcept { return options_.persistent; }
    [[nodiscard]] bool sync_state() const noexcept { return options_.sync_state; }
    [[nodiscard]] const std::optional<Duration>& expiration() const noexcept { return options_.expiration; }

    void disable_persistence() noexcept { options_.persistent = false; }

    /// @brief Initialize the block from a saved state.
    virtual void restore_state(const Value& state) = 0;

protected:
    explicit Persistent(PersistenceOptions options) : options_(std::move(options)) {}

private:
    PersistenceOptions options_;
};

/// @brief Capability: initialization from a configured initial value.
///
/// init_from_value() is called with initdef() when the block is still
/// uninitialized after SBlock::init_regular().
///
/// @ingroup core_blocks
class ValueInit {
public:
    virtual ~ValueInit() = default;

    [[nodiscard]] const Value& initdef() const noexcept { return initdef_; }

    virtual void init_from_value(const Value& value) = 0;

protected:
    explicit ValueInit(Value initdef = UNDEF) : initdef_(std::move(initdef)) {}

private:
    Value initdef_;
};

/// @brief Capability: asynchronous initialization.
///
/// init_async() runs on its own thread during the asynchronous init phase
/// and must return promptly when @p token is stop-requested. It must not
/// touch the block directly; use Circuit::post() or Circuit::submit().
///
/// @ingroup core_blocks
class AsyncInit {
public:
    virtual ~AsyncInit() = default;

    virtual void init_async(std::stop_token token) = 0;

    /// @brief Time limit of init_async(); <= 0 disables the async init.
    [[nodiscard]] Duration init_timeout() const noexcept { return init_timeout_; }

protected:
    explicit AsyncInit(std::optional<Duration> timeout)
        : init_timeout_(timeout.value_or(DEFAULT_ASYNC_TIMEOUT)) {}

private:
    Duration init_timeout_;
};

/// @brief Capability: asynchronous cleanup after stop().
/// @ingroup core_blocks
class AsyncStop {
public:
    virtual ~AsyncStop() = default;

    virtual void stop_async(std::stop_token token) = 0;

    /// @brief Time limit of stop_async(); <= 0 means a synchronous stop only.
    [[nodiscard]] Duration stop_timeout() const noexcept { return stop_timeout_; }

protected:
    explicit AsyncStop(std::optional<Duration> timeout)
        : stop_timeout_(timeout.value_or(DEFAULT_ASYNC_TIMEOUT)) {}

private:
    Duration stop_timeout_;
};

/// @brief Capability: a service thread running for the whole simulation.
///
/// main_task() is started when the block starts. It is stopped by a stop
/// request during the stop phase. Returning without a stop request, or
/// throwing, aborts the circuit.
///
/// @ingroup core_blocks
class MainTask : public AsyncStop {
public:
    virtual void main_task(std::stop_token token) = 0;

    void stop_async(std::stop_token /*token*/) override {}

protected:
    explicit MainTask(std::optional<Duration> stop_timeout = std::nullopt)
        : AsyncStop(stop_timeout) {}
};

} // namespace circsim::core
