#include <circsim/core/sblock.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <exception>

namespace circsim::core {

namespace {

class EventActiveScope {
public:
    explicit EventActiveScope(bool& flag) noexcept : flag_(flag) { flag_ = true; }
    ~EventActiveScope() { flag_ = false; }

    EventActiveScope(const EventActiveScope&) = delete;
    EventActiveScope& operator=(const EventActiveScope&) = delete;

private:
    bool& flag_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // anonymous namespace

HandlerTable& HandlerTable::inherit(const HandlerTable& base) {
    for (const auto& [name, handler] : base.handlers_) {
        handlers_.try_emplace(name, handler);
    }
    return *this;
}

const HandlerTable::Handler* HandlerTable::find(std::string_view etype) const {
    auto it = handlers_.find(etype);
    return it == handlers_.end() ? nullptr : &it->second;
}

std::vector<std::string> HandlerTable::names() const {
    std::vector<std::string> result;
    result.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        result.push_back(name);
    }
    return result;
}

SBlock::SBlock(Circuit& circuit, std::string_view type_name, BlockOptions options)
    : Block(circuit, type_name, std::move(options)) {}

const HandlerTable& SBlock::handlers() const {
    static const HandlerTable empty;
    return empty;
}

Value SBlock::put(Value value) {
    return event("put", {{"value", std::move(value)}});
}

Value SBlock::event(const EventType& etype, EventData data) {
    if (data.empty()) {
        log_debug("got event '{}'", etype.to_string());
    } else {
        log_debug("got event '{}', data: {}", etype.to_string(), core::to_string(data));
    }
    if (event_active_) {
        auto error = std::make_exception_ptr(
            CircuitError(fmt::format("{}: Forbidden recursive event() call", to_string())));
        circuit().abort(error);
        std::rethrow_exception(error);
    }

    auto* persistent = dynamic_cast<Persistent*>(this);
    auto on_error = [this, persistent] {
        if (persistent != nullptr && persistent->persistence_enabled() && !circuit().is_ready()) {
            log_warning("Disabling persistent state due to an error");
            persistent->disable_persistence();
        }
    };

    Value result;
    try {
        EventActiveScope scope(event_active_);
        std::optional<EventType> resolved = etype.resolve(data);
        if (!resolved) {
            log_debug("conditional event resolved to no event");
            result = nullptr;
        } else if (const auto* handler = resolved->is_named() ? handlers().find(resolved->name()) : nullptr) {
            result = (*handler)(*this, data);
        } else {
            result = handle_event(*resolved, data);
        }
    } catch (const UnknownEventError&) {
        throw;
    } catch (const CircuitError&) {
        circuit().abort(std::current_exception());
        on_error();
        throw;
    } catch (const std::exception& e) {
        auto error = std::make_exception_ptr(BlockError(fmt::format(
            "{}: {} during handling of event '{}', data: {}",
            to_string(), e.what(), etype.to_string(), core::to_string(data))));
        circuit().abort(error);
        on_error();
        std::rethrow_exception(error);
    }

    if (persistent != nullptr && persistent->persistence_enabled() && persistent->sync_state()) {
        circuit().save_persistent_state(*this);
    }
    return result;
}

Value SBlock::handle_event(const EventType& etype, const EventData& data) {
    if (get_or(data, EVENT_BYPASS).truthy()) {
        return UNDEF;
    }
    throw UnknownEventError(fmt::format("{}: Unknown event type '{}'", to_string(), etype.to_string()));
}

bool SBlock::set_output(Value value) {
    bool changed = update_output(std::move(value));
    if (changed) {
        circuit().notify_output_change(*this);
    }
    return changed;
}

EventData SBlock::get_conf() const {
    EventData conf = Block::get_conf();
    conf.insert_or_assign("type", "sequential");
    Value::List events;
    for (const auto& name : handlers().names()) {
        events.emplace_back(name);
    }
    conf.insert_or_assign("events", std::move(events));
    if (const auto* persistent = dynamic_cast<const Persistent*>(this)) {
        conf.insert_or_assign("persistent", persistent->persistence_enabled());
    }
    return conf;
}

} // namespace circsim::core
