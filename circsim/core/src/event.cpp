#include <circsim/core/event.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>
#include <circsim/core/sblock.hpp>

#include <fmt/format.h>

namespace circsim::core {

namespace {

std::string check_name(std::string name, const char* what) {
    if (name.empty()) {
        throw ConfigurationError(fmt::format("{} must be a non-empty string", what));
    }
    return name;
}

std::shared_ptr<const EventType> share(std::optional<EventType> etype) {
    if (!etype) {
        return nullptr;
    }
    return std::make_shared<const EventType>(std::move(*etype));
}

bool same_branch(const std::shared_ptr<const EventType>& lhs,
                 const std::shared_ptr<const EventType>& rhs) noexcept {
    if (!lhs || !rhs) {
        return !lhs && !rhs;
    }
    return *lhs == *rhs;
}

} // anonymous namespace

EventType::EventType(const char* name)
    : EventType(std::string(name)) {}

EventType::EventType(std::string name)
    : kind_(Kind::Named)
    , name_(check_name(std::move(name), "event name")) {}

EventType::EventType(Kind kind, std::string name,
                     std::shared_ptr<const EventType> etrue, std::shared_ptr<const EventType> efalse)
    : kind_(kind)
    , name_(std::move(name))
    , etrue_(std::move(etrue))
    , efalse_(std::move(efalse)) {}

std::optional<EventType> EventType::resolve(const EventData& data) const {
    const EventType* current = this;
    while (current->kind_ == Kind::Conditional) {
        auto it = data.find("value");
        bool value = it != data.end() && it->second.truthy();
        current = value ? current->etrue_.get() : current->efalse_.get();
        if (current == nullptr) {
            return std::nullopt;
        }
    }
    return *current;
}

std::string EventType::to_string() const {
    switch (kind_) {
        case Kind::Named:
            return name_;
        case Kind::Goto:
            return fmt::format("Goto('{}')", name_);
        case Kind::Conditional:
            return fmt::format("Cond({}, {})",
                               etrue_ ? etrue_->to_string() : "None",
                               efalse_ ? efalse_->to_string() : "None");
    }
    return name_;
}

bool operator==(const EventType& lhs, const EventType& rhs) noexcept {
    return lhs.kind_ == rhs.kind_ && lhs.name_ == rhs.name_
        && same_branch(lhs.etrue_, rhs.etrue_) && same_branch(lhs.efalse_, rhs.efalse_);
}

EventType cond(std::optional<EventType> etrue, std::optional<EventType> efalse) {
    return EventType(EventType::Kind::Conditional, "", share(std::move(etrue)), share(std::move(efalse)));
}

EventType go_to(std::string state) {
    return EventType(EventType::Kind::Goto, check_name(std::move(state), "state name"), nullptr, nullptr);
}

Event::Event(std::string dest, EventType etype, std::vector<EventFilter> filters)
    : dest_name_(check_name(std::move(dest), "event destination"))
    , etype_(std::move(etype))
    , filters_(std::move(filters)) {}

Event::Event(SBlock& dest, EventType etype, std::vector<EventFilter> filters)
    : dest_name_(dest.name())
    , dest_(&dest)
    , etype_(std::move(etype))
    , filters_(std::move(filters)) {}

void Event::resolve(Circuit& circuit) {
    if (dest_ != nullptr) {
        return;
    }
    Block& block = circuit.resolve_name(dest_name_);
    dest_ = dynamic_cast<SBlock*>(&block);
    if (dest_ == nullptr) {
        throw ConfigurationError(
            fmt::format("event destination {} is not a sequential block", block.to_string()));
    }
}

Value Event::send(Block& source, EventData data) {
    if (dest_ == nullptr) {
        resolve(source.circuit());
    }
    if (&dest_->circuit() != &source.circuit()) {
        throw CircuitError(
            fmt::format("event destination {} is not in the current circuit", dest_->to_string()));
    }
    data.insert_or_assign("source", source.name());
    for (auto& filter : filters_) {
        auto filtered = filter(std::move(data));
        if (!filtered) {
            source.log_debug("Not sending event '{}' to {} (rejected by a filter)",
                             etype_.to_string(), dest_->to_string());
            return false;
        }
        data = std::move(*filtered);
    }
    if (dest_->init_steps_completed() < 2) {
        dest_->log_debug("pending event, initializing early");
        source.circuit().init_sblock(*dest_, true);
    }
    source.log_debug("sending event '{}' to {}", etype_.to_string(), dest_->to_string());
    source.circuit().trace([&](TraceWriter& w) {
        w.type("event");
        w.field("source", source.name());
        w.field("dest", dest_->name());
        w.field("event", etype_.to_string());
    });
    return dest_->event(etype_, std::move(data));
}

} // namespace circsim::core
