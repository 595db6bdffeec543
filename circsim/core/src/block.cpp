#include <circsim/core/block.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

namespace circsim::core {

bool BlockOrder::operator()(const Block* lhs, const Block* rhs) const noexcept {
    return lhs->id() < rhs->id();
}

Block::Block(Circuit& circuit, std::string_view type_name, BlockOptions options)
    : circuit_(circuit)
    , type_name_(type_name)
    , name_(std::move(options.name))
    , comment_(std::move(options.comment))
    , on_output_(std::move(options.on_output))
    , on_every_output_(std::move(options.on_every_output))
    , debug_(options.debug) {
    if (type_name_.empty()) {
        throw ConfigurationError("block type name must be a non-empty string");
    }
}

Block::~Block() = default;

std::string Block::to_string() const {
    return fmt::format("<{} '{}'>", type_name_, name_);
}

EventData Block::get_conf() const {
    return {
        {"class", type_name_},
        {"debug", debug_},
        {"comment", comment_},
        {"name", name_},
    };
}

void Block::resolve_references() {
    for (auto& event : on_output_) {
        event.resolve(circuit_);
    }
    for (auto& event : on_every_output_) {
        event.resolve(circuit_);
    }
}

bool Block::update_output(Value value) {
    if (value.is_undef()) {
        throw CircuitError(fmt::format("{}: output value must not be <UNDEF>", to_string()));
    }
    Value previous = output_;
    if (previous == value) {
        if (on_every_output_.empty()) {
            return false;
        }
        log_debug("output: {} (unchanged)", value);
    } else {
        log_debug("output: {} -> {}", previous, value);
        output_ = value;
        circuit_.trace([&](TraceWriter& w) {
            w.type("output");
            w.field("block", name_);
            w.field("value", output_.to_string());
        });
        for (auto& event : on_output_) {
            event.send(*this, {{"trigger", "output"}, {"previous", previous}, {"value", value}});
        }
    }
    for (auto& event : on_every_output_) {
        event.send(*this, {{"trigger", "output"}, {"previous", previous}, {"value", value}});
    }
    return previous != value;
}

} // namespace circsim::core
