#include <circsim/core/builtin.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

namespace circsim::core {

namespace {

std::string source_of(const EventData& data) {
    Value source = get_or(data, "source");
    return source.is_string() ? source.as_string() : "<no-source-data>";
}

} // anonymous namespace

Not::Not(Circuit& circuit, BlockOptions options)
    : CBlock(circuit, "Not", std::move(options)) {}

void Not::start() {
    check_signature({SignatureItem::group(std::string(POSITIONAL_GROUP), 1)});
}

Value Not::calc_output() const {
    return !positional().front().truthy();
}

ControlBlock::ControlBlock(Circuit& circuit, BlockOptions options)
    : SBlock(circuit, "ControlBlock", std::move(options)) {}

const HandlerTable& ControlBlock::handlers() const {
    static const HandlerTable table = HandlerTable{}
        .on("shutdown", &ControlBlock::event_shutdown)
        .on("abort", &ControlBlock::event_abort);
    return table;
}

void ControlBlock::init_regular() {
    set_output(nullptr);
}

Value ControlBlock::event_shutdown(const EventData& data) {
    circuit().abort(CancelledError(
        fmt::format("{}: shutdown requested by '{}'", to_string(), source_of(data))));
    return nullptr;
}

Value ControlBlock::event_abort(const EventData& data) {
    Value error = get_or(data, "error", "<no-error-data>");
    circuit().abort(CircuitError(fmt::format("{}: error reported by '{}': {}",
                                             to_string(), source_of(data),
                                             error.is_string() ? error.as_string() : error.to_string())));
    return nullptr;
}

} // namespace circsim::core
