#include <circsim/core/cblock.hpp>
#include <circsim/core/circuit.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace circsim::core {

InputRef InputRef::constant(Value value) {
    return InputRef(ConstTag{}, std::move(value));
}

std::string InputRef::to_string() const {
    return std::visit([](const auto& ref) -> std::string {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, Block*>) {
            return ref->to_string();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format("'{}'", ref);
        } else if constexpr (std::is_same_v<T, const Const*>) {
            return ref->to_string();
        } else {
            return fmt::format("<Const {}>", ref.to_string());
        }
    }, ref_);
}

void Connections::check_new_name(const std::string& name) const {
    if (name.empty()) {
        throw ConfigurationError("input name must be a non-empty string");
    }
    if (name == POSITIONAL_GROUP) {
        throw ConfigurationError(fmt::format("Input name '{}' is reserved", POSITIONAL_GROUP));
    }
    if (singles_.contains(name) || groups_.contains(name)) {
        throw ConfigurationError(fmt::format("Duplicate input name '{}'", name));
    }
}

Connections& Connections::positional(InputRef ref) {
    groups_[std::string(POSITIONAL_GROUP)].push_back(std::move(ref));
    return *this;
}

Connections& Connections::input(std::string name, InputRef ref) {
    check_new_name(name);
    singles_.emplace(std::move(name), std::move(ref));
    return *this;
}

Connections& Connections::input(std::string name) {
    InputRef ref(name);
    return input(std::move(name), std::move(ref));
}

Connections& Connections::group(std::string name, std::vector<InputRef> refs) {
    check_new_name(name);
    groups_.emplace(std::move(name), std::move(refs));
    return *this;
}

CBlock::CBlock(Circuit& circuit, std::string_view type_name, BlockOptions options)
    : Block(circuit, type_name, std::move(options)) {
    if (!every_output_events().empty()) {
        throw ConfigurationError(
            fmt::format("<{} '{}'>: on_every_output is supported by sequential blocks only",
                        type_name, name()));
    }
}

CBlock& CBlock::connect(Connections connections) {
    if (circuit().is_finalized()) {
        throw AlreadyFinalizedError(
            fmt::format("{}: cannot connect inputs after finalize()", to_string()));
    }
    if (connected_) {
        throw ConfigurationError(fmt::format("{}: connect() may be called only once", to_string()));
    }
    if (connections.empty()) {
        throw ConfigurationError(fmt::format("{}: no inputs to connect were given", to_string()));
    }
    pending_ = std::move(connections);
    connected_ = true;
    return *this;
}

CBlock& CBlock::connect(std::initializer_list<InputRef> positional) {
    Connections connections;
    for (const auto& ref : positional) {
        connections.positional(ref);
    }
    return connect(std::move(connections));
}

bool CBlock::eval_block() {
    Value value = calc_output();
    return update_output(std::move(value));
}

const Value& CBlock::input(std::string_view name) const {
    auto it = inputs_.find(name);
    if (it == inputs_.end() || it->second.is_group) {
        throw std::out_of_range(fmt::format("{}: no single input named '{}'", to_string(), name));
    }
    return *it->second.values.front();
}

std::vector<Value> CBlock::group(std::string_view name) const {
    auto it = inputs_.find(name);
    if (it == inputs_.end() || !it->second.is_group) {
        throw std::out_of_range(fmt::format("{}: no input group named '{}'", to_string(), name));
    }
    std::vector<Value> values;
    values.reserve(it->second.values.size());
    for (const Value* value : it->second.values) {
        values.push_back(*value);
    }
    return values;
}

bool CBlock::has_input(std::string_view name) const {
    if (!inputs_.empty()) {
        return inputs_.contains(name);
    }
    return pending_.singles_.contains(name) || pending_.groups_.contains(name);
}

EventData CBlock::get_conf() const {
    EventData conf = Block::get_conf();
    conf.insert_or_assign("type", "combinational");
    Value::List names;
    for (const auto& [name, size] : input_signature()) {
        names.emplace_back(name);
    }
    conf.insert_or_assign("inputs", std::move(names));
    return conf;
}

} // namespace circsim::core
