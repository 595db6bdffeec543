#include <circsim/blocks/cblocks.hpp>
#include <circsim/core/error.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace circsim::blocks {

using core::Value;

FuncBlock::FuncBlock(core::Circuit& circuit, core::BlockOptions options, Config config)
    : FuncBlock(circuit, "FuncBlock", std::move(options), std::move(config)) {}

FuncBlock::FuncBlock(core::Circuit& circuit, std::string_view type_name, core::BlockOptions options,
                     Config config)
    : CBlock(circuit, type_name, std::move(options))
    , config_(std::move(config)) {
    if (!config_.func) {
        throw core::ConfigurationError(fmt::format("{}: no function given", to_string()));
    }
}

void FuncBlock::start() {
    if (config_.signature) {
        check_signature(*config_.signature);
    }
}

Value FuncBlock::calc_output() const {
    FuncArgs args;
    for (const auto& [name, size] : input_signature()) {
        if (name == core::POSITIONAL_GROUP) {
            args.positional = group(name);
        } else if (size) {
            args.named.emplace(name, Value::List(group(name)));
        } else {
            args.named.emplace(name, input(name));
        }
    }
    return config_.func(args);
}

And::And(core::Circuit& circuit, core::BlockOptions options)
    : FuncBlock(circuit, "And", std::move(options), Config{.func = [](const FuncArgs& args) {
        return Value(std::all_of(args.positional.begin(), args.positional.end(),
                                 [](const Value& v) { return v.truthy(); }));
    }}) {}

Or::Or(core::Circuit& circuit, core::BlockOptions options)
    : FuncBlock(circuit, "Or", std::move(options), Config{.func = [](const FuncArgs& args) {
        return Value(std::any_of(args.positional.begin(), args.positional.end(),
                                 [](const Value& v) { return v.truthy(); }));
    }}) {}

Compare::Compare(core::Circuit& circuit, core::BlockOptions options, Config config)
    : CBlock(circuit, "Compare", std::move(options))
    , config_(config) {
    if (config_.high < config_.low) {
        throw core::ConfigurationError(
            fmt::format("{}: high threshold cannot be lower than low threshold", to_string()));
    }
}

void Compare::start() {
    check_signature({core::SignatureItem::group(std::string(core::POSITIONAL_GROUP), 1)});
}

Value Compare::calc_output() const {
    double threshold = 0.0;
    if (!is_initialized()) {
        threshold = (config_.low + config_.high) / 2;
    } else {
        threshold = output().truthy() ? config_.low : config_.high;
    }
    return positional().front().as_double() >= threshold;
}

Override::Override(core::Circuit& circuit, core::BlockOptions options)
    : Override(circuit, std::move(options), Config{}) {}

Override::Override(core::Circuit& circuit, core::BlockOptions options, Config config)
    : CBlock(circuit, "Override", std::move(options))
    , config_(std::move(config)) {}

void Override::start() {
    check_signature({core::SignatureItem::single("input"), core::SignatureItem::single("override")});
}

Value Override::calc_output() const {
    const Value& value = input("override");
    return value == config_.null_value ? input("input") : value;
}

} // namespace circsim::blocks
