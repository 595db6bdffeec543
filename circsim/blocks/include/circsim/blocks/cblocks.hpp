#pragma once

#include <circsim/core/cblock.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace circsim::blocks {

/// @brief Input values passed to a FuncBlock function.
struct FuncArgs {
    /// Positional inputs in connection order.
    std::vector<core::Value> positional;
    /// Named inputs; groups are passed as lists.
    std::map<std::string, core::Value, std::less<>> named;
};

/// @brief Combinational block computing its output with a function.
///
/// @code
/// circuit.add<blocks::FuncBlock>(core::BlockOptions{.name = "sum"},
///     blocks::FuncBlock::Config{.func = [](const blocks::FuncArgs& args) {
///         return args.named.at("a").as_double() + args.named.at("b").as_double();
///     }})
///     .connect(core::Connections{}.input("a", "x").input("b", "y"));
/// @endcode
///
/// @ingroup blocks_cblocks
class FuncBlock : public core::CBlock {
public:
    using Func = std::function<core::Value(const FuncArgs&)>;

    struct Config {
        Func func;
        /// Checked when the circuit starts, if given.
        std::optional<std::vector<core::SignatureItem>> signature;
    };

    /// @throws core::ConfigurationError if no function is given.
    FuncBlock(core::Circuit& circuit, core::BlockOptions options, Config config);

    void start() override;
    [[nodiscard]] core::Value calc_output() const override;

protected:
    FuncBlock(core::Circuit& circuit, std::string_view type_name, core::BlockOptions options, Config config);

private:
    Config config_;
};

/// @brief Logical AND of all positional inputs; true without inputs.
/// @ingroup blocks_cblocks
class And : public FuncBlock {
public:
    And(core::Circuit& circuit, core::BlockOptions options);
};

/// @brief Logical OR of all positional inputs; false without inputs.
/// @ingroup blocks_cblocks
class Or : public FuncBlock {
public:
    Or(core::Circuit& circuit, core::BlockOptions options);
};

/// @brief Comparator with hysteresis.
///
/// The output becomes true when the input reaches @c high and false when
/// it drops below @c low. The first evaluation compares with the midpoint.
///
/// @ingroup blocks_cblocks
class Compare : public core::CBlock {
public:
    struct Config {
        double low{0.0};
        double high{0.0};
    };

    /// @throws core::ConfigurationError if high < low.
    Compare(core::Circuit& circuit, core::BlockOptions options, Config config);

    void start() override;
    [[nodiscard]] core::Value calc_output() const override;

private:
    Config config_;
};

/// @brief Pass @c input through unless @c override differs from the null value.
/// @ingroup blocks_cblocks
class Override : public core::CBlock {
public:
    struct Config {
        core::Value null_value{nullptr};
    };

    Override(core::Circuit& circuit, core::BlockOptions options, Config config);
    Override(core::Circuit& circuit, core::BlockOptions options);

    void start() override;
    [[nodiscard]] core::Value calc_output() const override;

private:
    Config config_;
};

} // namespace circsim::blocks
