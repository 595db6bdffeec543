#pragma once

#include <circsim/core/block.hpp>
#include <circsim/core/const_pool.hpp>

#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace circsim::core {

/// @brief Name of the reserved input group holding positional inputs.
inline constexpr std::string_view POSITIONAL_GROUP = "_";

/// @brief Reference to an input source, resolved when the circuit is finalized.
///
/// An input may be given as a block reference, a block name, a Const, or a
/// bare bool, number or null literal which is wrapped into a Const. Strings
/// are always block names; wrap string constants explicitly with constant().
///
/// @ingroup core_blocks
class InputRef {
public:
    using Ref = std::variant<Block*, std::string, const Const*, Value>;

    InputRef(Block& block) : ref_(&block) {}
    InputRef(const char* name) : ref_(std::string(name)) {}
    InputRef(std::string name) : ref_(std::move(name)) {}
    InputRef(const Const& c) : ref_(&c) {}
    InputRef(std::nullptr_t) : ref_(Value(nullptr)) {}

    template<typename T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
    InputRef(T literal) : ref_(Value(literal)) {}

    /// @brief A constant input of any value type, including strings.
    static InputRef constant(Value value);

    [[nodiscard]] const Ref& ref() const noexcept { return ref_; }

    /// @brief Human readable form used in diagnostics.
    [[nodiscard]] std::string to_string() const;

private:
    struct ConstTag {};
    InputRef(ConstTag, Value value) : ref_(std::move(value)) {}

    Ref ref_;
};

/// @brief Builder describing the inputs of a CBlock.
///
/// @code
/// blk.connect(Connections{}
///     .positional("a")
///     .positional(true)
///     .input("override", "ovr")
///     .group("data", {"x", "y", 0}));
/// @endcode
///
/// @see CBlock::connect
/// @ingroup core_blocks
class Connections {
public:
    /// @brief Append to the positional input group.
    Connections& positional(InputRef ref);

    /// @brief Single named input.
    /// @throws ConfigurationError for a reserved or duplicate name.
    Connections& input(std::string name, InputRef ref);

    /// @brief Single named input connected to the block of the same name.
    Connections& input(std::string name);

    /// @brief Named input group.
    Connections& group(std::string name, std::vector<InputRef> refs);

    [[nodiscard]] bool empty() const noexcept { return singles_.empty() && groups_.empty(); }

private:
    friend class CBlock;
    friend class Circuit;

    void check_new_name(const std::string& name) const;

    std::map<std::string, InputRef, std::less<>> singles_;
    std::map<std::string, std::vector<InputRef>, std::less<>> groups_;
};

/// @brief Expected shape of one input in a signature check.
///
/// A single input, or a group with an exact size or a size range.
///
/// @see CBlock::check_signature
/// @ingroup core_blocks
struct SignatureItem {
    std::string name;
    bool is_group{false};
    std::size_t min_size{0};
    std::optional<std::size_t> max_size;

    static SignatureItem single(std::string name);
    static SignatureItem group(std::string name, std::size_t size);
    static SignatureItem group_range(std::string name, std::size_t min_size,
                                     std::optional<std::size_t> max_size = std::nullopt);
};

/// @brief Connected input shape: nullopt for a single input, group size otherwise.
using InputSignature = std::map<std::string, std::optional<std::size_t>, std::less<>>;

/// @brief Combinational block.
///
/// The output is a pure function of the current input values computed by
/// calc_output(). Inputs are connected once, before the circuit is
/// finalized.
///
/// @ingroup core_blocks
class CBlock : public Block {
public:
    /// @brief Connect the inputs.
    /// @throws AlreadyFinalizedError after the circuit was finalized.
    /// @throws ConfigurationError if already connected or if @p connections is empty.
    CBlock& connect(Connections connections);

    /// @brief Connect positional inputs only.
    CBlock& connect(std::initializer_list<InputRef> positional);

    /// @brief Non-constant upstream blocks.
    [[nodiscard]] const std::set<Block*, BlockOrder>& iconnections() const noexcept {
        return iconnections_;
    }

    [[nodiscard]] bool is_connected() const noexcept { return connected_; }

    /// @brief Shape of the connected inputs.
    [[nodiscard]] InputSignature input_signature() const;

    /// @brief Compare the connected inputs with the expected signature.
    /// @throws SignatureError with a precise diagnostic on mismatch.
    /// @return The connected input signature.
    InputSignature check_signature(const std::vector<SignatureItem>& expected) const;

    /// @brief Evaluate the block and update the output.
    /// @return true if the output changed.
    bool eval_block();

    /// @brief Compute the output from the current inputs.
    [[nodiscard]] virtual Value calc_output() const = 0;

    [[nodiscard]] EventData get_conf() const override;

protected:
    CBlock(Circuit& circuit, std::string_view type_name, BlockOptions options);

    /// @brief Value of a single named input.
    /// @throws std::out_of_range for unknown names or groups.
    [[nodiscard]] const Value& input(std::string_view name) const;

    /// @brief Values of an input group.
    [[nodiscard]] std::vector<Value> group(std::string_view name) const;

    /// @brief Values of the positional inputs.
    [[nodiscard]] std::vector<Value> positional() const { return group(POSITIONAL_GROUP); }

    [[nodiscard]] bool has_input(std::string_view name) const;

private:
    friend class Circuit;

    struct ResolvedInput {
        bool is_group{false};
        std::vector<const Value*> values;
    };

    Connections pending_;
    bool connected_{false};
    std::map<std::string, ResolvedInput, std::less<>> inputs_;
    std::set<Block*, BlockOrder> iconnections_;
};

} // namespace circsim::core
