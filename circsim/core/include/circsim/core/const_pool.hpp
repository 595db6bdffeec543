#pragma once

#include <circsim/core/value.hpp>

#include <memory>
#include <string>
#include <unordered_map>

namespace circsim::core {

/// @brief Immutable literal usable as a CBlock input.
///
/// A Const is not a block: it has no name, is never evaluated and never
/// appears in `iconnections`. Equal literals share one interned Const
/// within a ConstPool.
///
/// @see ConstPool
/// @ingroup core_values
class Const {
public:
    /// @throws ConfigurationError if @p value is UNDEF.
    explicit Const(Value value);

    Const(const Const&) = delete;
    Const& operator=(const Const&) = delete;

    [[nodiscard]] const Value& output() const noexcept { return value_; }

    /// @brief "<Const value>"
    [[nodiscard]] std::string to_string() const;

private:
    Value value_;
};

/// @brief Interning arena of Const objects.
///
/// Every Circuit owns one pool; its Consts are released with the circuit.
/// A standalone pool may be shared between circuits as long as it outlives
/// them.
///
/// @ingroup core_values
class ConstPool {
public:
    /// @brief Return the interned Const for @p value, creating it if needed.
    const Const& get(const Value& value);

    [[nodiscard]] std::size_t size() const noexcept { return pool_.size(); }

    void clear() noexcept { pool_.clear(); }

private:
    std::unordered_map<Value, std::unique_ptr<Const>, ValueHash> pool_;
};

} // namespace circsim::core
