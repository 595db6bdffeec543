#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace circsim::core {

/// @brief Type of the UNDEF sentinel.
/// @ingroup core_values
struct Undef {
    constexpr bool operator==(const Undef&) const noexcept = default;
};

/// @brief "No output produced yet."
///
/// A block output starts as UNDEF and never returns to UNDEF once a real
/// value has been produced. Event handlers return UNDEF to signal that
/// the event was not handled.
inline constexpr Undef UNDEF{};

/// @brief Dynamically typed block output and event payload value.
///
/// A Value holds one of: UNDEF, null, bool, 64-bit integer, double,
/// string, or a list of Values. Integers and doubles compare equal when
/// numerically equal, and the hash is consistent with that equality.
/// bool is a separate type and never equals a number.
///
/// @ingroup core_values
class Value {
public:
    using List = std::vector<Value>;
    using Storage = std::variant<Undef, std::nullptr_t, bool, int64_t, double, std::string, List>;

    /// @brief Default constructor: UNDEF.
    Value() = default;

    Value(Undef) noexcept {}
    Value(std::nullptr_t) noexcept : data_(nullptr) {}
    Value(bool b) noexcept : data_(b) {}
    Value(double d) noexcept : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(List list) : data_(std::move(list)) {}

    /// @brief Any integral type except bool is stored as int64_t.
    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T i) noexcept : data_(static_cast<int64_t>(i)) {}

    [[nodiscard]] bool is_undef() const noexcept { return std::holds_alternative<Undef>(data_); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(data_); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int64_t>(data_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<List>(data_); }

    /// @throws std::bad_variant_access if the value is not a bool.
    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }

    /// @throws std::bad_variant_access if the value is not an integer.
    [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(data_); }

    /// @brief Numeric value of an integer or a double.
    /// @throws std::bad_variant_access if the value is not a number.
    [[nodiscard]] double as_double() const;

    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const List& as_list() const { return std::get<List>(data_); }

    /// @brief Truth value: UNDEF, null, false, 0, 0.0, "" and [] are false.
    [[nodiscard]] bool truthy() const noexcept;

    /// @brief Human readable representation, strings are quoted.
    [[nodiscard]] std::string to_string() const;

    /// @brief Name of the held type ("undef", "null", "bool", "int", ...).
    [[nodiscard]] std::string_view type_name() const noexcept;

    [[nodiscard]] const Storage& storage() const noexcept { return data_; }

    [[nodiscard]] std::size_t hash() const noexcept;

    friend bool operator==(const Value& lhs, const Value& rhs) noexcept;

private:
    Storage data_;
};

/// @brief Hash functor for unordered containers keyed by Value.
struct ValueHash {
    std::size_t operator()(const Value& v) const noexcept { return v.hash(); }
};

/// @brief Event payload: an open, ordered key/value bag.
///
/// Handlers ignore keys they do not know.
using EventData = std::map<std::string, Value, std::less<>>;

/// @brief Return data[key], or @p fallback when the key is missing.
[[nodiscard]] Value get_or(const EventData& data, std::string_view key, Value fallback = UNDEF);

/// @brief Human readable representation of an event payload.
[[nodiscard]] std::string to_string(const EventData& data);

} // namespace circsim::core

template<>
struct fmt::formatter<circsim::core::Value> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const circsim::core::Value& value, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(value.to_string(), ctx);
    }
};
