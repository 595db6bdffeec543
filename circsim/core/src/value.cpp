#include <circsim/core/value.hpp>

#include <cmath>

namespace circsim::core {

namespace {

// Integral doubles representable as int64
bool integral_in_range(double d) noexcept {
    return std::isfinite(d) && d == std::trunc(d) && d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

// Hash of an integral double must match the hash of the equal integer
std::size_t hash_number(double d) noexcept {
    if (integral_in_range(d)) {
        return std::hash<int64_t>{}(static_cast<int64_t>(d));
    }
    return std::hash<double>{}(d);
}

// Exact comparison; converting the integer to double would round above 2^53
bool int_equals_double(int64_t i, double d) noexcept {
    return integral_in_range(d) && static_cast<int64_t>(d) == i;
}

} // anonymous namespace

double Value::as_double() const {
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data_);
}

bool Value::truthy() const noexcept {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Undef> || std::is_same_v<T, std::nullptr_t>) {
            return false;
        } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, List>) {
            return !v.empty();
        } else {
            return v != T{};
        }
    }, data_);
}

std::string_view Value::type_name() const noexcept {
    static constexpr std::string_view names[] = {
        "undef", "null", "bool", "int", "double", "string", "list"};
    return names[data_.index()];
}

std::string Value::to_string() const {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Undef>) {
            return "<UNDEF>";
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, double>) {
            return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return fmt::format("'{}'", v);
        } else {
            std::string out = "[";
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                out += v[i].to_string();
            }
            out += "]";
            return out;
        }
    }, data_);
}

std::size_t Value::hash() const noexcept {
    return std::visit([this](const auto& v) -> std::size_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Undef>) {
            return 0x5bd1e995U;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return 0x27d4eb2dU;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::hash<int64_t>{}(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return hash_number(v);
        } else if constexpr (std::is_same_v<T, List>) {
            std::size_t h = data_.index();
            for (const auto& item : v) {
                h = h * 31 + item.hash();
            }
            return h;
        } else {
            // bool hashes apart from the equal-looking integers
            return std::hash<T>{}(v) ^ (data_.index() << 7);
        }
    }, data_);
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_int() && rhs.is_int()) {
            return lhs.as_int() == rhs.as_int();
        }
        if (lhs.is_int()) {
            return int_equals_double(lhs.as_int(), rhs.as_double());
        }
        if (rhs.is_int()) {
            return int_equals_double(rhs.as_int(), lhs.as_double());
        }
        return lhs.as_double() == rhs.as_double();
    }
    return lhs.data_ == rhs.data_;
}

Value get_or(const EventData& data, std::string_view key, Value fallback) {
    auto it = data.find(key);
    return it == data.end() ? std::move(fallback) : it->second;
}

std::string to_string(const EventData& data) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : data) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += fmt::format("{}: {}", key, value.to_string());
    }
    out += "}";
    return out;
}

} // namespace circsim::core
