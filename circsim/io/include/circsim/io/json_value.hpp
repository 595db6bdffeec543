#pragma once

#include <circsim/core/value.hpp>

#include <string>
#include <string_view>

namespace circsim::io {

/// @brief Parse a JSON document into a Value.
///
/// Objects are not representable and are rejected. Integers that fit
/// into int64_t become integers, other numbers become doubles.
///
/// @throws LoaderError for malformed JSON or an object.
[[nodiscard]] core::Value value_from_json(std::string_view json);

/// @brief Serialize a Value to compact JSON.
/// @throws LoaderError for UNDEF or a non-finite double.
[[nodiscard]] std::string value_to_json(const core::Value& value);

} // namespace circsim::io
