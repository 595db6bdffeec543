#pragma once

/// @file error.hpp
/// @brief Exception type of the circsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace circsim::io {

/// @brief Error loading or saving a JSON document.
///
/// Thrown when a file cannot be opened, the JSON is malformed, or a field
/// is missing or has the wrong type.
///
/// @ingroup io
/// @see load_circuit_config, JsonFileStore
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Message formatted as `"context: message"`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace circsim::io
