#pragma once

/// @file config_loader.hpp
/// @brief JSON circuit configuration.
///
/// Example:
/// @code{.json}
/// {
///   "virtual_time": false,
///   "max_evals_per_block": 3,
///   "persistent_file": "state.json",
///   "debug": ["timer*", "counter"],
///   "circuit_debug": false,
///   "trace": {"format": "text", "output": "-"}
/// }
/// @endcode
///
/// All fields are optional.
///
/// @ingroup io

#include <circsim/core/circuit.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace circsim::io {

/// @brief Trace output format.
enum class TraceFormat { None, Json, Text };

/// @brief Circuit settings read from a configuration file.
struct CircuitConfig {
    core::Circuit::Options options;
    std::optional<std::filesystem::path> persistent_file;
    /// Block names or glob patterns with debug output enabled.
    std::vector<std::string> debug;
    bool circuit_debug{false};
    TraceFormat trace_format{TraceFormat::None};
    /// Trace destination; "-" is stdout.
    std::string trace_output{"-"};
};

/// @throws LoaderError on a read, parse or validation error.
[[nodiscard]] CircuitConfig load_circuit_config(const std::filesystem::path& path);

/// @throws LoaderError on a parse or validation error.
[[nodiscard]] CircuitConfig load_circuit_config_from_string(std::string_view json);

/// @brief Apply the debug settings of @p config to the blocks of @p circuit.
/// @throws core::ConfigurationError for an unknown block name.
void apply_debug_settings(core::Circuit& circuit, const CircuitConfig& config);

/// @brief Parse "none", "json" or "text".
/// @throws LoaderError for other names.
[[nodiscard]] TraceFormat parse_trace_format(std::string_view name);

} // namespace circsim::io
