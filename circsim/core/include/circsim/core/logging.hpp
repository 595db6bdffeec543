#pragma once

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <string>

namespace circsim::core {

/// @brief Return the logger shared by all circsim libraries.
///
/// The default logger is named "circsim", writes to stderr and has its
/// level set to debug; block and circuit debug messages are gated by the
/// per-block and per-circuit debug flags instead of the logger level.
///
/// @ingroup core
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

/// @brief Replace the shared logger (e.g. to log into a file or a test sink).
/// @param new_logger Logger to install; nullptr restores the default logger.
void set_logger(std::shared_ptr<spdlog::logger> new_logger);

/// @brief Return the message of an exception held by an exception_ptr.
[[nodiscard]] std::string describe(const std::exception_ptr& error);

} // namespace circsim::core
