#pragma once

/// @defgroup io I/O Library
/// @brief JSON persistence, circuit configuration and trace writers.
///
/// Depends on the core library and on rapidjson (private).

/// @defgroup io_writers Trace Writers
/// @ingroup io

#include <circsim/io/config_loader.hpp>
#include <circsim/io/error.hpp>
#include <circsim/io/json_store.hpp>
#include <circsim/io/json_value.hpp>
#include <circsim/io/trace_writers.hpp>
