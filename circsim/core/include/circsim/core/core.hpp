#pragma once

/// @defgroup core Core Library
/// @brief Circuit model, simulation kernel and lifecycle.
///
/// The core library provides the block model (combinational and sequential
/// blocks), events, the FSM engine, the propagation kernel with its timer
/// queue, and the circuit lifecycle. It has no dependencies on the block
/// library or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Strong types for durations and time points.

/// @defgroup core_values Values
/// @ingroup core
/// @brief Dynamic values, event payloads and constants.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Event types, event descriptors and timer identifiers.

/// @defgroup core_blocks Blocks
/// @ingroup core
/// @brief Block base classes and capability interfaces.

/// @defgroup core_fsm FSM
/// @ingroup core
/// @brief Finite-state machine tables and blocks.

/// @defgroup core_circuit Circuit
/// @ingroup core
/// @brief Block registry, kernel, lifecycle and runner.

/// @defgroup core_persistence Persistence
/// @ingroup core
/// @brief Storage of sequential block states.

#include <circsim/core/types.hpp>
#include <circsim/core/error.hpp>
#include <circsim/core/value.hpp>
#include <circsim/core/logging.hpp>
#include <circsim/core/const_pool.hpp>
#include <circsim/core/event.hpp>
#include <circsim/core/timer.hpp>
#include <circsim/core/trace_writer.hpp>
#include <circsim/core/persistence.hpp>

#include <circsim/core/block.hpp>
#include <circsim/core/cblock.hpp>
#include <circsim/core/sblock.hpp>
#include <circsim/core/builtin.hpp>
#include <circsim/core/fsm.hpp>

#include <circsim/core/circuit.hpp>
#include <circsim/core/runner.hpp>
