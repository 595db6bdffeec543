#pragma once

/// @defgroup blocks Block Library
/// @brief General purpose blocks built on the core block model.

/// @defgroup blocks_cblocks Combinational Blocks
/// @ingroup blocks

/// @defgroup blocks_sblocks Sequential Blocks
/// @ingroup blocks

/// @defgroup blocks_fsm FSM Blocks
/// @ingroup blocks

/// @defgroup blocks_filters Event Filters
/// @ingroup blocks

#include <circsim/blocks/cblocks.hpp>
#include <circsim/blocks/counter.hpp>
#include <circsim/blocks/filters.hpp>
#include <circsim/blocks/init_async.hpp>
#include <circsim/blocks/input.hpp>
#include <circsim/blocks/input_exp.hpp>
#include <circsim/blocks/output_func.hpp>
#include <circsim/blocks/repeat.hpp>
#include <circsim/blocks/timer.hpp>
#include <circsim/blocks/value_poll.hpp>
