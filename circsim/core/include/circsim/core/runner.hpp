#pragma once

#include <circsim/core/circuit.hpp>

#include <functional>
#include <stop_token>
#include <vector>

namespace circsim::core {

/// @brief A service running alongside the simulation on its own thread.
///
/// The task must return promptly once @p token is stop-requested. It
/// communicates with the circuit only through the thread-safe Circuit API.
using SupportingTask = std::function<void(std::stop_token token)>;

/// @brief Run the simulation together with supporting tasks.
///
/// The simulation runs on the calling thread. The first of the simulation
/// and the supporting tasks to finish stops all others: a supporting task
/// returning normally shuts the simulation down, a failing one aborts it
/// with SupportingTaskError. All supporting tasks are stopped and joined
/// before run() returns.
///
/// @code
/// core::run(circuit, {[&](std::stop_token token) { console(circuit, token); }});
/// @endcode
///
/// @throws the error that stopped the simulation unless it was a
///         regular shutdown.
/// @ingroup core_circuit
void run(Circuit& circuit, std::vector<SupportingTask> tasks = {});

} // namespace circsim::core
