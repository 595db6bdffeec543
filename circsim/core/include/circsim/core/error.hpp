#pragma once

#include <stdexcept>
#include <string>

namespace circsim::core {

/// @brief Base exception for all circuit simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Invalid circuit construction: bad or duplicate name, bad
/// connection, invalid FSM control tables, bad block configuration.
///
/// Raised synchronously while the circuit is being built and never
/// recovered by the kernel.
///
/// @ingroup core
class ConfigurationError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief The connected inputs do not match the block's expected signature.
/// @see CBlock::check_signature
/// @ingroup core
class SignatureError : public ConfigurationError {
public:
    using ConfigurationError::ConfigurationError;
};

/// @brief Thrown when an operation is invalid for the current circuit state.
///
/// For example restarting a finished simulation, calling shutdown() from
/// the simulation thread or waiting for a simulation that has finished.
///
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when attempting to modify the circuit after finalize().
/// @see Circuit::finalize
/// @ingroup core
class AlreadyFinalizedError : public InvalidStateError {
public:
    using InvalidStateError::InvalidStateError;
};

/// @brief Fatal protocol error. Aborts the circuit.
///
/// Forbidden reentrant event, forbidden chained transition, chain limit
/// reached, missing timer duration and similar violations.
///
/// @ingroup core
class CircuitError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief The propagation scheduler exceeded its evaluation limit.
/// @ingroup core
class InstabilityError : public CircuitError {
public:
    using CircuitError::CircuitError;
};

/// @brief A sequential block has no output after all initialization steps.
/// @ingroup core
class InitializationError : public CircuitError {
public:
    using CircuitError::CircuitError;
};

/// @brief A runtime error raised while evaluating a block or handling an
/// event, wrapped with the offending block's identity.
/// @ingroup core
class BlockError : public CircuitError {
public:
    using CircuitError::CircuitError;
};

/// @brief The block does not accept the event type.
/// @ingroup core
class UnknownEventError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Cancellation; terminates the simulation normally.
/// @see Circuit::shutdown
/// @ingroup core
class CancelledError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief A supporting task registered with run() has failed.
/// @see run
/// @ingroup core
class SupportingTaskError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace circsim::core
