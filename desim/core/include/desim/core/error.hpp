#pragma once

#include <stdexcept>
#include <string>

namespace desim::core {

/// @brief Base exception for all simulation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch simulation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// Protocol errors (a command the clock cannot handle in its current
/// state) are not exceptions; they are reported through
/// Clock::step(Command) and the log.
///
/// @see InvalidStateError, InvalidArgumentError, OutOfRangeError, ProcessInterrupt
/// @ingroup core
class SimulationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when an operation is invalid for the current object state.
///
/// For example, forking a clock that is itself a worker, or awaiting
/// a clock primitive from a coroutine that does not belong to a process.
///
/// @see SimulationError
/// @ingroup core
class InvalidStateError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when timing arguments are malformed.
///
/// Times in the past are clamped, not rejected. This is raised for
/// NaN times, non-positive repeat intervals, negative sample times or
/// an empty predicate set.
///
/// @see SimulationError
/// @ingroup core
class InvalidArgumentError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

/// @brief Thrown when a clock id does not name a worker of this clock.
///
/// @see Clock::worker, SimulationError
/// @ingroup core
class OutOfRangeError : public SimulationError {
public:
    using SimulationError::SimulationError;
};

} // namespace desim::core
