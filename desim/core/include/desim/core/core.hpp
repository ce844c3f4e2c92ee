#pragma once

/// @defgroup core Core Library
/// @brief Virtual-time clocks, action registry, processes and parallel clocks.
///
/// The core library provides the simulation kernel: the Clock state
/// machine and its stepping algorithm, the registry of timed, conditional
/// and periodic actions, coroutine processes, forked worker clocks and
/// the wall-clock paced RTClock. It has no dependency on file formats.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Time units and dimensioned times.

/// @defgroup core_engine Engine
/// @ingroup core
/// @brief Clock state machine, run algorithm and configuration.

/// @defgroup core_events Events
/// @ingroup core
/// @brief Actions, predicates and the registry holding them.

/// @defgroup core_process Processes
/// @ingroup core
/// @brief Suspendable processes and shared resources.

/// @defgroup core_parallel Parallel
/// @ingroup core
/// @brief Worker clocks and the messages exchanged with them.

// Convenience header for the core library
#include <desim/core/units.hpp>
#include <desim/core/error.hpp>
#include <desim/core/log.hpp>
#include <desim/core/action.hpp>
#include <desim/core/schedule.hpp>
#include <desim/core/trace_writer.hpp>
#include <desim/core/config.hpp>

#include <desim/core/clock_state.hpp>
#include <desim/core/routine.hpp>
#include <desim/core/process.hpp>
#include <desim/core/resource.hpp>

#include <desim/core/channel.hpp>
#include <desim/core/message.hpp>
#include <desim/core/clock.hpp>
#include <desim/core/active_clock.hpp>
#include <desim/core/rt_clock.hpp>
#include <desim/core/default_clock.hpp>
