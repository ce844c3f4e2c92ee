#pragma once

/// @defgroup io I/O Library
/// @brief JSON configuration, trace output and clock snapshots.
///
/// The I/O library handles every external data format: loading and
/// writing clock configurations, writing simulation traces (JSON,
/// textual, in-memory) and serializing clock snapshots. Depends on core
/// only.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Clock configuration reader and writer.

/// @defgroup io_writers Trace Writers
/// @ingroup io
/// @brief JSON, textual, memory, and null trace writers, snapshot output.

// Convenience header for the I/O library

#include <desim/io/error.hpp>
#include <desim/io/trace_writers.hpp>
#include <desim/io/config_loader.hpp>
#include <desim/io/snapshot_writer.hpp>
