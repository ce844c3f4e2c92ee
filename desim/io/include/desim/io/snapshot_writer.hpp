#pragma once

/// @file snapshot_writer.hpp
/// @brief JSON serialization of clock snapshots.
/// @ingroup io_writers

#include <desim/core/clock_state.hpp>

#include <ostream>
#include <string>

namespace desim::io {

/// @brief Write @p snapshot as one JSON object.
///
/// Times are written as numbers, the state and unit by name:
/// `{"id": 2, "state": "Idle", "unit": "none", "time": 10.0, ...}`.
///
/// @see core::Clock::snapshot, core::Clock::query
/// @ingroup io_writers
void write_snapshot(const core::ClockSnapshot& snapshot, std::ostream& out);

/// @brief The JSON text write_snapshot would produce.
/// @ingroup io_writers
[[nodiscard]] std::string snapshot_to_json(const core::ClockSnapshot& snapshot);

} // namespace desim::io
