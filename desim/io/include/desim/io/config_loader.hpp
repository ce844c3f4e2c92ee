#pragma once

/// @file config_loader.hpp
/// @brief Reading and writing clock configurations as JSON.
/// @ingroup io_loaders

#include <desim/core/config.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace desim::io {

/// @brief Load a clock configuration from a JSON file.
///
/// Every field is optional and defaults to its ClockConfig value:
///
/// @code{.json}
/// {
///   "dt": 0.0,
///   "t0": 0.0,
///   "unit": "s",
///   "workers": 2,
///   "sync_interval": 0.01,
///   "seed": 2020,
///   "handle_exceptions": true,
///   "log_level": "warn"
/// }
/// @endcode
///
/// @param path  Filesystem path to the JSON file.
/// @return Parsed configuration.
///
/// @throws LoaderError  If the file cannot be read, is not valid JSON, has
///                      an unknown field, or a value of the wrong type or
///                      out of range (dt < 0, sync_interval <= 0, unknown
///                      unit or log level name).
///
/// @see load_clock_config_from_string, write_clock_config
/// @ingroup io_loaders
[[nodiscard]] core::ClockConfig load_clock_config(const std::filesystem::path& path);

/// @brief Load a clock configuration from a JSON string.
/// @throws LoaderError  See load_clock_config.
/// @ingroup io_loaders
[[nodiscard]] core::ClockConfig load_clock_config_from_string(std::string_view json);

/// @brief Write @p config as a JSON object carrying every field.
/// @ingroup io_loaders
void write_clock_config_to_stream(const core::ClockConfig& config, std::ostream& out);

/// @brief Write @p config to a JSON file.
/// @throws LoaderError  If the file cannot be opened for writing.
/// @ingroup io_loaders
void write_clock_config(const core::ClockConfig& config, const std::filesystem::path& path);

} // namespace desim::io
