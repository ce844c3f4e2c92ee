#pragma once

#include <desim/core/log.hpp>
#include <desim/core/units.hpp>

#include <cstddef>
#include <cstdint>

namespace desim::core {

inline constexpr double DEFAULT_SYNC_INTERVAL = 0.01;
inline constexpr uint64_t DEFAULT_SEED = 2020;

/// @brief Construction parameters of a clock.
///
/// @c workers, @c sync_interval, @c seed and @c handle_exceptions only
/// matter once the clock is forked. @c log_level is not applied by the
/// clock; applications pass it to Logger::set_level.
///
/// @see Clock::Clock(const ClockConfig&), io::load_clock_config
/// @ingroup core_engine
struct ClockConfig {
    double dt{0.0};                            ///< Sampling interval, 0 for event-driven.
    double t0{0.0};                            ///< Start time.
    TimeUnit unit{TimeUnit::None};             ///< Clock time unit.
    std::size_t workers{0};                    ///< Workers for fork(); 0 = hardware threads - 1.
    double sync_interval{DEFAULT_SYNC_INTERVAL};  ///< Round length when dt is 0.
    uint64_t seed{DEFAULT_SEED};               ///< Seed for random worker placement.
    bool handle_exceptions{true};              ///< Workers keep serving after a fault.
    LogLevel log_level{LogLevel::Warn};
};

} // namespace desim::core
