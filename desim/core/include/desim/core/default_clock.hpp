#pragma once

#include <desim/core/clock.hpp>
#include <desim/core/config.hpp>

namespace desim::core {

/// @brief The process-wide convenience clock for applications and scripts.
///
/// Created on first use with a default ClockConfig. Kernel code never
/// touches it: every kernel operation takes its clock explicitly.
///
/// @ingroup core_engine
Clock& default_clock();

/// @brief Replace the default clock with a fresh one built from @p config.
///
/// References obtained from earlier default_clock() calls dangle after this.
/// @return The new default clock.
Clock& reset_default_clock(const ClockConfig& config = {});

} // namespace desim::core
