#pragma once

#include <cstdint>
#include <functional>
#include <vector>

namespace desim::core {

/// @brief Identifier of a clock. The master clock is 1, workers 2..n+1.
/// @ingroup core_events
using ClockId = int;

/// @brief Id of a clock that has not been forked (and of every master).
inline constexpr ClockId MASTER_CLOCK_ID = 1;

/// @brief An opaque unit of work: a closure over whatever data it needs.
/// @ingroup core_events
using Action = std::function<void()>;

/// @brief A boolean check evaluated at sampling ticks.
/// @ingroup core_events
using Predicate = std::function<bool()>;

/// @brief Work scheduled to fire at a virtual time.
///
/// A positive @c repeat_interval makes the action reschedule itself that
/// long after each firing.
///
/// @see Clock::schedule_at, Clock::schedule_every
/// @ingroup core_events
struct TimedAction {
    Action action;               ///< Work to run.
    double fire_time{0.0};       ///< Requested fire time, clamped to now on registration.
    double repeat_interval{0.0}; ///< >0: reschedule after firing.
};

/// @brief Work fired exactly once, at the first tick where all predicates hold.
///
/// The predicate set is a conjunction. The action is removed from the
/// clock before it runs and is never re-armed.
///
/// @see Clock::schedule_on
/// @ingroup core_events
struct ConditionalAction {
    Action action;
    std::vector<Predicate> predicates;

    /// @brief True if every predicate holds.
    [[nodiscard]] bool ready() const {
        for (const auto& predicate : predicates) {
            if (!predicate()) {
                return false;
            }
        }
        return true;
    }
};

/// @brief Work re-run at every sampling tick, in registration order.
///
/// A positive @c dt overrides the clock's sampling interval when the
/// action is registered. Zero keeps the clock's interval (or derives one).
///
/// @see Clock::register_periodic
/// @ingroup core_events
struct PeriodicAction {
    Action action;
    double dt{0.0};
};

/// @brief Where a scheduling call should register its action.
///
/// The default places the action on the clock the call is made on.
///
/// @ingroup core_events
struct Placement {
    ClockId cid{0};     ///< Target clock id; 0 means "this clock".
    bool spawn{false};  ///< Pick a random worker (master only).
    bool sync{false};   ///< Hold a timed action until the next synchronization boundary.
};

} // namespace desim::core
