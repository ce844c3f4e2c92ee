#pragma once

#include <desim/core/action.hpp>

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace desim::core {

/// @brief Registry of pending work owned by one clock.
///
/// Timed actions live in a map keyed by fire time. The map never holds
/// two actions at exactly the same time: a colliding time is advanced to
/// the next representable double until it is unique, so actions
/// registered for the same instant fire in insertion order.
///
/// Conditional actions and periodic actions are kept in registration
/// order. Periodic actions are stored in a deque so references stay
/// valid while a tick registers further periodic actions.
///
/// The Schedule does not know about the current time; clamping to
/// "now" is the clock's job.
///
/// @see Clock
/// @ingroup core_events
class Schedule {
public:
    /// @brief Insert a timed action.
    /// @return The actual fire time after collision resolution.
    double insert(TimedAction action);

    /// @brief True if at least one timed action is pending.
    [[nodiscard]] bool has_events() const noexcept { return !events_.empty(); }

    /// @brief Fire time of the earliest timed action.
    /// @throws InvalidStateError if no timed action is pending.
    [[nodiscard]] double next_time() const;

    /// @brief Remove and return the earliest timed action.
    /// @throws InvalidStateError if no timed action is pending.
    TimedAction pop_next();

    void add_condition(ConditionalAction action);

    /// @brief Remove and return the first conditional action whose
    ///        predicates all hold, if any.
    std::optional<ConditionalAction> take_ready_condition();

    void add_periodic(PeriodicAction action);

    [[nodiscard]] std::size_t event_count() const noexcept { return events_.size(); }
    [[nodiscard]] std::size_t condition_count() const noexcept { return conditions_.size(); }
    [[nodiscard]] std::size_t periodic_count() const noexcept { return periodics_.size(); }

    /// @brief Access a periodic action by registration index.
    [[nodiscard]] const PeriodicAction& periodic(std::size_t index) const {
        return periodics_.at(index);
    }

    /// @brief Fire times of all pending timed actions, ascending.
    [[nodiscard]] std::vector<double> event_times() const;

    /// @brief Move every pending fire time by @p delta.
    void shift(double delta);

    /// @brief Multiply every pending fire time and repeat interval by @p factor.
    void rescale(double factor);

    /// @brief Drop every registered action.
    void clear() noexcept;

private:
    std::map<double, TimedAction> events_;
    std::vector<ConditionalAction> conditions_;
    std::deque<PeriodicAction> periodics_;
};

} // namespace desim::core
