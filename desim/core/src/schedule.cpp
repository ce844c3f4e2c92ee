#include <desim/core/schedule.hpp>
#include <desim/core/error.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace desim::core {

double Schedule::insert(TimedAction action) {
    double t = action.fire_time;
    while (events_.count(t) != 0) {
        t = std::nextafter(t, std::numeric_limits<double>::infinity());
    }
    action.fire_time = t;
    events_.emplace(t, std::move(action));
    return t;
}

double Schedule::next_time() const {
    if (events_.empty()) {
        throw InvalidStateError("no timed action pending");
    }
    return events_.begin()->first;
}

TimedAction Schedule::pop_next() {
    if (events_.empty()) {
        throw InvalidStateError("no timed action pending");
    }
    auto it = events_.begin();
    TimedAction action = std::move(it->second);
    events_.erase(it);
    return action;
}

void Schedule::add_condition(ConditionalAction action) {
    conditions_.push_back(std::move(action));
}

std::optional<ConditionalAction> Schedule::take_ready_condition() {
    for (auto it = conditions_.begin(); it != conditions_.end(); ++it) {
        if (it->ready()) {
            ConditionalAction action = std::move(*it);
            conditions_.erase(it);
            return action;
        }
    }
    return std::nullopt;
}

void Schedule::add_periodic(PeriodicAction action) {
    periodics_.push_back(std::move(action));
}

std::vector<double> Schedule::event_times() const {
    std::vector<double> times;
    times.reserve(events_.size());
    for (const auto& [t, action] : events_) {
        times.push_back(t);
    }
    return times;
}

void Schedule::shift(double delta) {
    if (delta == 0.0) {
        return;
    }
    std::map<double, TimedAction> shifted;
    for (auto& [t, action] : events_) {
        double moved = t + delta;
        // Two distinct times may round onto the same value.
        while (shifted.count(moved) != 0) {
            moved = std::nextafter(moved, std::numeric_limits<double>::infinity());
        }
        action.fire_time = moved;
        shifted.emplace(moved, std::move(action));
    }
    events_ = std::move(shifted);
}

void Schedule::rescale(double factor) {
    std::map<double, TimedAction> scaled;
    for (auto& [t, action] : events_) {
        double moved = t * factor;
        while (scaled.count(moved) != 0) {
            moved = std::nextafter(moved, std::numeric_limits<double>::infinity());
        }
        action.fire_time = moved;
        action.repeat_interval *= factor;
        scaled.emplace(moved, std::move(action));
    }
    events_ = std::move(scaled);
}

void Schedule::clear() noexcept {
    events_.clear();
    conditions_.clear();
    periodics_.clear();
}

} // namespace desim::core
