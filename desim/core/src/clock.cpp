#include <desim/core/clock.hpp>
#include <desim/core/active_clock.hpp>
#include <desim/core/error.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace desim::core {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

// Events this close past a run horizon still belong to the run.
double horizon_tolerance(double t) noexcept {
    double a = std::abs(t);
    return (std::nextafter(a, INF) - a) * 10.0;
}

void require_action(const Action& action) {
    if (!action) {
        throw InvalidArgumentError("empty action");
    }
}

void require_time(double t, const char* what) {
    if (std::isnan(t)) {
        throw InvalidArgumentError(std::string(what) + " is NaN");
    }
}

void require_sample_time(double dt) {
    if (std::isnan(dt) || dt < 0.0 || std::isinf(dt)) {
        throw InvalidArgumentError("sample time must be finite and >= 0");
    }
}

} // anonymous namespace

double time_scale(double n) noexcept {
    if (!(n > 0.0) || std::isinf(n)) {
        return 1.0;
    }
    return std::pow(10.0, std::floor(std::log10(n)));
}

Clock::Clock(double dt, double t0, TimeUnit unit)
    : unit_(unit)
    , time_(t0)
    , dt_(dt)
    , end_time_(t0)
    , tev_(t0)
    , tn_(t0 + dt) {
    require_sample_time(dt);
    require_time(t0, "start time");
}

Clock::Clock(const ClockConfig& config)
    : Clock(config.dt, config.t0, config.unit) {
    set_sync_interval(config.sync_interval);
    configured_workers_ = config.workers;
    handle_exceptions_ = config.handle_exceptions;
    rng_.seed(static_cast<std::mt19937::result_type>(config.seed));
}

Clock::~Clock() {
    shutdown_workers();
}

ClockSnapshot Clock::snapshot() const {
    ClockSnapshot snap;
    snap.id = id_;
    snap.state = state_;
    snap.unit = unit_;
    snap.time = time_;
    snap.dt = dt_;
    snap.end_time = end_time_;
    snap.tev = tev_;
    snap.tn = tn_;
    snap.evcount = evcount_;
    snap.scount = scount_;
    snap.events = schedule_.event_count();
    snap.conditions = schedule_.condition_count();
    snap.periodics = schedule_.periodic_count();
    snap.processes = processes_.size();
    snap.workers = workers_.size();
    return snap;
}

// =============================================================================
// Units
// =============================================================================

double Clock::to_clock_time(Time t) const {
    if (unit_ == TimeUnit::None) {
        if (t.unit != TimeUnit::None) {
            log(LogLevel::Warn, "clock has no time unit, ignoring unit {}", unit_symbol(t.unit));
        }
        return t.value;
    }
    return convert(t, unit_);
}

void Clock::set_unit(TimeUnit unit) {
    if (unit == unit_) {
        return;
    }
    if (unit_ != TimeUnit::None && unit != TimeUnit::None) {
        const double factor = unit_in_seconds(unit_) / unit_in_seconds(unit);
        time_ *= factor;
        dt_ *= factor;
        end_time_ *= factor;
        tev_ *= factor;
        tn_ *= factor;
        schedule_.rescale(factor);
    }
    unit_ = unit;
}

void Clock::set_sample_time(double dt) {
    require_sample_time(dt);
    dt_ = dt;
    derived_dt_ = false;
    tn_ = dt_ > 0.0 ? time_ + dt_ : time_;
}

// =============================================================================
// Scheduling
// =============================================================================

double Clock::schedule(TimedAction action, Placement where) {
    require_action(action.action);
    require_time(action.fire_time, "fire time");
    if (std::isnan(action.repeat_interval) || action.repeat_interval < 0.0) {
        throw InvalidArgumentError("repeat interval must be >= 0");
    }
    action.fire_time = std::max(action.fire_time, time_);
    return place(std::move(action), where);
}

double Clock::schedule_at(Action action, double t, Placement where) {
    return schedule(TimedAction{std::move(action), t, 0.0}, where);
}

double Clock::schedule_at(Action action, Time t, Placement where) {
    return schedule_at(std::move(action), to_clock_time(t), where);
}

double Clock::schedule_after(Action action, double delta, Placement where) {
    require_time(delta, "delay");
    return schedule_at(std::move(action), time_ + delta, where);
}

double Clock::schedule_after(Action action, Time delta, Placement where) {
    return schedule_after(std::move(action), to_clock_time(delta), where);
}

double Clock::schedule_every(Action action, double interval, Placement where) {
    if (!(interval > 0.0)) {
        throw InvalidArgumentError("repeat interval must be positive");
    }
    return schedule(TimedAction{std::move(action), time_, interval}, where);
}

double Clock::schedule_every(Action action, Time interval, Placement where) {
    return schedule_every(std::move(action), to_clock_time(interval), where);
}

double Clock::schedule_on(Action action, Predicate predicate, Placement where) {
    std::vector<Predicate> predicates;
    predicates.push_back(std::move(predicate));
    return schedule_on(std::move(action), std::move(predicates), where);
}

double Clock::schedule_on(Action action, std::vector<Predicate> predicates, Placement where) {
    require_action(action);
    if (predicates.empty()) {
        throw InvalidArgumentError("conditional action needs at least one predicate");
    }
    for (const auto& predicate : predicates) {
        if (!predicate) {
            throw InvalidArgumentError("empty predicate");
        }
    }
    return place(ConditionalAction{std::move(action), std::move(predicates)}, where);
}

double Clock::register_periodic(Action action, Placement where) {
    require_action(action);
    return place(PeriodicAction{std::move(action), 0.0}, where);
}

double Clock::register_periodic(Action action, double dt, Placement where) {
    require_action(action);
    if (!(dt > 0.0) || std::isinf(dt)) {
        throw InvalidArgumentError("sample time must be positive");
    }
    return place(PeriodicAction{std::move(action), dt}, where);
}

double Clock::register_local(Payload payload) {
    return std::visit([this](auto& item) -> double {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, TimedAction>) {
            return schedule_local(std::move(item));
        } else if constexpr (std::is_same_v<T, ConditionalAction>) {
            return condition_local(std::move(item));
        } else if constexpr (std::is_same_v<T, PeriodicAction>) {
            return periodic_local(std::move(item));
        } else {
            start_process(std::move(item));
            return time_;
        }
    }, payload);
}

double Clock::schedule_local(TimedAction action) {
    action.fire_time = std::max(action.fire_time, time_);
    const double t = schedule_.insert(std::move(action));
    tev_ = schedule_.next_time();
    return t;
}

double Clock::condition_local(ConditionalAction action) {
    if (state_ == ClockState::Busy && action.ready()) {
        action.action();
        return time_;
    }
    schedule_.add_condition(std::move(action));
    if (dt_ == 0.0) {
        activate_sampling(time_scale(end_time_ - time_) / 100.0, true);
    }
    return time_;
}

double Clock::periodic_local(PeriodicAction action) {
    if (action.dt > 0.0) {
        activate_sampling(action.dt, false);
    } else if (dt_ == 0.0) {
        const double remaining = end_time_ - time_;
        double derived = 0.01;
        if (remaining > 0.0) {
            derived = time_scale(remaining) / 100.0;
        } else if (evcount_ > 0) {
            derived = time_scale(time_ / static_cast<double>(evcount_)) / 100.0;
        }
        activate_sampling(derived, true);
    }
    schedule_.add_periodic(std::move(action));
    return time_;
}

void Clock::activate_sampling(double dt, bool derived) {
    dt_ = dt;
    derived_dt_ = derived;
    tn_ = time_ + dt_;
}

// =============================================================================
// State machine
// =============================================================================

TransitionResult Clock::step(const Command& command) {
    TransitionResult result;
    auto is = [&command](auto tag) {
        return std::holds_alternative<decltype(tag)>(command);
    };

    switch (state_) {
        case ClockState::Undefined:
            if (is(cmd::Init{})) {
                state_ = ClockState::Idle;
                result.handled = true;
            } else if (is(cmd::Step{}) || is(cmd::Run{})) {
                ensure_initialized();
                return step(command);
            } else if (const auto* reset = std::get_if<cmd::Reset>(&command)) {
                reset_now(*reset);
                result.handled = true;
            }
            break;

        case ClockState::Idle:
            if (is(cmd::Step{})) {
                result.summary = single_step();
                result.handled = true;
            } else if (const auto* run = std::get_if<cmd::Run>(&command)) {
                if (std::isnan(run->duration) || run->duration < 0.0) {
                    throw InvalidArgumentError("run duration must be >= 0");
                }
                end_time_ = time_ + run->duration;
                result.summary = run_span(false);
                result.handled = true;
            } else if (const auto* reset = std::get_if<cmd::Reset>(&command)) {
                reset_now(*reset);
                result.handled = true;
            }
            break;

        case ClockState::Busy:
            if (is(cmd::Stop{})) {
                state_ = ClockState::Halted;
                result.handled = true;
            }
            break;

        case ClockState::Halted:
            if (is(cmd::Resume{})) {
                result.summary = run_span(true);
                result.handled = true;
            } else if (is(cmd::Step{})) {
                result.summary = single_step();
                result.handled = true;
            } else if (const auto* reset = std::get_if<cmd::Reset>(&command)) {
                reset_now(*reset);
                result.handled = true;
            }
            break;

        default:
            break;
    }

    if (!result.handled) {
        unhandled(command);
    }
    result.state = state_;
    return result;
}

void Clock::unhandled(const Command& command) {
    log(LogLevel::Warn, "undefined transition with {} and {}, maybe you should reset the clock",
        to_string(state_), command_name(command));
    trace("diagnostic", [&](TraceWriter& writer) {
        writer.field("state", to_string(state_));
        writer.field("command", command_name(command));
    });
}

void Clock::ensure_initialized() noexcept {
    if (state_ == ClockState::Undefined) {
        state_ = ClockState::Idle;
    }
}

void Clock::init() {
    step(cmd::Init{});
}

RunSummary Clock::step() {
    auto result = step(cmd::Step{});
    if (result.summary) {
        return *result.summary;
    }
    return summarize(evcount_, scount_);
}

RunSummary Clock::run(double duration) {
    auto result = step(cmd::Run{duration});
    if (result.summary) {
        return *result.summary;
    }
    return summarize(evcount_, scount_);
}

RunSummary Clock::run(Time duration) {
    return run(to_clock_time(duration));
}

void Clock::stop() {
    step(cmd::Stop{});
}

RunSummary Clock::resume() {
    auto result = step(cmd::Resume{});
    if (result.summary) {
        return *result.summary;
    }
    return summarize(evcount_, scount_);
}

void Clock::reset(const cmd::Reset& options) {
    step(options);
}

void Clock::sync_to(const Clock& other) {
    reset(cmd::Reset{false, other.time(), other.dt(), other.unit()});
}

RunSummary Clock::summarize(uint64_t events_before, uint64_t ticks_before) const {
    RunSummary summary;
    summary.events = evcount_ - events_before;
    summary.ticks = scount_ - ticks_before;
    summary.time = time_;
    summary.state = state_;
    return summary;
}

RunSummary Clock::single_step() {
    const ClockState previous = state_;
    const uint64_t events_before = evcount_;
    const uint64_t ticks_before = scount_;
    state_ = ClockState::Busy;
    try {
        do_step();
    } catch (...) {
        state_ = previous;
        throw;
    }
    if (state_ == ClockState::Busy) {
        state_ = previous;
    }
    return summarize(events_before, ticks_before);
}

RunSummary Clock::run_span(bool resume) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    const uint64_t events_before = evcount_;
    const uint64_t ticks_before = scount_;
    state_ = ClockState::Busy;
    if (!resume) {
        set_times();
    }

    bool completed = false;
    try {
        completed = workers_.empty() ? advance(end_time_) : advance_parallel(end_time_);
    } catch (...) {
        state_ = ClockState::Idle;
        throw;
    }

    if (!completed) {
        const uint64_t fired = evcount_ - events_before;
        log(LogLevel::Info, "Halted after {} events", fired);
        trace("halt", [&](TraceWriter& writer) {
            writer.field("events", fired);
        });
        return summarize(events_before, ticks_before);
    }

    time_ = end_time_;
    state_ = ClockState::Idle;
    RunSummary summary = summarize(events_before, ticks_before);
    log(LogLevel::Info, "run finished with {} clock events, {} sample steps, simulation time: {}",
        summary.events, summary.ticks, summary.time);
    trace("run", [&](TraceWriter& writer) {
        writer.field("events", summary.events);
        writer.field("ticks", summary.ticks);
    });
    return summary;
}

void Clock::reset_now(const cmd::Reset& options) {
    require_time(options.time, "reset time");
    require_sample_time(options.dt);
    round_end_.reset();

    if (options.hard) {
        // Destroy suspended processes only after the clock is consistent again.
        auto abandoned = std::exchange(processes_, {});
        schedule_.clear();
        sync_queue_.clear();
        time_ = options.time;
        dt_ = options.dt;
        derived_dt_ = false;
        unit_ = options.unit;
        end_time_ = time_;
        tn_ = dt_ > 0.0 ? time_ + dt_ : time_;
        tev_ = time_;
        evcount_ = 0;
        scount_ = 0;
        state_ = ClockState::Idle;
    } else {
        align_time(options.time);
        if (options.dt != dt_) {
            dt_ = options.dt;
            derived_dt_ = false;
            tn_ = dt_ > 0.0 ? time_ + dt_ : time_;
        }
        unit_ = options.unit;
        ensure_initialized();
    }

    for (auto& worker : workers_) {
        Message reply = talk(*worker, msg::Reset{options.hard, options.time, options.dt, options.unit});
        if (const auto* error = std::get_if<msg::Error>(&reply)) {
            record_fault(worker->id(), error->fault);
        }
    }

    log(LogLevel::Info, "clock reset ({}) to time {}", options.hard ? "hard" : "soft", time_);
    trace("reset", [&](TraceWriter& writer) {
        writer.field("mode", options.hard ? std::string_view("hard") : std::string_view("soft"));
    });
}

void Clock::align_time(double t) {
    const double delta = t - time_;
    if (delta == 0.0) {
        return;
    }
    schedule_.shift(delta);
    std::multimap<double, HeldAction> shifted;
    for (auto& [when, held] : sync_queue_) {
        held.action.fire_time += delta;
        shifted.emplace(when + delta, std::move(held));
    }
    sync_queue_ = std::move(shifted);
    time_ = t;
    end_time_ += delta;
    tev_ += delta;
    tn_ += delta;
}

// =============================================================================
// Stepping
// =============================================================================

void Clock::set_times() {
    tn_ = dt_ > 0.0 ? time_ + dt_ : time_;
    tev_ = schedule_.has_events() ? schedule_.next_time() : tn_;
}

bool Clock::do_step() {
    if (schedule_.has_events()) {
        tev_ = schedule_.next_time();
        if (dt_ > 0.0) {
            if (tn_ <= tev_) {
                const bool coincide = tn_ == tev_;
                tick();
                if (coincide && schedule_.has_events() && schedule_.next_time() == tev_) {
                    fire_event();
                }
                tn_ += dt_;
            } else {
                fire_event();
            }
        } else {
            fire_event();
            // The action may have switched sampling on.
            if (dt_ == 0.0) {
                tn_ = time_;
            }
        }
        return true;
    }
    if (dt_ > 0.0) {
        tick();
        tn_ += dt_;
        tev_ = time_;
        return true;
    }
    log(LogLevel::Warn, "step: nothing to evaluate");
    trace("diagnostic", [](TraceWriter& writer) {
        writer.field("reason", std::string_view("nothing to evaluate"));
    });
    return false;
}

void Clock::tick() {
    time_ = tn_;
    // Periodic actions registered during this tick first run at the next one.
    const std::size_t count = schedule_.periodic_count();
    for (std::size_t i = 0; i < count && i < schedule_.periodic_count(); ++i) {
        schedule_.periodic(i).action();
    }
    while (auto ready = schedule_.take_ready_condition()) {
        ready->action();
        trace("condition", [](TraceWriter& /*writer*/) {});
    }
    if (derived_dt_ && schedule_.condition_count() == 0 && schedule_.periodic_count() == 0
        && workers_.empty()) {
        dt_ = 0.0;
        derived_dt_ = false;
    }
    ++scount_;
    trace("tick", [this](TraceWriter& writer) {
        writer.field("scount", scount_);
    });
}

void Clock::fire_event() {
    TimedAction action = schedule_.pop_next();
    time_ = action.fire_time;
    action.action();
    ++evcount_;
    trace("event", [this](TraceWriter& writer) {
        writer.field("evcount", evcount_);
    });
    if (action.repeat_interval > 0.0) {
        action.fire_time = time_ + action.repeat_interval;
        schedule_.insert(std::move(action));
    }
    tev_ = schedule_.has_events() ? schedule_.next_time() : time_;
}

bool Clock::advance(double until) {
    const double tolerance = horizon_tolerance(until);
    while ((dt_ > 0.0 && time_ < tn_ && tn_ <= until + tolerance)
           || (schedule_.has_events() && schedule_.next_time() <= until)) {
        do_step();
        if (state_ == ClockState::Halted) {
            return false;
        }
    }
    fire_due(until);
    return state_ != ClockState::Halted;
}

void Clock::fire_due(double until) {
    const double tolerance = horizon_tolerance(until);
    double tend = until;
    while (schedule_.has_events() && schedule_.next_time() <= tend + tolerance) {
        fire_event();
        if (state_ == ClockState::Halted) {
            return;
        }
        tend = std::nextafter(tend, INF);
    }
}

} // namespace desim::core
