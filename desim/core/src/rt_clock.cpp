#include <desim/core/rt_clock.hpp>
#include <desim/core/error.hpp>
#include <desim/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <utility>

namespace desim::core {

RTClock::RTClock(double period, ClockId id, bool handle_exceptions)
    : period_(period)
    , id_(id)
    , handle_exceptions_(handle_exceptions)
    , clock_(period >= MIN_RT_PERIOD ? period : MIN_RT_PERIOD, 0.0, TimeUnit::Seconds) {
    if (std::isnan(period) || period < MIN_RT_PERIOD) {
        throw InvalidArgumentError("RTClock cannot have a period below 0.001 seconds");
    }
    clock_.id_ = id;
    clock_.init();
}

RTClock::~RTClock() {
    stop();
}

void RTClock::start() {
    if (thread_.joinable()) {
        throw InvalidStateError("RTClock " + std::to_string(id_) + " is already running");
    }
    origin_ = std::chrono::steady_clock::now();
    running_ = true;
    thread_ = std::thread([this] { serve(); });
}

void RTClock::stop() {
    if (!thread_.joinable()) {
        return;
    }
    commands_.push(msg::Stop{});
    thread_.join();
    running_ = false;
}

void RTClock::send(Message message) {
    if (!commands_.push(std::move(message))) {
        throw InvalidStateError("RTClock " + std::to_string(id_) + " command channel is closed");
    }
}

void RTClock::schedule_at(Action action, double t) {
    if (!action) {
        throw InvalidArgumentError("empty action");
    }
    if (std::isnan(t)) {
        throw InvalidArgumentError("fire time is NaN");
    }
    send(msg::Register{TimedAction{std::move(action), t, 0.0}, false});
}

void RTClock::schedule_after(Action action, double delta) {
    if (std::isnan(delta)) {
        throw InvalidArgumentError("delay is NaN");
    }
    schedule_at(std::move(action), time() + delta);
}

void RTClock::schedule_on(Action action, std::vector<Predicate> predicates) {
    if (!action) {
        throw InvalidArgumentError("empty action");
    }
    if (predicates.empty()) {
        throw InvalidArgumentError("conditional action needs at least one predicate");
    }
    send(msg::Register{ConditionalAction{std::move(action), std::move(predicates)}, false});
}

void RTClock::schedule_on(Action action, Predicate predicate) {
    std::vector<Predicate> predicates;
    predicates.push_back(std::move(predicate));
    schedule_on(std::move(action), std::move(predicates));
}

void RTClock::register_periodic(Action action) {
    if (!action) {
        throw InvalidArgumentError("empty action");
    }
    send(msg::Register{PeriodicAction{std::move(action), 0.0}, false});
}

void RTClock::reset() {
    send(msg::Reset{true, 0.0, period_, TimeUnit::Seconds});
}

std::optional<FaultReport> RTClock::last_fault() const {
    std::lock_guard<std::mutex> lock(fault_mutex_);
    return last_fault_;
}

double RTClock::elapsed(Ticks now) const {
    return std::chrono::duration<double>(now - origin_).count();
}

// =============================================================================
// Clock thread
// =============================================================================

void RTClock::serve() {
    const auto step = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(period_));
    auto next = std::chrono::steady_clock::now();

    while (true) {
        try {
            // Due work runs before any command so clock time never goes back.
            evaluate(elapsed(std::chrono::steady_clock::now()));
            while (auto message = commands_.try_pop()) {
                if (!apply(*message)) {
                    return;
                }
            }

            next += step;
            if (next < std::chrono::steady_clock::now()) {
                next = std::chrono::steady_clock::now();
            }
            // Commands arriving before the next period are applied at once.
            while (auto message = commands_.pop_for(next - std::chrono::steady_clock::now())) {
                evaluate(elapsed(std::chrono::steady_clock::now()));
                if (!apply(*message)) {
                    return;
                }
                if (std::chrono::steady_clock::now() >= next) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            if (!fail(e.what())) {
                return;
            }
        } catch (...) {
            if (!fail("unknown exception")) {
                return;
            }
        }
    }
}

bool RTClock::fail(std::string what) {
    FaultReport report = capture_fault(std::move(what), "Run", clock_.time());
    Logger::instance().log(LogLevel::Error, id_, clock_.time(), "RTClock exception: {}", report.what);
    {
        std::lock_guard<std::mutex> lock(fault_mutex_);
        last_fault_ = std::move(report);
    }
    if (!handle_exceptions_) {
        running_ = false;
    }
    return handle_exceptions_;
}

bool RTClock::apply(Message& message) {
    if (std::holds_alternative<msg::Stop>(message)) {
        running_ = false;
        return false;
    }
    if (auto* reg = std::get_if<msg::Register>(&message)) {
        // Past fire times run at the next period.
        if (auto* timed = std::get_if<TimedAction>(&reg->payload)) {
            timed->fire_time = std::max(timed->fire_time, clock_.time());
        }
        clock_.register_local(std::move(reg->payload));
    } else if (const auto* reset = std::get_if<msg::Reset>(&message)) {
        origin_ = std::chrono::steady_clock::now();
        clock_.reset(cmd::Reset{reset->hard, reset->time, reset->dt, reset->unit});
        time_ = 0.0;
        evcount_ = 0;
        scount_ = 0;
    } else {
        Logger::instance().log(LogLevel::Warn, id_, clock_.time(), "RTClock ignores {}",
                               message_name(message));
    }
    return true;
}

void RTClock::evaluate(double now) {
    const Schedule& schedule = clock_.schedule();
    // Ticks and events interleave in time order; a tick goes first on a tie.
    while (true) {
        const bool sampling = clock_.dt_ > 0.0
            && (schedule.periodic_count() > 0 || schedule.condition_count() > 0);
        if (!sampling) {
            clock_.tn_ = now + clock_.dt_;
        }
        const bool tick_due = sampling && clock_.tn_ <= now;
        const bool event_due = schedule.has_events() && schedule.next_time() <= now;
        if (tick_due && (!event_due || clock_.tn_ <= schedule.next_time())) {
            clock_.tick();
            clock_.tn_ += clock_.dt_;
        } else if (event_due) {
            clock_.fire_event();
        } else {
            break;
        }
    }
    clock_.time_ = now;
    time_ = now;
    evcount_ = clock_.evcount();
    scount_ = clock_.scount();
}

} // namespace desim::core
