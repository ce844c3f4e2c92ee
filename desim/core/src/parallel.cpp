#include <desim/core/clock.hpp>
#include <desim/core/active_clock.hpp>
#include <desim/core/error.hpp>

#ifdef TRACY_ENABLE
#include <tracy/Tracy.hpp>
#endif

#include <algorithm>
#include <cmath>
#include <exception>
#include <string>
#include <thread>
#include <utility>

namespace desim::core {

namespace {

// Rounds shorter than this fraction of the sync interval are merged into the previous one.
constexpr double ROUND_TOLERANCE = 1e-6;

} // anonymous namespace

// =============================================================================
// Placement
// =============================================================================

bool Clock::is_local(const Placement& where) const noexcept {
    if (where.spawn) {
        return workers_.empty() && active_ == nullptr;
    }
    return where.cid == 0 || where.cid == id_;
}

double Clock::place(Payload payload, const Placement& where) {
    if (active_ != nullptr) {
        if (!where.spawn && !where.sync && (where.cid == 0 || where.cid == id_)) {
            return register_local(std::move(payload));
        }
        const ClockId target = where.spawn ? 0 : (where.cid == 0 ? id_ : where.cid);
        double when = time_;
        if (const auto* timed = std::get_if<TimedAction>(&payload)) {
            when = timed->fire_time;
        }
        active_->forward(std::move(payload), target, where.sync);
        return when;
    }

    if (workers_.empty()) {
        if (!where.spawn && where.cid != 0 && where.cid != id_) {
            throw OutOfRangeError("clock " + std::to_string(where.cid) + " is not a worker of this clock");
        }
        return register_local(std::move(payload));
    }

    const ClockId target = where.spawn ? random_worker() : (where.cid == 0 ? id_ : where.cid);
    if (where.sync) {
        if (auto* timed = std::get_if<TimedAction>(&payload)) {
            const double when = timed->fire_time;
            hold(target, std::move(*timed));
            return when;
        }
    }
    if (target == id_) {
        return register_local(std::move(payload));
    }

    Message reply = talk(worker(target), msg::Register{std::move(payload), true});
    if (const auto* response = std::get_if<msg::Response>(&reply)) {
        if (const auto* when = std::get_if<double>(&response->value)) {
            return *when;
        }
    }
    if (const auto* error = std::get_if<msg::Error>(&reply)) {
        throw SimulationError("worker " + std::to_string(target) + ": " + error->fault.what);
    }
    throw InvalidStateError("unexpected reply " + std::string(message_name(reply))
                            + " from worker " + std::to_string(target));
}

ClockId Clock::random_worker() {
    std::uniform_int_distribution<std::size_t> pick(0, workers_.size() - 1);
    return workers_[pick(rng_)]->id();
}

// =============================================================================
// Fork / collapse
// =============================================================================

void Clock::fork(std::size_t workers) {
    if (active_ != nullptr) {
        throw InvalidStateError("a worker clock cannot fork");
    }
    if (state_ == ClockState::Busy) {
        throw InvalidStateError("cannot fork a running clock");
    }
    if (!workers_.empty()) {
        log(LogLevel::Warn, "clock already forked to {} workers", workers_.size());
        return;
    }
    if (workers == 0) {
        workers = configured_workers_;
    }
    if (workers == 0) {
        const unsigned hardware = std::thread::hardware_concurrency();
        workers = hardware > 1 ? hardware - 1 : 0;
    }
    if (workers == 0) {
        log(LogLevel::Warn, "no parallel threads available");
        return;
    }

    ensure_initialized();
    for (std::size_t i = 0; i < workers; ++i) {
        auto remote = std::make_unique<RemoteClock>(static_cast<ClockId>(i) + 2, handle_exceptions_);
        Message reply = talk(*remote, msg::Sync{time_, dt_, unit_});
        if (const auto* error = std::get_if<msg::Error>(&reply)) {
            record_fault(remote->id(), error->fault);
        }
        workers_.push_back(std::move(remote));
    }
    log(LogLevel::Info, "forked to {} workers", workers_.size());
    trace("fork", [&](TraceWriter& writer) {
        writer.field("workers", static_cast<uint64_t>(workers_.size()));
    });
}

void Clock::collapse() {
    if (workers_.empty()) {
        log(LogLevel::Warn, "clock is not forked");
        return;
    }
    if (state_ == ClockState::Busy) {
        throw InvalidStateError("cannot collapse a running clock");
    }
    shutdown_workers();
    // Held actions meant for workers have nowhere to go.
    for (auto it = sync_queue_.begin(); it != sync_queue_.end();) {
        if (it->second.target != id_) {
            it = sync_queue_.erase(it);
        } else {
            ++it;
        }
    }
    log(LogLevel::Info, "collapsed workers");
    trace("collapse", [](TraceWriter& /*writer*/) {});
}

void Clock::shutdown_workers() noexcept {
    for (auto& remote : workers_) {
        if (remote->send(msg::Stop{})) {
            while (auto reply = remote->receive()) {
                if (std::holds_alternative<msg::Response>(*reply)) {
                    break;
                }
                log(LogLevel::Debug, "dropping {} from stopping worker {}",
                    message_name(*reply), remote->id());
            }
        }
        remote->join();
    }
    workers_.clear();
}

RemoteClock& Clock::worker(ClockId id) {
    for (auto& remote : workers_) {
        if (remote->id() == id) {
            return *remote;
        }
    }
    throw OutOfRangeError("clock " + std::to_string(id) + " is not a worker of this clock");
}

ClockSnapshot Clock::query(ClockId id) {
    Message reply = talk(worker(id), msg::Query{});
    if (const auto* response = std::get_if<msg::Response>(&reply)) {
        if (const auto* snap = std::get_if<ClockSnapshot>(&response->value)) {
            return *snap;
        }
    }
    throw InvalidStateError("worker " + std::to_string(id) + " did not answer Query");
}

std::optional<FaultReport> Clock::diagnose(ClockId id) {
    Message reply = talk(worker(id), msg::Diag{});
    if (const auto* response = std::get_if<msg::Response>(&reply)) {
        if (const auto* fault = std::get_if<std::optional<FaultReport>>(&response->value)) {
            return *fault;
        }
    }
    throw InvalidStateError("worker " + std::to_string(id) + " did not answer Diag");
}

void Clock::set_sync_interval(double interval) {
    if (!(interval > 0.0) || std::isinf(interval)) {
        throw InvalidArgumentError("sync interval must be positive");
    }
    sync_interval_ = interval;
}

// =============================================================================
// Messaging
// =============================================================================

Message Clock::talk(RemoteClock& remote, Message message) {
    if (!remote.send(std::move(message))) {
        throw InvalidStateError("worker " + std::to_string(remote.id()) + " is not running");
    }
    while (auto reply = remote.receive()) {
        if (auto* forward = std::get_if<msg::Forward>(&*reply)) {
            route(std::move(*forward));
            continue;
        }
        if (const auto* error = std::get_if<msg::Error>(&*reply)) {
            record_fault(remote.id(), error->fault);
        }
        return std::move(*reply);
    }
    throw InvalidStateError("worker " + std::to_string(remote.id()) + " is not running");
}

void Clock::collect_done(RemoteClock& remote) {
    while (auto reply = remote.receive()) {
        if (auto* forward = std::get_if<msg::Forward>(&*reply)) {
            route(std::move(*forward));
        } else if (const auto* done = std::get_if<msg::Done>(&*reply)) {
            remote.last_round_ns_ = done->elapsed_ns;
            return;
        } else if (const auto* error = std::get_if<msg::Error>(&*reply)) {
            record_fault(remote.id(), error->fault);
            if (error->fault.command == "Run") {
                return;
            }
        } else {
            log(LogLevel::Debug, "ignoring {} from worker {}", message_name(*reply), remote.id());
        }
    }
    log(LogLevel::Error, "worker {} stopped during a run", remote.id());
}

void Clock::route(msg::Forward forward) {
    if (forward.sync) {
        if (auto* timed = std::get_if<TimedAction>(&forward.payload)) {
            const ClockId target = forward.target == 0 ? random_worker() : forward.target;
            hold(target, std::move(*timed));
            return;
        }
    }
    const ClockId target = forward.target == 0 ? random_worker() : forward.target;
    deliver(target, std::move(forward.payload));
}

void Clock::deliver(ClockId target, Payload payload) {
    if (target == id_) {
        register_local(std::move(payload));
        return;
    }
    for (auto& remote : workers_) {
        if (remote->id() == target) {
            if (!remote->send(msg::Register{std::move(payload), false})) {
                log(LogLevel::Warn, "worker {} is not running, registration dropped", target);
            }
            return;
        }
    }
    log(LogLevel::Warn, "no clock {} to register to, registration dropped", target);
}

void Clock::hold(ClockId target, TimedAction action) {
    const double when = action.fire_time;
    sync_queue_.emplace(when, HeldAction{target, std::move(action)});
}

void Clock::dispatch_held() {
    while (!sync_queue_.empty() && sync_queue_.begin()->first <= time_) {
        auto node = sync_queue_.extract(sync_queue_.begin());
        HeldAction& held = node.mapped();
        held.action.fire_time = time_;
        deliver(held.target, std::move(held.action));
    }
}

void Clock::record_fault(ClockId worker_id, const FaultReport& fault) {
    log(LogLevel::Warn, "worker {} fault while handling {}: {}", worker_id, fault.command, fault.what);
    trace("worker_fault", [&](TraceWriter& writer) {
        writer.field("worker", static_cast<uint64_t>(worker_id));
        writer.field("command", fault.command);
        writer.field("what", fault.what);
    });
}

// =============================================================================
// Lockstep run
// =============================================================================

bool Clock::advance_parallel(double until) {
#ifdef TRACY_ENABLE
    ZoneScoped;
#endif
    // A stopped round already moved the workers to its end; the master catches up
    // locally before any new Run goes out.
    if (round_end_) {
        const double boundary = std::min(*round_end_, until);
        if (!advance(boundary)) {
            return false;
        }
        time_ = std::max(time_, boundary);
        if (boundary < *round_end_) {
            return true;
        }
        round_end_.reset();
    }

    // Round boundaries are base + k * interval, so they do not drift over long runs.
    double interval = dt_ > 0.0 ? dt_ : sync_interval_;
    double base = time_;
    uint64_t rounds = 0;
    while (until - time_ > interval * ROUND_TOLERANCE) {
        dispatch_held();

        double next = std::min(base + static_cast<double>(rounds + 1) * interval, until);
        if (until - next < interval * ROUND_TOLERANCE) {
            next = until;
        }
        const double origin = time_;
        const double duration = next - origin;

        round_end_ = next;
        for (auto& remote : workers_) {
            if (!remote->send(msg::Run{duration, true, origin})) {
                log(LogLevel::Warn, "worker {} is not running", remote->id());
            }
        }
        for (auto& remote : workers_) {
            if (remote->running()) {
                collect_done(*remote);
            }
        }

        if (!advance(next)) {
            return false;
        }
        time_ = next;
        round_end_.reset();
        ++rounds;

        const double current = dt_ > 0.0 ? dt_ : sync_interval_;
        if (current != interval) {
            interval = current;
            base = time_;
            rounds = 0;
        }
    }
    return true;
}

} // namespace desim::core
