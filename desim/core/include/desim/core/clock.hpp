#pragma once

#include <desim/core/action.hpp>
#include <desim/core/clock_state.hpp>
#include <desim/core/config.hpp>
#include <desim/core/log.hpp>
#include <desim/core/message.hpp>
#include <desim/core/process.hpp>
#include <desim/core/schedule.hpp>
#include <desim/core/trace_writer.hpp>
#include <desim/core/units.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string_view>
#include <utility>
#include <vector>

namespace desim::core {

class ActiveClock;
class RemoteClock;

/// @brief Power of ten bounding @p n from below: 10^i <= n < 10^(i+1).
/// @return The power of ten, or 1.0 if @p n <= 0.
/// @ingroup core_engine
[[nodiscard]] double time_scale(double n) noexcept;

/// @brief Virtual-time clock: owns a registry of pending work and fires it.
///
/// A Clock advances virtual time by interleaving two kinds of steps:
/// firing the next timed action, and sampling ticks of length dt() that
/// run periodic actions and then fire every conditional action whose
/// predicates hold. With dt() == 0 the clock is purely event-driven.
///
/// The state machine is driven through step(const Command&), which
/// returns a TransitionResult and reports (state, command) pairs it has
/// no transition for instead of throwing. The named wrappers run(),
/// stop(), resume(), init() and reset() go through the same dispatch.
///
/// @code
/// core::Clock clock;
/// clock.schedule_after([&] { ++arrivals; }, 1.0);
/// clock.schedule_every([&] { ++samples; }, 1.0);
/// auto summary = clock.run(10.0);
/// @endcode
///
/// A master clock (id 1) can be forked onto worker threads. Each worker
/// owns its own Clock; the master reaches it only through its channels
/// (see RemoteClock) and runs the workers in lockstep rounds. A Clock
/// object is confined to the thread that runs it.
///
/// The Clock is non-copyable and non-movable: processes and worker
/// loops hold pointers to it.
///
/// @see Schedule, Process, RemoteClock, ActiveClock
/// @ingroup core_engine
class Clock {
public:
    explicit Clock(double dt = 0.0, double t0 = 0.0, TimeUnit unit = TimeUnit::None);
    explicit Clock(const ClockConfig& config);
    ~Clock();

    Clock(const Clock&) = delete;
    Clock& operator=(const Clock&) = delete;
    Clock(Clock&&) = delete;
    Clock& operator=(Clock&&) = delete;

    [[nodiscard]] ClockId id() const noexcept { return id_; }
    [[nodiscard]] ClockState state() const noexcept { return state_; }
    [[nodiscard]] double time() const noexcept { return time_; }
    [[nodiscard]] double dt() const noexcept { return dt_; }
    [[nodiscard]] TimeUnit unit() const noexcept { return unit_; }
    [[nodiscard]] double end_time() const noexcept { return end_time_; }
    [[nodiscard]] double next_event_time() const noexcept { return tev_; }
    [[nodiscard]] double next_tick_time() const noexcept { return tn_; }
    [[nodiscard]] uint64_t evcount() const noexcept { return evcount_; }
    [[nodiscard]] uint64_t scount() const noexcept { return scount_; }
    [[nodiscard]] bool is_worker() const noexcept { return active_ != nullptr; }

    /// @brief Read-only view of the registry.
    [[nodiscard]] const Schedule& schedule() const noexcept { return schedule_; }

    [[nodiscard]] ClockSnapshot snapshot() const;

    /// @name Units
    /// @{

    /// @brief Magnitude of @p t in this clock's unit.
    ///
    /// A clock without a unit logs a warning and uses the bare magnitude.
    [[nodiscard]] double to_clock_time(Time t) const;

    /// @brief Change the clock unit, converting every clock and scheduled
    ///        time when both the old and the new unit are real units.
    void set_unit(TimeUnit unit);
    /// @}

    /// @brief Set the sampling interval. 0 switches ticking off.
    /// @throws InvalidArgumentError if @p dt is negative or NaN.
    void set_sample_time(double dt);

    /// @name Scheduling
    ///
    /// Every call returns the time the work was registered for: the
    /// adjusted fire time for timed actions, the current clock time
    /// otherwise. Times earlier than now are clamped to now.
    /// @{

    /// @brief Register a timed action, with its own start time and repeat interval.
    /// @throws InvalidArgumentError for an empty action, a NaN time or a
    ///         negative repeat interval.
    double schedule(TimedAction action, Placement where = {});

    double schedule_at(Action action, double t, Placement where = {});
    double schedule_at(Action action, Time t, Placement where = {});

    double schedule_after(Action action, double delta, Placement where = {});
    double schedule_after(Action action, Time delta, Placement where = {});

    /// @brief Fire now and then every @p interval.
    /// @throws InvalidArgumentError if @p interval is not positive.
    double schedule_every(Action action, double interval, Placement where = {});
    double schedule_every(Action action, Time interval, Placement where = {});

    /// @brief Fire @p action once, at the first tick where @p predicate holds.
    ///
    /// If the clock is Busy and the predicate already holds the action
    /// runs immediately. Otherwise it is registered and, without an active
    /// sampling interval, one is derived from the remaining run horizon.
    double schedule_on(Action action, Predicate predicate, Placement where = {});
    double schedule_on(Action action, std::vector<Predicate> predicates, Placement where = {});

    /// @brief Run @p action at every tick, keeping or deriving dt().
    double register_periodic(Action action, Placement where = {});

    /// @brief Run @p action at every tick, setting dt() to @p dt.
    double register_periodic(Action action, double dt, Placement where = {});
    /// @}

    /// @name Processes
    /// @{

    /// @brief Create and start a process.
    ///
    /// The id is bumped until it is unique in the process table. The body
    /// runs synchronously up to its first suspension.
    ///
    /// @return The process, or nullptr if it was placed on another clock.
    std::shared_ptr<Process> register_process(ProcessSpec spec, Placement where = {});

    /// @brief Convenience wrapper binding extra arguments to a process body.
    ///
    /// @p fn is invoked as `fn(clock, process, args...)` once per cycle and
    /// must return a Routine.
    template<typename F, typename... Args>
    std::shared_ptr<Process> process(ProcessId id, F fn, Args... args) {
        ProcessBody body = [fn = std::move(fn), args...](Clock& clock, Process& self) mutable {
            return std::invoke(fn, clock, self, args...);
        };
        return register_process(ProcessSpec{std::move(id), std::move(body), UNLIMITED_CYCLES});
    }

    [[nodiscard]] const std::map<ProcessId, std::shared_ptr<Process>>& processes() const noexcept {
        return processes_;
    }

    [[nodiscard]] std::shared_ptr<Process> find_process(const ProcessId& id) const;
    /// @}

    /// @name Run control
    /// @{

    /// @brief Feed one command to the state machine.
    TransitionResult step(const Command& command);

    void init();

    /// @brief Execute a single step.
    RunSummary step();

    /// @brief Advance the clock by @p duration.
    ///
    /// Returns with state Idle and time() == the old time + @p duration,
    /// or with state Halted if an action stopped the clock.
    RunSummary run(double duration);
    RunSummary run(Time duration);

    /// @brief Halt a running clock (from inside an action).
    void stop();

    /// @brief Continue a halted run for its remaining duration.
    RunSummary resume();

    void reset(const cmd::Reset& options = {});

    /// @brief Soft-reset to the time, sampling interval and unit of @p other.
    void sync_to(const Clock& other);
    /// @}

    /// @name Tracing
    /// @{

    /// @brief Set the trace writer. The clock does not own it; nullptr disables tracing.
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Emit a trace record of type @p type if a writer is installed.
    /// @tparam F Callable with signature void(TraceWriter&) adding fields.
    template<typename F>
    void trace(std::string_view type, F&& fields);
    /// @}

    /// @name Parallel operation
    /// @{

    /// @brief Start @p workers worker clocks (0: hardware threads - 1).
    ///
    /// Each worker is synchronized to this clock's time, dt and unit.
    /// @throws InvalidStateError on a worker clock or a running clock.
    void fork(std::size_t workers = 0);

    /// @brief Stop and join every worker. Their registries are discarded.
    void collapse();

    [[nodiscard]] std::size_t workers() const noexcept { return workers_.size(); }

    /// @brief Handle of worker @p id.
    /// @throws OutOfRangeError if @p id names no worker.
    [[nodiscard]] RemoteClock& worker(ClockId id);

    /// @brief Snapshot of worker @p id (a Query round trip).
    [[nodiscard]] ClockSnapshot query(ClockId id);

    /// @brief Last fault captured by worker @p id (a Diag round trip).
    [[nodiscard]] std::optional<FaultReport> diagnose(ClockId id);

    void set_sync_interval(double interval);
    [[nodiscard]] double sync_interval() const noexcept { return sync_interval_; }

    /// @brief Timed actions held until the next synchronization boundary.
    [[nodiscard]] std::size_t held_actions() const noexcept { return sync_queue_.size(); }
    /// @}

private:
    friend class ActiveClock;
    friend class Process;
    friend class RTClock;

    struct HeldAction {
        ClockId target;
        TimedAction action;
    };

    template<typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const {
        Logger::instance().log(level, id_, time_, format, std::forward<Args>(args)...);
    }

    void unhandled(const Command& command);
    RunSummary single_step();
    void ensure_initialized() noexcept;
    RunSummary run_span(bool resume);
    RunSummary summarize(uint64_t events_before, uint64_t ticks_before) const;
    void reset_now(const cmd::Reset& options);
    void align_time(double t);

    // Stepping
    void set_times();
    bool do_step();
    void tick();
    void fire_event();
    bool advance(double until);
    void fire_due(double until);

    // Registration
    double place(Payload payload, const Placement& where);
    double register_local(Payload payload);
    double schedule_local(TimedAction action);
    double condition_local(ConditionalAction action);
    double periodic_local(PeriodicAction action);
    std::shared_ptr<Process> start_process(ProcessSpec spec);
    [[nodiscard]] bool is_local(const Placement& where) const noexcept;
    void activate_sampling(double dt, bool derived);
    void process_finished(Process& process);

    // Parallel
    bool advance_parallel(double until);
    [[nodiscard]] ClockId random_worker();
    Message talk(RemoteClock& worker, Message message);
    void collect_done(RemoteClock& worker);
    void route(msg::Forward forward);
    void hold(ClockId target, TimedAction action);
    void dispatch_held();
    void deliver(ClockId target, Payload payload);
    void record_fault(ClockId worker, const FaultReport& fault);
    void shutdown_workers() noexcept;

    ClockId id_{MASTER_CLOCK_ID};
    ClockState state_{ClockState::Undefined};
    TimeUnit unit_{TimeUnit::None};
    double time_{0.0};
    double dt_{0.0};
    bool derived_dt_{false};
    double end_time_{0.0};
    double tev_{0.0};
    double tn_{0.0};
    uint64_t evcount_{0};
    uint64_t scount_{0};

    Schedule schedule_;
    std::map<ProcessId, std::shared_ptr<Process>> processes_;
    TraceWriter* trace_writer_{nullptr};

    // Master side
    std::vector<std::unique_ptr<RemoteClock>> workers_;
    std::multimap<double, HeldAction> sync_queue_;
    std::optional<double> round_end_;  ///< End of a round the master has not finished.
    double sync_interval_{DEFAULT_SYNC_INTERVAL};
    std::size_t configured_workers_{0};
    bool handle_exceptions_{true};
    std::mt19937 rng_{static_cast<std::mt19937::result_type>(DEFAULT_SEED)};

    // Worker side
    ActiveClock* active_{nullptr};
};

template<typename F>
void Clock::trace(std::string_view type, F&& fields) {
    if (trace_writer_) {
        trace_writer_->begin(time_);
        trace_writer_->type(type);
        trace_writer_->field("clock", static_cast<uint64_t>(id_));
        fields(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace desim::core
