#pragma once

#include <desim/core/action.hpp>
#include <desim/core/error.hpp>
#include <desim/core/routine.hpp>
#include <desim/core/units.hpp>

#include <coroutine>
#include <cstdint>
#include <exception>
#include <functional>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace desim::core {

class Clock;
class Process;

/// @brief Process identifier: integer, real or string.
///
/// Colliding ids are bumped on registration: integers by one, reals to
/// the next representable value, strings `A` -> `A#1` -> `A#2`.
///
/// @ingroup core_process
using ProcessId = std::variant<int64_t, double, std::string>;

[[nodiscard]] std::string to_string(const ProcessId& id);

/// @brief The id following @p id in the deduplication sequence.
[[nodiscard]] ProcessId next_process_id(const ProcessId& id);

/// @brief Lifecycle of a process.
///
/// Idle means started and active (running or suspended at a clock
/// primitive). Halted means the loop ended normally or was stopped.
///
/// @ingroup core_process
enum class ProcessState : uint8_t {
    Undefined,
    Idle,
    Halted,
    Failed,
};

/// @brief Kind of signal delivered by Process::interrupt.
/// @ingroup core_process
enum class Signal : uint8_t {
    Stop,       ///< Terminate the process loop.
    Interrupt,  ///< Raise ProcessInterrupt in the body; uncaught, it fails the process.
};

/// @brief Raised at the suspension point of an interrupted process.
/// @ingroup core_process
class ProcessInterrupt : public SimulationError {
public:
    ProcessInterrupt(Signal signal, const std::string& reason)
        : SimulationError(reason.empty() ? std::string("process interrupted") : reason)
        , signal_(signal) {}

    [[nodiscard]] Signal signal() const noexcept { return signal_; }

private:
    Signal signal_;
};

/// @brief A process body: invoked once per loop cycle.
using ProcessBody = std::function<Routine(Clock&, Process&)>;

inline constexpr uint64_t UNLIMITED_CYCLES = std::numeric_limits<uint64_t>::max();

/// @brief Everything needed to create a process on some clock.
/// @ingroup core_process
struct ProcessSpec {
    ProcessId id{int64_t{1}};
    ProcessBody body;
    uint64_t cycles{UNLIMITED_CYCLES};
};

/// @brief A suspendable unit of user computation bound to a clock.
///
/// The body is run in a loop, @c cycles times or until finish() is called.
/// Each cycle must suspend at least once through delay(), wait_until()
/// or now(); a body that never suspends starves its clock.
///
/// Suspension is a rendezvous: the clock primitive schedules a wake-up
/// action holding a weak reference to the process and the generation
/// number of the suspension. An interrupt bumps the generation, so a
/// wake-up belonging to an abandoned suspension is ignored.
///
/// A fault escaping the body marks the process Failed; the exception is
/// kept and the process stays in its clock's process table. The clock
/// and other processes carry on.
///
/// @see Clock::register_process, delay, wait_until, now
/// @ingroup core_process
class Process : public std::enable_shared_from_this<Process> {
public:
    Process(ProcessId id, ProcessBody body, uint64_t cycles = UNLIMITED_CYCLES);

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    [[nodiscard]] const ProcessId& id() const noexcept { return id_; }
    [[nodiscard]] ProcessState state() const noexcept { return state_; }
    [[nodiscard]] bool failed() const noexcept { return state_ == ProcessState::Failed; }
    [[nodiscard]] bool suspended() const noexcept { return static_cast<bool>(waiting_); }
    [[nodiscard]] uint64_t cycles_left() const noexcept { return cycles_; }

    /// @brief The fault that failed the process, or nullptr.
    [[nodiscard]] std::exception_ptr exception() const noexcept { return exception_; }

    /// @brief Message of the fault that failed the process, empty otherwise.
    [[nodiscard]] const std::string& failure() const noexcept { return failure_; }

    /// @brief End the loop after the current cycle.
    void finish() noexcept { finished_ = true; }

    /// @brief Deliver a signal at the process's current or next suspension point.
    ///
    /// A suspended process is resumed synchronously and the pending wake-up
    /// is abandoned. A process that is not active ignores the signal.
    void interrupt(Signal signal, const std::string& reason = {});

    /// @name Suspension protocol used by the clock primitives
    /// @{
    [[nodiscard]] Clock* clock() const noexcept { return clock_; }
    [[nodiscard]] bool interrupt_pending() const noexcept { return pending_ != nullptr; }
    uint64_t suspend(std::coroutine_handle<> handle) noexcept;
    void wake(uint64_t generation);
    void throw_if_interrupted();
    /// @}

private:
    friend class Clock;

    void start(Clock& clock);
    Routine loop();
    void resume(std::coroutine_handle<> handle);
    void settle();

    ProcessId id_;
    ProcessBody body_;
    uint64_t cycles_;
    Clock* clock_{nullptr};
    ProcessState state_{ProcessState::Undefined};
    bool finished_{false};
    bool running_{false};
    uint64_t generation_{0};
    std::coroutine_handle<> waiting_;
    std::unique_ptr<ProcessInterrupt> pending_;
    Routine loop_;
    std::exception_ptr exception_;
    std::string failure_;
};

/// @brief Awaiter suspending a process until a virtual time.
/// @ingroup core_process
class DelayAwaiter {
public:
    DelayAwaiter(Clock& clock, double t, bool absolute) noexcept
        : clock_(clock), t_(t), absolute_(absolute) {}

    bool await_ready() const noexcept { return false; }
    bool await_suspend(Routine::handle_type handle);
    void await_resume();

private:
    Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    double t_;
    bool absolute_;
    Process* process_{nullptr};
};

/// @brief Awaiter suspending a process until a set of predicates holds.
/// @ingroup core_process
class WaitAwaiter {
public:
    WaitAwaiter(Clock& clock, std::vector<Predicate> predicates)
        : clock_(clock), predicates_(std::move(predicates)) {}

    bool await_ready() const noexcept { return false; }
    bool await_suspend(Routine::handle_type handle);
    void await_resume();

private:
    Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::vector<Predicate> predicates_;
    Process* process_{nullptr};
};

/// @brief Awaiter running an action on the clock timeline and waiting for it.
/// @ingroup core_process
class NowAwaiter {
public:
    NowAwaiter(Clock& clock, Action action)
        : clock_(clock), action_(std::move(action)) {}

    bool await_ready() const noexcept { return false; }
    bool await_suspend(Routine::handle_type handle);
    void await_resume();

private:
    Clock& clock_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Action action_;
    Process* process_{nullptr};
};

/// @brief Suspend the calling process for @p t time units.
///
/// Resumes exactly once, no earlier than `t` after suspension.
/// A negative @p t behaves like zero.
inline DelayAwaiter delay(Clock& clock, double t) noexcept {
    return DelayAwaiter{clock, t, false};
}

/// @brief Suspend the calling process for a dimensioned time.
DelayAwaiter delay(Clock& clock, Time t);

/// @brief Suspend the calling process until absolute time @p t.
///
/// If @p t is not in the future a warning is logged and the process
/// continues without suspending.
inline DelayAwaiter delay_until(Clock& clock, double t) noexcept {
    return DelayAwaiter{clock, t, true};
}

/// @brief Suspend until @p predicate holds; returns at once if it already does.
inline WaitAwaiter wait_until(Clock& clock, Predicate predicate) {
    std::vector<Predicate> predicates;
    predicates.push_back(std::move(predicate));
    return WaitAwaiter{clock, std::move(predicates)};
}

/// @brief Suspend until every predicate in @p predicates holds.
inline WaitAwaiter wait_until(Clock& clock, std::vector<Predicate> predicates) {
    return WaitAwaiter{clock, std::move(predicates)};
}

/// @brief Run @p action at the current clock time and wait until it has run.
inline NowAwaiter now(Clock& clock, Action action) {
    return NowAwaiter{clock, std::move(action)};
}

} // namespace desim::core
