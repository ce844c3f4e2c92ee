#pragma once

#include <desim/core/action.hpp>
#include <desim/core/units.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace desim::core {

/// @brief Clock state machine states.
///
/// A clock is created Undefined, becomes Idle on first use, is Busy only
/// while a run (or single step) executes and may be Halted by a Stop.
///
/// @ingroup core_engine
enum class ClockState : uint8_t {
    Undefined,
    Idle,
    Busy,
    Halted,
};

[[nodiscard]] std::string_view to_string(ClockState state) noexcept;

/// @brief Commands driving the clock state machine.
/// @ingroup core_engine
namespace cmd {

struct Init {};

/// @brief Execute one step of the stepping algorithm.
struct Step {};

/// @brief Advance the clock by @c duration.
struct Run {
    double duration{0.0};
};

/// @brief Halt a running clock. Valid only while Busy.
struct Stop {};

/// @brief Continue a halted run for its remaining duration.
struct Resume {};

/// @brief Clear (hard) or time-shift (soft) the clock.
///
/// A hard reset drops every registered action and process and zeroes the
/// counters. A soft reset keeps the registry and moves every scheduled
/// time by `time - clock.time()`.
struct Reset {
    bool hard{true};
    double time{0.0};
    double dt{0.0};
    TimeUnit unit{TimeUnit::None};
};

} // namespace cmd

using Command = std::variant<cmd::Init, cmd::Step, cmd::Run, cmd::Stop, cmd::Resume, cmd::Reset>;

[[nodiscard]] std::string_view command_name(const Command& command) noexcept;

/// @brief Outcome of a Run, Resume or Step.
///
/// Counts are the deltas accumulated by this call; @c time is the clock
/// time when the call returned.
///
/// @ingroup core_engine
struct RunSummary {
    uint64_t events{0};   ///< Timed actions fired.
    uint64_t ticks{0};    ///< Sampling ticks taken.
    double time{0.0};     ///< Clock time on return.
    ClockState state{ClockState::Undefined};  ///< Idle, or Halted after a Stop.
};

/// @brief Result of Clock::step(Command).
///
/// @c handled is false for a (state, command) pair the state machine has
/// no transition for; the state is then unchanged.
///
/// @ingroup core_engine
struct TransitionResult {
    bool handled{false};
    ClockState state{ClockState::Undefined};
    std::optional<RunSummary> summary;
};

/// @brief Full observable state of a clock at one instant.
///
/// Returned by Clock::snapshot() and by a worker in answer to Query.
///
/// @ingroup core_engine
struct ClockSnapshot {
    ClockId id{MASTER_CLOCK_ID};
    ClockState state{ClockState::Undefined};
    TimeUnit unit{TimeUnit::None};
    double time{0.0};
    double dt{0.0};
    double end_time{0.0};
    double tev{0.0};
    double tn{0.0};
    uint64_t evcount{0};
    uint64_t scount{0};
    std::size_t events{0};
    std::size_t conditions{0};
    std::size_t periodics{0};
    std::size_t processes{0};
    std::size_t workers{0};
};

/// @brief The last fault captured by a worker event loop.
/// @ingroup core_engine
struct FaultReport {
    std::string what;     ///< Exception message.
    std::string command;  ///< Name of the message being handled.
    double time{0.0};     ///< Worker clock time when the fault was caught.
    std::string trace;    ///< Call stack of the handler that caught it.
};

/// @brief Build a FaultReport and capture the current call stack into it.
[[nodiscard]] FaultReport capture_fault(std::string what, std::string command, double time);

} // namespace desim::core
