#pragma once

#include <desim/core/action.hpp>
#include <desim/core/clock_state.hpp>
#include <desim/core/process.hpp>
#include <desim/core/units.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace desim::core {

/// @brief Anything a scheduling call can register on a remote clock.
/// @ingroup core_parallel
using Payload = std::variant<TimedAction, ConditionalAction, PeriodicAction, ProcessSpec>;

/// @brief Value carried by a Response.
///
/// A registration answers with the adjusted fire time (or the clock time),
/// Query with a snapshot, Diag with the last fault if any.
///
/// @ingroup core_parallel
using ResponseValue = std::variant<std::monostate, double, ClockSnapshot, std::optional<FaultReport>>;

/// @brief Messages exchanged between a master clock and its workers.
///
/// Master to worker (`forth` channel): Register, Query, Run, Sync, Reset,
/// Diag, Stop. Worker to master (`back` channel): Response, Done, Forward,
/// Error.
///
/// @ingroup core_parallel
namespace msg {

/// @brief Register a payload on the receiving clock.
///
/// With @c ack the worker answers with a Response carrying the fire time.
/// Registrations routed on behalf of another worker are sent without ack.
struct Register {
    Payload payload;
    bool ack{true};
};

/// @brief Ask a worker for a ClockSnapshot.
struct Query {};

/// @brief Advance the worker by @c duration.
///
/// With @c sync the worker first aligns its time to @c origin, the
/// master's time at the start of the round.
struct Run {
    double duration{0.0};
    bool sync{true};
    double origin{0.0};
};

/// @brief Align the worker's time, sampling interval and unit (soft reset).
struct Sync {
    double time{0.0};
    double dt{0.0};
    TimeUnit unit{TimeUnit::None};
};

/// @brief Clear (hard) or resynchronize (soft) the worker's clock.
struct Reset {
    bool hard{true};
    double time{0.0};
    double dt{0.0};
    TimeUnit unit{TimeUnit::None};
};

/// @brief Ask a worker for its last captured fault.
struct Diag {};

/// @brief A worker finished a Run round.
struct Done {
    uint64_t elapsed_ns{0};
};

/// @brief A worker asks the master to register a payload elsewhere.
struct Forward {
    Payload payload;
    ClockId target{MASTER_CLOCK_ID};
    bool sync{false};
};

/// @brief A worker caught a fault while handling a message.
struct Error {
    FaultReport fault;
};

/// @brief Shut the worker's event loop down.
struct Stop {};

struct Response {
    ResponseValue value;
};

} // namespace msg

using Message = std::variant<msg::Register, msg::Query, msg::Run, msg::Sync, msg::Reset,
                             msg::Diag, msg::Done, msg::Forward, msg::Error, msg::Stop,
                             msg::Response>;

[[nodiscard]] std::string_view message_name(const Message& message) noexcept;

} // namespace desim::core
