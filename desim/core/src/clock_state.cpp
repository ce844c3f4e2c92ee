#include <desim/core/clock_state.hpp>
#include <desim/core/message.hpp>

#include <boost/stacktrace.hpp>

#include <utility>

namespace desim::core {

std::string_view to_string(ClockState state) noexcept {
    switch (state) {
        case ClockState::Undefined: return "Undefined";
        case ClockState::Idle:      return "Idle";
        case ClockState::Busy:      return "Busy";
        case ClockState::Halted:    return "Halted";
    }
    return "Unknown";
}

std::string_view command_name(const Command& command) noexcept {
    switch (command.index()) {
        case 0: return "Init";
        case 1: return "Step";
        case 2: return "Run";
        case 3: return "Stop";
        case 4: return "Resume";
        case 5: return "Reset";
        default: return "Unknown";
    }
}

std::string_view message_name(const Message& message) noexcept {
    switch (message.index()) {
        case 0:  return "Register";
        case 1:  return "Query";
        case 2:  return "Run";
        case 3:  return "Sync";
        case 4:  return "Reset";
        case 5:  return "Diag";
        case 6:  return "Done";
        case 7:  return "Forward";
        case 8:  return "Error";
        case 9:  return "Stop";
        case 10: return "Response";
        default: return "Unknown";
    }
}

FaultReport capture_fault(std::string what, std::string command, double time) {
    FaultReport report{std::move(what), std::move(command), time, {}};
    // Skip this frame.
    report.trace = boost::stacktrace::to_string(boost::stacktrace::stacktrace(1, 64));
    return report;
}

} // namespace desim::core
