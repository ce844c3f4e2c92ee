#pragma once

#include <desim/core/action.hpp>
#include <desim/core/channel.hpp>
#include <desim/core/clock.hpp>
#include <desim/core/clock_state.hpp>
#include <desim/core/message.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace desim::core {

using MessageChannel = Channel<Message>;

/// @brief Worker side of a forked clock: an event loop around a local Clock.
///
/// The ActiveClock lives on its worker thread and owns the worker's
/// Clock. It takes commands from the `forth` channel and answers on the
/// `back` channel until it receives Stop or `forth` is closed.
///
/// A fault raised while handling a command is recorded (see Diag) and
/// answered with an Error message. The loop keeps serving unless the
/// worker was created with fault handling disabled.
///
/// @see RemoteClock, Clock::fork
/// @ingroup core_parallel
class ActiveClock {
public:
    ActiveClock(ClockId id, std::shared_ptr<MessageChannel> forth,
                std::shared_ptr<MessageChannel> back, bool handle_exceptions);

    ActiveClock(const ActiveClock&) = delete;
    ActiveClock& operator=(const ActiveClock&) = delete;

    /// @brief Serve commands until Stop. Closes both channels on return.
    void serve();

    [[nodiscard]] Clock& clock() noexcept { return clock_; }
    [[nodiscard]] ClockId id() const noexcept { return clock_.id(); }
    [[nodiscard]] const std::optional<FaultReport>& last_fault() const noexcept { return last_fault_; }

    /// @brief Ask the master to register @p payload on clock @p target.
    ///
    /// Target 0 lets the master pick a random worker. Never blocks.
    void forward(Payload payload, ClockId target, bool sync);

private:
    void dispatch(Message& message);
    /// Record a fault and answer with Error. Returns whether to keep serving.
    bool fail(const Message& message, std::string what);

    Clock clock_;
    std::shared_ptr<MessageChannel> forth_;
    std::shared_ptr<MessageChannel> back_;
    bool handle_exceptions_;
    std::optional<FaultReport> last_fault_;
};

/// @brief Master side handle of a worker clock: channel-only access.
///
/// Owns the worker thread and both channels. Nothing on the worker's
/// clock is reachable except by messages. The destructor stops and
/// joins the worker if it is still running.
///
/// @see ActiveClock, Clock::worker
/// @ingroup core_parallel
class RemoteClock {
public:
    RemoteClock(ClockId id, bool handle_exceptions);
    ~RemoteClock();

    RemoteClock(const RemoteClock&) = delete;
    RemoteClock& operator=(const RemoteClock&) = delete;

    [[nodiscard]] ClockId id() const noexcept { return id_; }

    /// @brief Send a command. Returns false if the worker has shut down.
    bool send(Message message);

    /// @brief Wait for the next reply. std::nullopt once the worker has shut down.
    std::optional<Message> receive();

    /// @brief True while the worker loop is accepting commands.
    [[nodiscard]] bool running() const { return !forth_->closed(); }

    /// @brief Wait for the worker thread to exit.
    void join();

    /// @brief Wall time of the worker's last Run round, in nanoseconds.
    [[nodiscard]] uint64_t last_round_ns() const noexcept { return last_round_ns_; }

private:
    friend class Clock;

    ClockId id_;
    std::shared_ptr<MessageChannel> forth_;
    std::shared_ptr<MessageChannel> back_;
    std::thread thread_;
    uint64_t last_round_ns_{0};
};

} // namespace desim::core
