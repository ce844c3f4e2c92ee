#pragma once

#include <desim/core/action.hpp>
#include <desim/core/channel.hpp>
#include <desim/core/clock.hpp>
#include <desim/core/clock_state.hpp>
#include <desim/core/message.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace desim::core {

/// @brief Smallest accepted RTClock period, in seconds.
inline constexpr double MIN_RT_PERIOD = 0.001;

/// @brief A clock paced by the system's steady clock instead of run to a target time.
///
/// The RTClock owns a Clock and drives it from its own thread. Every
/// period it reads the elapsed wall time since start (or the last
/// reset), ticks the sampling actions whose tick time has passed and
/// fires the timed actions that are due.
///
/// Registrations made from other threads travel over a Channel and are
/// applied by the clock thread at the beginning of the next period.
/// Actions therefore run on the clock thread; anything they share with
/// the caller must be synchronized by the caller.
///
/// @code
/// core::RTClock rtc(0.01);
/// rtc.start();
/// rtc.schedule_after([&] { done = true; }, 0.5);
/// @endcode
///
/// @see Clock
/// @ingroup core_engine
class RTClock {
public:
    /// @param period Wall time between two evaluations, in seconds.
    /// @param id Id reported in logs and snapshots.
    /// @throws InvalidArgumentError if @p period is below MIN_RT_PERIOD.
    explicit RTClock(double period, ClockId id = MASTER_CLOCK_ID, bool handle_exceptions = true);
    ~RTClock();

    RTClock(const RTClock&) = delete;
    RTClock& operator=(const RTClock&) = delete;

    /// @brief Start the clock thread. Time starts counting at zero.
    /// @throws InvalidStateError if the clock is already running.
    void start();

    /// @brief Stop and join the clock thread. Idempotent.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] double period() const noexcept { return period_; }
    [[nodiscard]] ClockId id() const noexcept { return id_; }

    /// @brief Seconds elapsed since start or the last reset, as of the last period.
    [[nodiscard]] double time() const noexcept { return time_.load(); }

    [[nodiscard]] uint64_t evcount() const noexcept { return evcount_.load(); }
    [[nodiscard]] uint64_t scount() const noexcept { return scount_.load(); }

    /// @brief Fire @p action at @p t seconds on this clock's time line.
    void schedule_at(Action action, double t);

    /// @brief Fire @p action @p delta seconds from now.
    void schedule_after(Action action, double delta);

    /// @brief Fire @p action once, at the first period where every predicate holds.
    void schedule_on(Action action, std::vector<Predicate> predicates);
    void schedule_on(Action action, Predicate predicate);

    /// @brief Run @p action every period.
    void register_periodic(Action action);

    /// @brief Restart the time count at zero and zero the counters.
    void reset();

    /// @brief Last fault raised by an action on the clock thread.
    [[nodiscard]] std::optional<FaultReport> last_fault() const;

private:
    using Ticks = std::chrono::steady_clock::time_point;

    void send(Message message);
    void serve();
    bool apply(Message& message);
    void evaluate(double now);
    bool fail(std::string what);
    [[nodiscard]] double elapsed(Ticks now) const;

    double period_;
    ClockId id_;
    bool handle_exceptions_;

    // Owned by the clock thread once started.
    Clock clock_;
    Ticks origin_;

    Channel<Message> commands_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<double> time_{0.0};
    std::atomic<uint64_t> evcount_{0};
    std::atomic<uint64_t> scount_{0};

    mutable std::mutex fault_mutex_;
    std::optional<FaultReport> last_fault_;
};

} // namespace desim::core
