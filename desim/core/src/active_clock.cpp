#include <desim/core/active_clock.hpp>
#include <desim/core/error.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace desim::core {

// =============================================================================
// ActiveClock
// =============================================================================

ActiveClock::ActiveClock(ClockId id, std::shared_ptr<MessageChannel> forth,
                         std::shared_ptr<MessageChannel> back, bool handle_exceptions)
    : forth_(std::move(forth))
    , back_(std::move(back))
    , handle_exceptions_(handle_exceptions) {
    clock_.id_ = id;
    clock_.active_ = this;
    clock_.init();
}

void ActiveClock::serve() {
    while (auto message = forth_->pop()) {
        if (std::holds_alternative<msg::Stop>(*message)) {
            back_->push(msg::Response{});
            break;
        }
        if (std::holds_alternative<msg::Diag>(*message)) {
            back_->push(msg::Response{last_fault_});
            continue;
        }
        try {
            dispatch(*message);
        } catch (const std::exception& e) {
            if (!fail(*message, e.what())) {
                break;
            }
        } catch (...) {
            if (!fail(*message, "unknown exception")) {
                break;
            }
        }
    }
    forth_->close();
    back_->close();
}

bool ActiveClock::fail(const Message& message, std::string what) {
    last_fault_ = capture_fault(std::move(what), std::string(message_name(message)), clock_.time());
    Logger::instance().log(LogLevel::Error, clock_.id(), clock_.time(),
                           "fault while handling {}: {}", message_name(message), last_fault_->what);
    back_->push(msg::Error{*last_fault_});
    return handle_exceptions_;
}

void ActiveClock::forward(Payload payload, ClockId target, bool sync) {
    back_->push(msg::Forward{std::move(payload), target, sync});
}

void ActiveClock::dispatch(Message& message) {
    if (auto* reg = std::get_if<msg::Register>(&message)) {
        const double t = clock_.register_local(std::move(reg->payload));
        if (reg->ack) {
            back_->push(msg::Response{t});
        }
    } else if (std::holds_alternative<msg::Query>(message)) {
        back_->push(msg::Response{clock_.snapshot()});
    } else if (const auto* run = std::get_if<msg::Run>(&message)) {
        const auto start = std::chrono::steady_clock::now();
        double duration = run->duration;
        if (run->sync) {
            // Rounds only ever move a worker forward.
            const double end = run->origin + run->duration;
            if (clock_.time() < run->origin) {
                clock_.align_time(run->origin);
            }
            duration = std::max(0.0, end - clock_.time());
        }
        clock_.run(duration);
        const auto elapsed = std::chrono::steady_clock::now() - start;
        back_->push(msg::Done{static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count())});
    } else if (const auto* sync = std::get_if<msg::Sync>(&message)) {
        clock_.reset(cmd::Reset{false, sync->time, sync->dt, sync->unit});
        back_->push(msg::Response{clock_.time()});
    } else if (const auto* reset = std::get_if<msg::Reset>(&message)) {
        clock_.reset(cmd::Reset{reset->hard, reset->time, reset->dt, reset->unit});
        back_->push(msg::Response{clock_.time()});
    } else {
        throw InvalidStateError(std::string("unexpected message ") + std::string(message_name(message)));
    }
}

// =============================================================================
// RemoteClock
// =============================================================================

RemoteClock::RemoteClock(ClockId id, bool handle_exceptions)
    : id_(id)
    , forth_(std::make_shared<MessageChannel>())
    , back_(std::make_shared<MessageChannel>()) {
    thread_ = std::thread([id, forth = forth_, back = back_, handle_exceptions] {
        ActiveClock worker(id, forth, back, handle_exceptions);
        worker.serve();
    });
}

RemoteClock::~RemoteClock() {
    if (thread_.joinable()) {
        forth_->push(msg::Stop{});
        forth_->close();
        thread_.join();
    }
}

bool RemoteClock::send(Message message) {
    return forth_->push(std::move(message));
}

std::optional<Message> RemoteClock::receive() {
    return back_->pop();
}

void RemoteClock::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace desim::core
