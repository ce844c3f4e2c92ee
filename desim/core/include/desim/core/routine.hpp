#pragma once

#include <coroutine>
#include <exception>
#include <utility>

namespace desim::core {

class Process;

/// @brief Lazily started coroutine type for process bodies.
///
/// A Routine does not run until it is awaited (or resumed by its owning
/// Process). Awaiting a Routine from another Routine runs it to
/// completion and transfers control back to the awaiting coroutine.
/// The owning Process pointer is handed down to awaited children so
/// clock primitives (delay, wait_until, now) know whom to wake.
///
/// An exception escaping the body is captured and rethrown at the
/// awaiting site.
///
/// @code
/// Routine customer(Clock& clock, Process& self) {
///     co_await delay(clock, 1.5);
///     co_await wait_until(clock, [&] { return server_free; });
/// }
/// @endcode
///
/// @see Process, delay, wait_until, now
/// @ingroup core_process
class [[nodiscard]] Routine {
public:
    struct promise_type;
    using handle_type = std::coroutine_handle<promise_type>;

    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }
        std::coroutine_handle<> await_suspend(handle_type handle) noexcept {
            auto continuation = handle.promise().continuation;
            if (continuation) {
                return continuation;
            }
            return std::noop_coroutine();
        }
        void await_resume() const noexcept {}
    };

    struct promise_type {
        Routine get_return_object() noexcept {
            return Routine{handle_type::from_promise(*this)};
        }
        std::suspend_always initial_suspend() const noexcept { return {}; }
        FinalAwaiter final_suspend() const noexcept { return {}; }
        void return_void() const noexcept {}
        void unhandled_exception() noexcept { exception = std::current_exception(); }

        std::coroutine_handle<> continuation;
        std::exception_ptr exception;
        Process* process{nullptr};
    };

    Routine() noexcept = default;
    explicit Routine(handle_type handle) noexcept : handle_(handle) {}

    Routine(Routine&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}
    Routine& operator=(Routine&& other) noexcept {
        if (this != &other) {
            destroy();
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }
    Routine(const Routine&) = delete;
    Routine& operator=(const Routine&) = delete;

    ~Routine() { destroy(); }

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(handle_); }
    [[nodiscard]] bool done() const noexcept { return !handle_ || handle_.done(); }
    [[nodiscard]] handle_type handle() const noexcept { return handle_; }

    /// @brief Exception captured from the body, if it failed.
    [[nodiscard]] std::exception_ptr exception() const noexcept {
        return handle_ ? handle_.promise().exception : nullptr;
    }

    bool await_ready() const noexcept { return done(); }

    std::coroutine_handle<> await_suspend(handle_type awaiting) noexcept {
        handle_.promise().continuation = awaiting;
        handle_.promise().process = awaiting.promise().process;
        return handle_;
    }

    void await_resume() const {
        if (handle_ && handle_.promise().exception) {
            std::rethrow_exception(handle_.promise().exception);
        }
    }

private:
    void destroy() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = nullptr;
        }
    }

    handle_type handle_;
};

} // namespace desim::core
