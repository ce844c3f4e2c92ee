#include <desim/core/process.hpp>
#include <desim/core/clock.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace desim::core {

std::string to_string(const ProcessId& id) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            return fmt::format("{}", value);
        }
    }, id);
}

ProcessId next_process_id(const ProcessId& id) {
    if (const auto* number = std::get_if<int64_t>(&id)) {
        return *number + 1;
    }
    if (const auto* real = std::get_if<double>(&id)) {
        return std::nextafter(*real, std::numeric_limits<double>::infinity());
    }
    const auto& name = std::get<std::string>(id);
    const auto hash = name.rfind('#');
    if (hash != std::string::npos && hash + 1 < name.size()) {
        uint64_t suffix = 0;
        const char* first = name.data() + hash + 1;
        const char* last = name.data() + name.size();
        auto [ptr, ec] = std::from_chars(first, last, suffix);
        if (ec == std::errc() && ptr == last) {
            return name.substr(0, hash + 1) + std::to_string(suffix + 1);
        }
    }
    return name + "#1";
}

// =============================================================================
// Process
// =============================================================================

Process::Process(ProcessId id, ProcessBody body, uint64_t cycles)
    : id_(std::move(id))
    , body_(std::move(body))
    , cycles_(cycles) {}

void Process::start(Clock& clock) {
    if (state_ != ProcessState::Undefined) {
        throw InvalidStateError("process " + to_string(id_) + " already started");
    }
    clock_ = &clock;
    state_ = ProcessState::Idle;
    loop_ = loop();
    loop_.handle().promise().process = this;
    resume(loop_.handle());
}

Routine Process::loop() {
    while (cycles_ > 0 && !finished_) {
        try {
            co_await body_(*clock_, *this);
        } catch (const ProcessInterrupt& interrupt) {
            if (interrupt.signal() != Signal::Stop) {
                throw;
            }
            break;
        }
        if (cycles_ != UNLIMITED_CYCLES) {
            --cycles_;
        }
    }
}

uint64_t Process::suspend(std::coroutine_handle<> handle) noexcept {
    waiting_ = handle;
    return ++generation_;
}

void Process::wake(uint64_t generation) {
    if (generation != generation_ || !waiting_) {
        return;
    }
    resume(std::exchange(waiting_, nullptr));
}

void Process::interrupt(Signal signal, const std::string& reason) {
    if (state_ != ProcessState::Idle) {
        if (clock_ != nullptr) {
            Logger::instance().log(LogLevel::Warn, clock_->id(), clock_->time(),
                                   "interrupt ignored, process {} is not active", to_string(id_));
        }
        return;
    }
    pending_ = std::make_unique<ProcessInterrupt>(signal, reason);
    if (running_ || !waiting_) {
        return;
    }
    ++generation_;
    resume(std::exchange(waiting_, nullptr));
}

void Process::throw_if_interrupted() {
    if (pending_) {
        ProcessInterrupt interrupt = *pending_;
        pending_.reset();
        throw interrupt;
    }
}

void Process::resume(std::coroutine_handle<> handle) {
    running_ = true;
    handle.resume();
    running_ = false;
    settle();
}

void Process::settle() {
    if (!loop_.done() || state_ != ProcessState::Idle) {
        return;
    }
    exception_ = loop_.exception();
    if (exception_) {
        state_ = ProcessState::Failed;
        try {
            std::rethrow_exception(exception_);
        } catch (const std::exception& e) {
            failure_ = e.what();
        } catch (...) {
            failure_ = "unknown exception";
        }
    } else {
        state_ = ProcessState::Halted;
    }
    clock_->process_finished(*this);
}

// =============================================================================
// Clock process table
// =============================================================================

std::shared_ptr<Process> Clock::register_process(ProcessSpec spec, Placement where) {
    if (!spec.body) {
        throw InvalidArgumentError("empty process body");
    }
    if (is_local(where)) {
        return start_process(std::move(spec));
    }
    place(std::move(spec), where);
    return nullptr;
}

std::shared_ptr<Process> Clock::start_process(ProcessSpec spec) {
    ProcessId id = std::move(spec.id);
    while (processes_.count(id) != 0) {
        id = next_process_id(id);
    }
    auto process = std::make_shared<Process>(id, std::move(spec.body), spec.cycles);
    processes_.emplace(id, process);
    log(LogLevel::Debug, "process {} registered", to_string(id));
    process->start(*this);
    return process;
}

std::shared_ptr<Process> Clock::find_process(const ProcessId& id) const {
    auto it = processes_.find(id);
    return it != processes_.end() ? it->second : nullptr;
}

void Clock::process_finished(Process& process) {
    if (process.failed()) {
        log(LogLevel::Error, "process {} failed: {}", to_string(process.id()), process.failure());
        trace("process_failed", [&](TraceWriter& writer) {
            writer.field("process", to_string(process.id()));
            writer.field("what", process.failure());
        });
        return;
    }
    auto it = processes_.find(process.id());
    if (it != processes_.end() && it->second.get() == &process) {
        processes_.erase(it);
    }
}

// =============================================================================
// Awaiters
// =============================================================================

namespace {

Process& owner(Routine::handle_type handle) {
    Process* process = handle.promise().process;
    if (process == nullptr) {
        throw InvalidStateError("clock primitives can only be awaited inside a process");
    }
    return *process;
}

// Wake-up action: resumes the process only if it is still in the same suspension.
Action wake_up(Process& process, uint64_t generation) {
    return [weak = process.weak_from_this(), generation] {
        if (auto process = weak.lock()) {
            process->wake(generation);
        }
    };
}

} // anonymous namespace

DelayAwaiter delay(Clock& clock, Time t) {
    return DelayAwaiter{clock, clock.to_clock_time(t), false};
}

bool DelayAwaiter::await_suspend(Routine::handle_type handle) {
    process_ = &owner(handle);
    if (process_->interrupt_pending()) {
        return false;
    }
    const double target = absolute_ ? t_ : clock_.time() + std::max(t_, 0.0);
    if (absolute_ && target <= clock_.time()) {
        Logger::instance().log(LogLevel::Warn, clock_.id(), clock_.time(),
                               "delay until {} is not in the future", target);
        return false;
    }
    const uint64_t generation = process_->suspend(handle);
    clock_.schedule_at(wake_up(*process_, generation), target);
    return true;
}

void DelayAwaiter::await_resume() {
    process_->throw_if_interrupted();
}

bool WaitAwaiter::await_suspend(Routine::handle_type handle) {
    process_ = &owner(handle);
    if (process_->interrupt_pending()) {
        return false;
    }
    bool holds = true;
    for (const auto& predicate : predicates_) {
        if (!predicate()) {
            holds = false;
            break;
        }
    }
    if (holds) {
        return false;
    }
    const uint64_t generation = process_->suspend(handle);
    clock_.schedule_on(wake_up(*process_, generation), std::move(predicates_));
    return true;
}

void WaitAwaiter::await_resume() {
    process_->throw_if_interrupted();
}

bool NowAwaiter::await_suspend(Routine::handle_type handle) {
    process_ = &owner(handle);
    if (process_->interrupt_pending()) {
        return false;
    }
    const uint64_t generation = process_->suspend(handle);
    clock_.schedule_at([action = std::move(action_), wake = wake_up(*process_, generation)] {
        action();
        wake();
    }, clock_.time());
    return true;
}

void NowAwaiter::await_resume() {
    process_->throw_if_interrupted();
}

} // namespace desim::core
