#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace desim::core {

/// @brief Unbounded thread-safe FIFO connecting two threads.
///
/// push() never blocks. pop() blocks until a value arrives or the
/// channel is closed; after close() the remaining values can still be
/// drained, then pop() returns std::nullopt.
///
/// Used in pairs between a master clock and each worker: `forth`
/// carries commands to the worker, `back` carries replies.
///
/// @ingroup core_parallel
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// @brief Enqueue a value. Values pushed after close() are dropped.
    /// @return False if the channel was closed.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        ready_.notify_one();
        return true;
    }

    /// @brief Dequeue a value, blocking while the channel is empty and open.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return take(lock);
    }

    /// @brief Dequeue a value, waiting at most @p timeout.
    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return take(lock);
    }

    /// @brief Dequeue a value if one is ready, without blocking.
    std::optional<T> try_pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        return take(lock);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& /*lock*/) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> queue_;
    bool closed_{false};
};

} // namespace desim::core
