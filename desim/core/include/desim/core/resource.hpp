#pragma once

#include <desim/core/error.hpp>

#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>
#include <utility>

namespace desim::core {

inline constexpr std::size_t UNLIMITED_CAPACITY = std::numeric_limits<std::size_t>::max();

/// @brief A deque with a capacity limit, shared between processes.
///
/// Items can be added and removed at both ends, so a Resource serves as
/// a FIFO queue (push/pop_front) or a LIFO stack (push/pop_back).
///
/// The Resource does not synchronize its operations. Processes on one
/// clock never run concurrently and need no locking; code sharing a
/// Resource between worker threads wraps modifying calls in
/// lock()/unlock(), or in a std::lock_guard on the Resource itself.
///
/// @code
/// core::Resource<int> queue(10);
/// std::lock_guard<core::Resource<int>> guard(queue);
/// queue.push(1);
/// @endcode
///
/// @ingroup core_process
template<typename T>
class Resource {
public:
    explicit Resource(std::size_t capacity = UNLIMITED_CAPACITY)
        : capacity_(capacity) {}

    Resource(const Resource&) = delete;
    Resource& operator=(const Resource&) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
    [[nodiscard]] bool full() const noexcept { return items_.size() >= capacity_; }

    /// @brief True if an item is available.
    [[nodiscard]] bool ready() const noexcept { return !items_.empty(); }

    /// @brief Add an item at the back.
    /// @throws InvalidStateError if the resource is full.
    void push(T item) {
        require_space();
        items_.push_back(std::move(item));
    }

    /// @brief Add an item at the front.
    /// @throws InvalidStateError if the resource is full.
    void push_front(T item) {
        require_space();
        items_.push_front(std::move(item));
    }

    /// @brief Remove and return the front item.
    /// @throws InvalidStateError if the resource is empty.
    T pop_front() {
        require_item();
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    /// @brief Remove and return the back item.
    /// @throws InvalidStateError if the resource is empty.
    T pop_back() {
        require_item();
        T item = std::move(items_.back());
        items_.pop_back();
        return item;
    }

    [[nodiscard]] const T& front() const {
        require_item();
        return items_.front();
    }

    [[nodiscard]] const T& back() const {
        require_item();
        return items_.back();
    }

    void clear() noexcept { items_.clear(); }

    /// @name Lockable
    /// @{
    void lock() { mutex_.lock(); }
    void unlock() { mutex_.unlock(); }
    [[nodiscard]] bool try_lock() { return mutex_.try_lock(); }
    /// @}

private:
    void require_space() const {
        if (full()) {
            throw InvalidStateError("resource is full");
        }
    }

    void require_item() const {
        if (items_.empty()) {
            throw InvalidStateError("resource is empty");
        }
    }

    std::deque<T> items_;
    std::size_t capacity_;
    std::recursive_mutex mutex_;
};

} // namespace desim::core
