/**
 * @file Channel.hpp
 * @brief Closable multi-producer queue used for probe streams and event subscriptions.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace vlanvision::core {

/**
 * @brief Thread-safe FIFO that consumers drain until it is closed.
 *
 * Producers push until close(); consumers block in next() and receive
 * std::nullopt once the channel is closed and empty. A bounded channel
 * drops its oldest item when full so that a slow subscriber never stalls
 * the producer.
 */
template <typename T>
class Channel {
public:
    /// @param capacity Maximum buffered items, 0 for unbounded.
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueues an item.
     * @return False if the channel is already closed and the item was discarded.
     */
    bool push(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            if (capacity_ > 0 && items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /// Blocks until an item is available or the channel is closed and drained.
    std::optional<T> next() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty() || closed_; });
        return popLocked();
    }

    /// Like next(), but gives up after @p timeout.
    template <typename Rep, typename Period>
    std::optional<T> nextFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        return popLocked();
    }

    std::optional<T> tryNext() {
        std::lock_guard lock(mutex_);
        return popLocked();
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// True once the channel is closed and every item has been consumed.
    [[nodiscard]] bool isExhausted() const {
        std::lock_guard lock(mutex_);
        return closed_ && items_.empty();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t droppedCount() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    std::optional<T> popLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    size_t capacity_{0};
    size_t dropped_{0};
    bool closed_{false};
};

} // namespace vlanvision::core
