#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace minerscan::core {

/**
 * @brief Multi-producer / multi-consumer queue that can be closed.
 *
 * Used to hand sweep progress and results across the thread boundary without
 * sharing mutable state with consumers. Once closed, producers are refused and
 * consumers drain what is left before `pop()` reports the end of the stream.
 *
 * A non-zero capacity turns the channel into a "latest values" buffer: pushing
 * into a full channel evicts the oldest element, so a slow reader sees recent
 * values and the producer never blocks.
 */
template <typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity = 0)
    : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Returns false if the channel was already closed.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            if (capacity_ != 0 && queue_.size() >= capacity_) {
                queue_.pop_front();
            }
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /// Blocks until a value is available or the channel is closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        return takeLocked();
    }

    /// Like pop(), but gives up after @p timeout.
    template <typename Rep, typename Period>
    std::optional<T> popFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        return takeLocked();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeLocked();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// True once the channel is closed and every value has been consumed.
    bool isFinished() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> takeLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace minerscan::core
