#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace batchdl {

// Multi-producer FIFO that can be closed. A capacity of 0 means unbounded.
// Values pushed before close() are still delivered to consumers.
template <typename T>
class Channel {
public:
    enum class WaitStatus {
        Value,
        Timeout,
        Interrupted,
        Closed,
    };

    explicit Channel(std::size_t capacity = 0) : capacity_(capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while the channel is full. Returns false once closed.
    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || !fullLocked(); });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    // Never blocks: evicts the oldest value when the channel is full.
    bool pushDropOldest(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (fullLocked()) {
            queue_.pop_front();
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until a value is available. Returns nullopt when closed and drained.
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        return takeLocked();
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return takeLocked();
    }

    // Waits for a value, the deadline, an interrupt() or close(), whichever
    // comes first. Pending values win over interrupts and close.
    template <typename Clock, typename Duration>
    WaitStatus popUntil(const std::chrono::time_point<Clock, Duration>& deadline, T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_until(lock, deadline, [this] {
            return closed_ || interrupted_ || !queue_.empty();
        });
        if (!queue_.empty()) {
            out = takeLocked();
            return WaitStatus::Value;
        }
        if (interrupted_) {
            interrupted_ = false;
            return WaitStatus::Interrupted;
        }
        if (closed_) {
            return WaitStatus::Closed;
        }
        return WaitStatus::Timeout;
    }

    // Wakes a consumer blocked in popUntil().
    void interrupt() {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
        not_empty_.notify_all();
    }

    // Returns true only for the call that actually closed the channel.
    bool close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
        return true;
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    bool fullLocked() const { return capacity_ != 0 && queue_.size() >= capacity_; }

    T takeLocked() {
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool interrupted_{false};
    bool closed_{false};
};

} // namespace batchdl
