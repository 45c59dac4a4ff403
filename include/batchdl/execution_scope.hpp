#pragma once

#include "errors.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace batchdl {

// Cancellable, deadline-bounded context shared by every task of one batch.
// The first stop reason observed sticks: a cancel after the deadline still
// reports TimedOut.
class ExecutionScope {
public:
    using Clock = std::chrono::steady_clock;

    explicit ExecutionScope(Clock::duration timeout);

    ExecutionScope(const ExecutionScope&) = delete;
    ExecutionScope& operator=(const ExecutionScope&) = delete;

    // Returns false if the scope had already stopped.
    bool cancel();

    [[nodiscard]] bool isStopped() const;
    [[nodiscard]] StopReason reason() const;
    [[nodiscard]] Clock::time_point deadline() const noexcept { return deadline_; }

    // Sleeps for up to `duration`, returning early with true once stopped.
    bool waitFor(Clock::duration duration) const;

    // Throws ScopeError when stopped.
    void throwIfStopped() const;

    // The callback runs once, on the cancelling thread, when cancel() stops
    // the scope; immediately if the scope is already cancelled. Deadline
    // expiry does not run callbacks: waiters observe deadline() themselves.
    void onCancel(std::function<void()> callback);

private:
    StopReason refreshLocked() const;

    const Clock::time_point deadline_;
    mutable std::mutex mutex_;
    mutable std::condition_variable stopped_cv_;
    mutable StopReason reason_{StopReason::None};
    std::vector<std::function<void()>> callbacks_;
};

} // namespace batchdl
