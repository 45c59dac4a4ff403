#include "batchdl/execution_scope.hpp"

#include <algorithm>
#include <utility>

namespace batchdl {

ExecutionScope::ExecutionScope(Clock::duration timeout)
    : deadline_(Clock::now() + timeout) {}

bool ExecutionScope::cancel() {
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (refreshLocked() != StopReason::None) {
            return false;
        }
        reason_ = StopReason::Cancelled;
        callbacks.swap(callbacks_);
    }
    stopped_cv_.notify_all();

    for (auto& callback : callbacks) {
        callback();
    }
    return true;
}

bool ExecutionScope::isStopped() const {
    return reason() != StopReason::None;
}

StopReason ExecutionScope::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refreshLocked();
}

bool ExecutionScope::waitFor(Clock::duration duration) const {
    const auto wake = std::min(Clock::now() + duration, deadline_);
    std::unique_lock<std::mutex> lock(mutex_);
    stopped_cv_.wait_until(lock, wake, [this] { return refreshLocked() != StopReason::None; });
    return refreshLocked() != StopReason::None;
}

void ExecutionScope::throwIfStopped() const {
    const auto stop = reason();
    if (stop != StopReason::None) {
        throw ScopeError(stop);
    }
}

void ExecutionScope::onCancel(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != StopReason::Cancelled) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

StopReason ExecutionScope::refreshLocked() const {
    if (reason_ == StopReason::None && Clock::now() >= deadline_) {
        reason_ = StopReason::TimedOut;
    }
    return reason_;
}

} // namespace batchdl
