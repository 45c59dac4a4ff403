#include "batchdl/admission_controller.hpp"

#include "batchdl/errors.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

AdmissionController::AdmissionController(int limit) : limit_(limit) {
    if (limit_ < 1) {
        throw ConfigurationError(fmt::format("admission limit must be at least 1, got {}", limit_));
    }
}

AdmissionController::~AdmissionController() { joinAll(); }

void AdmissionController::submit(std::function<void()> task) {
    std::vector<std::thread::id> finished;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        slot_freed_.wait(lock, [this] { return running_ < limit_; });
        ++running_;
        peak_running_ = std::max(peak_running_, running_);
        finished.swap(finished_);
    }
    reap(std::move(finished));

    try {
        threads_.emplace_back([this, task = std::move(task)]() {
            std::exception_ptr failure;
            try {
                task();
            } catch (...) {
                failure = std::current_exception();
            }
            finish(std::move(failure));
        });
    } catch (...) {
        release();
        throw;
    }
    ++started_;
}

void AdmissionController::waitAll() {
    joinAll();

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure = std::exchange(first_failure_, nullptr);
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

int AdmissionController::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

int AdmissionController::peakRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_running_;
}

void AdmissionController::finish(std::exception_ptr failure) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
        finished_.push_back(std::this_thread::get_id());
        if (failure && !first_failure_) {
            first_failure_ = std::move(failure);
        }
    }
    slot_freed_.notify_one();
}

void AdmissionController::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
    }
    slot_freed_.notify_one();
}

void AdmissionController::reap(std::vector<std::thread::id> finished) {
    if (finished.empty()) {
        return;
    }
    for (auto& thread : threads_) {
        if (std::find(finished.begin(), finished.end(), thread.get_id()) != finished.end()) {
            thread.join();
        }
    }
    threads_.erase(std::remove_if(threads_.begin(), threads_.end(),
                                  [](const std::thread& thread) { return !thread.joinable(); }),
                   threads_.end());
}

void AdmissionController::joinAll() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    finished_.clear();
}

} // namespace batchdl
