#pragma once

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace batchdl {

// Counting gate: at most limit() submitted tasks run at the same time, each on
// its own thread. Threads of finished tasks are joined on the next submit(),
// so no more than limit() threads are ever held. submit() and waitAll() belong
// to a single control thread.
class AdmissionController {
public:
    explicit AdmissionController(int limit);
    ~AdmissionController();

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Blocks until a slot is free, then starts `task`.
    void submit(std::function<void()> task);

    // Joins every started task and rethrows the first exception one let escape.
    void waitAll();

    [[nodiscard]] int limit() const noexcept { return limit_; }
    [[nodiscard]] int running() const;
    [[nodiscard]] int peakRunning() const;
    [[nodiscard]] std::size_t started() const noexcept { return started_; }
    [[nodiscard]] std::size_t unjoined() const noexcept { return threads_.size(); }

private:
    void finish(std::exception_ptr failure);
    void release();
    void reap(std::vector<std::thread::id> finished);
    void joinAll();

    const int limit_;
    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    int running_{0};
    int peak_running_{0};
    std::exception_ptr first_failure_;
    std::vector<std::thread::id> finished_;
    std::vector<std::thread> threads_;
    std::size_t started_{0};
};

} // namespace batchdl
