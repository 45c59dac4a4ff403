/**
 * @file test_admission_controller.cpp
 * @brief Unit tests for the bounded task admission gate
 */

#include <gtest/gtest.h>

#include <batchdl/admission_controller.hpp>
#include <batchdl/errors.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace batchdl::test {

using namespace std::chrono_literals;

namespace {

class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{false};
};

} // namespace

TEST(AdmissionControllerTest, RejectsLimitBelowOne) {
    EXPECT_THROW(AdmissionController(0), ConfigurationError);
    EXPECT_THROW(AdmissionController(-2), ConfigurationError);
}

TEST(AdmissionControllerTest, RunsEverySubmittedTask) {
    AdmissionController admission(2);
    std::atomic<int> executed{0};
    for (int i = 0; i < 10; ++i) {
        admission.submit([&] { ++executed; });
    }
    admission.waitAll();

    EXPECT_EQ(executed.load(), 10);
    EXPECT_EQ(admission.started(), 10u);
    EXPECT_EQ(admission.running(), 0);
}

TEST(AdmissionControllerTest, NeverExceedsLimit) {
    AdmissionController admission(3);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    for (int i = 0; i < 12; ++i) {
        admission.submit([&] {
            const int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(10ms);
            --active;
        });
    }
    admission.waitAll();

    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(admission.peakRunning(), 3);
}

TEST(AdmissionControllerTest, SubmitBlocksUntilSlotIsReleased) {
    AdmissionController admission(2);
    Gate gate;
    admission.submit([&] { gate.wait(); });
    admission.submit([&] { gate.wait(); });
    EXPECT_EQ(admission.running(), 2);
    EXPECT_EQ(admission.peakRunning(), 2);

    std::atomic<bool> released{false};
    std::thread opener([&] {
        std::this_thread::sleep_for(30ms);
        released = true;
        gate.open();
    });

    admission.submit([] {});
    EXPECT_TRUE(released.load());

    admission.waitAll();
    opener.join();
    EXPECT_EQ(admission.peakRunning(), 2);
}

TEST(AdmissionControllerTest, LimitOfOneSerializesTasks) {
    AdmissionController admission(1);
    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};

    for (int i = 0; i < 5; ++i) {
        admission.submit([&] {
            if (++active > 1) {
                overlapped = true;
            }
            std::this_thread::sleep_for(5ms);
            --active;
        });
    }
    admission.waitAll();

    EXPECT_FALSE(overlapped.load());
    EXPECT_EQ(admission.peakRunning(), 1);
}

TEST(AdmissionControllerTest, WaitAllRethrowsEscapedException) {
    AdmissionController admission(2);
    std::atomic<int> executed{0};
    admission.submit([] { throw std::runtime_error("boom"); });
    admission.submit([&] { ++executed; });

    EXPECT_THROW(admission.waitAll(), std::runtime_error);
    EXPECT_EQ(executed.load(), 1);
    EXPECT_EQ(admission.running(), 0);
}

TEST(AdmissionControllerTest, FailedTaskStillReleasesItsSlot) {
    AdmissionController admission(1);
    admission.submit([] { throw std::runtime_error("first"); });
    admission.submit([] {});

    EXPECT_THROW(admission.waitAll(), std::runtime_error);
    EXPECT_EQ(admission.started(), 2u);
}

TEST(AdmissionControllerTest, FinishedThreadsAreJoinedOnNextSubmit) {
    AdmissionController admission(3);
    std::atomic<int> executed{0};
    std::size_t most_unjoined = 0;

    for (int i = 0; i < 5000; ++i) {
        admission.submit([&] { ++executed; });
        most_unjoined = std::max(most_unjoined, admission.unjoined());
    }
    admission.waitAll();

    EXPECT_EQ(executed.load(), 5000);
    EXPECT_EQ(admission.started(), 5000u);
    EXPECT_LE(most_unjoined, 3u);
    EXPECT_EQ(admission.unjoined(), 0u);
}

TEST(AdmissionControllerTest, CanBeReusedAfterWaitAll) {
    AdmissionController admission(2);
    std::atomic<int> executed{0};
    for (int round = 0; round < 3; ++round) {
        for (int i = 0; i < 4; ++i) {
            admission.submit([&] { ++executed; });
        }
        admission.waitAll();
    }

    EXPECT_EQ(executed.load(), 12);
    EXPECT_EQ(admission.started(), 12u);
}

} // namespace batchdl::test
