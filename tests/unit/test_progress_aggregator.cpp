/**
 * @file test_progress_aggregator.cpp
 * @brief Unit tests for byte-count aggregation and telemetry publishing
 */

#include <gtest/gtest.h>

#include <batchdl/execution_scope.hpp>
#include <batchdl/logging.hpp>
#include <batchdl/progress_aggregator.hpp>

#include "test_fixtures.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace batchdl::test {

using namespace std::chrono_literals;

class ProgressAggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        inbox_ = std::make_shared<ByteCountSink>();
        progress_ = std::make_shared<ProgressChannel>(10);
        throughput_ = std::make_shared<ThroughputChannel>(10);
    }

    std::unique_ptr<ProgressAggregator> makeAggregator(std::int64_t expected,
                                                       std::chrono::milliseconds interval = 1s) {
        return std::make_unique<ProgressAggregator>(expected, interval, inbox_, progress_, throughput_, logger_);
    }

    template <typename T>
    static std::vector<T> drain(Channel<T>& channel) {
        std::vector<T> values;
        while (auto value = channel.pop()) {
            values.push_back(*value);
        }
        return values;
    }

    LogCapture log_;
    Logger logger_{log_.sink()};
    std::shared_ptr<ByteCountSink> inbox_;
    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<ThroughputChannel> throughput_;
};

TEST_F(ProgressAggregatorTest, CountsEveryDeltaFromConcurrentProducers) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(8 * 500 * 3);
    aggregator->start(scope);

    std::vector<std::thread> producers;
    for (int p = 0; p < 8; ++p) {
        producers.emplace_back([this] {
            for (int i = 0; i < 500; ++i) {
                inbox_->push(3);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(aggregator->finish(), 8 * 500 * 3);
}

TEST_F(ProgressAggregatorTest, FinalSampleReportsCompletion) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(1000);
    aggregator->start(scope);

    inbox_->push(400);
    inbox_->push(600);
    EXPECT_EQ(aggregator->finish(), 1000);

    const auto samples = drain(*progress_);
    ASSERT_FALSE(samples.empty());
    EXPECT_DOUBLE_EQ(samples.back(), 1.0);
    EXPECT_TRUE(throughput_->isClosed());
}

TEST_F(ProgressAggregatorTest, TicksPublishThroughputAndFraction) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(1000, 20ms);
    aggregator->start(scope);

    inbox_->push(500);
    std::this_thread::sleep_for(80ms);

    EXPECT_GE(throughput_->size(), 1u);
    EXPECT_GE(progress_->size(), 1u);
    const auto first_fraction = progress_->tryPop();
    ASSERT_TRUE(first_fraction.has_value());
    EXPECT_DOUBLE_EQ(*first_fraction, 0.5);

    aggregator->finish();
    EXPECT_TRUE(log_.contains("500 / 1000 bytes"));
}

TEST_F(ProgressAggregatorTest, ThroughputIsDeltaPerSecond) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(10000, 50ms);
    aggregator->start(scope);

    inbox_->push(100);
    const auto rate = throughput_->pop();
    aggregator->finish();

    ASSERT_TRUE(rate.has_value());
    EXPECT_EQ(*rate, 100 * 1000 / 50);
}

TEST_F(ProgressAggregatorTest, FractionIsClampedToOne) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(100);
    aggregator->start(scope);

    inbox_->push(250);
    aggregator->finish();

    const auto samples = drain(*progress_);
    ASSERT_FALSE(samples.empty());
    for (double sample : samples) {
        EXPECT_LE(sample, 1.0);
        EXPECT_GE(sample, 0.0);
    }
}

TEST_F(ProgressAggregatorTest, ZeroExpectedBytesNeverReportsFraction) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(0, 5ms);
    aggregator->start(scope);

    std::this_thread::sleep_for(40ms);
    EXPECT_EQ(aggregator->finish(), 0);

    EXPECT_TRUE(drain(*progress_).empty());
    EXPECT_TRUE(progress_->isClosed());
}

TEST_F(ProgressAggregatorTest, CancellationClosesOutputsBeforeFinish) {
    ExecutionScope scope(1min);
    auto aggregator = makeAggregator(1000);
    aggregator->start(scope);
    inbox_->push(100);

    scope.cancel();

    auto progress_done = std::async(std::launch::async, [this] { return drain(*progress_); });
    auto throughput_done = std::async(std::launch::async, [this] { return drain(*throughput_); });
    ASSERT_EQ(progress_done.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(throughput_done.wait_for(5s), std::future_status::ready);

    // Deltas arriving after the stop are still accounted for.
    inbox_->push(50);
    EXPECT_EQ(aggregator->finish(), 150);
    EXPECT_TRUE(log_.contains("Progress observer stopped: batch cancelled"));
}

TEST_F(ProgressAggregatorTest, TimeoutClosesOutputs) {
    ExecutionScope scope(30ms);
    auto aggregator = makeAggregator(1000);
    aggregator->start(scope);

    auto progress_done = std::async(std::launch::async, [this] { return drain(*progress_); });
    ASSERT_EQ(progress_done.wait_for(5s), std::future_status::ready);
    EXPECT_TRUE(progress_done.get().empty());

    aggregator->finish();
    EXPECT_TRUE(log_.contains("batch timed out"));
}

TEST_F(ProgressAggregatorTest, TalliesWithoutTelemetryChannels) {
    ExecutionScope scope(1min);
    ProgressAggregator aggregator(300, 10ms, inbox_, nullptr, nullptr, logger_);
    aggregator.start(scope);

    inbox_->push(100);
    inbox_->push(200);
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(aggregator.finish(), 300);
    EXPECT_TRUE(log_.contains("300 / 300 bytes"));
}

TEST_F(ProgressAggregatorTest, FinishWithoutStartClosesOutputs) {
    auto aggregator = makeAggregator(10);
    EXPECT_EQ(aggregator->finish(), 0);
    EXPECT_TRUE(progress_->isClosed());
    EXPECT_TRUE(throughput_->isClosed());
}

} // namespace batchdl::test
