#pragma once

#include "channel.hpp"
#include "collaborators.hpp"
#include "logging.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace batchdl {

class ExecutionScope;

using ProgressChannel = Channel<double>;
using ThroughputChannel = Channel<std::int64_t>;

// Single consumer of the byte counts pushed by every transfer. Publishes
// the per-interval delta and the completed fraction, and closes both
// telemetry channels exactly once: on observing the scope stop, or on
// finish(), whichever happens first.
class ProgressAggregator {
public:
    // Null telemetry channels disable publishing; totals are still tallied.
    ProgressAggregator(std::int64_t total_expected_bytes,
                       std::chrono::milliseconds interval,
                       std::shared_ptr<ByteCountSink> inbox,
                       std::shared_ptr<ProgressChannel> progress,
                       std::shared_ptr<ThroughputChannel> throughput,
                       const Logger& logger);
    ~ProgressAggregator();

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // `scope` must outlive finish().
    void start(ExecutionScope& scope);

    // Call after every producer is done. Drains the inbox, closes the
    // telemetry channels if still open and returns the final total.
    std::int64_t finish();

    [[nodiscard]] std::int64_t totalExpectedBytes() const noexcept { return total_expected_bytes_; }

private:
    void run(const ExecutionScope& scope);
    void tick();
    void publishProgress();
    void closeOutputs();

    const std::int64_t total_expected_bytes_;
    const std::chrono::milliseconds interval_;
    std::shared_ptr<ByteCountSink> inbox_;
    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<ThroughputChannel> throughput_;
    const Logger& logger_;

    std::thread thread_;
    // Owned by the aggregator thread until it is joined.
    std::int64_t total_bytes_{0};
    std::int64_t last_tick_bytes_{0};
    bool outputs_open_{false};
};

} // namespace batchdl
