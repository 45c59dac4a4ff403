#include "batchdl/progress_aggregator.hpp"

#include "batchdl/errors.hpp"
#include "batchdl/execution_scope.hpp"

#include <algorithm>
#include <utility>

namespace batchdl {

ProgressAggregator::ProgressAggregator(std::int64_t total_expected_bytes,
                                       std::chrono::milliseconds interval,
                                       std::shared_ptr<ByteCountSink> inbox,
                                       std::shared_ptr<ProgressChannel> progress,
                                       std::shared_ptr<ThroughputChannel> throughput,
                                       const Logger& logger)
    : total_expected_bytes_(total_expected_bytes),
      interval_(interval),
      inbox_(std::move(inbox)),
      progress_(std::move(progress)),
      throughput_(std::move(throughput)),
      logger_(logger),
      outputs_open_(progress_ || throughput_) {}

ProgressAggregator::~ProgressAggregator() {
    if (thread_.joinable()) {
        inbox_->close();
        thread_.join();
    }
}

void ProgressAggregator::start(ExecutionScope& scope) {
    if (thread_.joinable()) {
        throw InvalidStateError("progress aggregator already started");
    }

    logger_.log("Progress observer started, expecting {} bytes", total_expected_bytes_);
    scope.onCancel([inbox = inbox_] { inbox->interrupt(); });
    thread_ = std::thread([this, &scope] { run(scope); });
}

std::int64_t ProgressAggregator::finish() {
    inbox_->close();
    if (thread_.joinable()) {
        thread_.join();
    } else {
        closeOutputs();
    }
    return total_bytes_;
}

void ProgressAggregator::run(const ExecutionScope& scope) {
    using Clock = ExecutionScope::Clock;

    auto next_tick = Clock::now() + interval_;
    bool stopped = false;
    for (;;) {
        // Once stopped the deadline is behind us; only ticks remain to wait for.
        const auto wake = stopped ? next_tick : std::min(next_tick, scope.deadline());
        std::int64_t delta = 0;
        const auto status = inbox_->popUntil(wake, delta);
        if (status == ByteCountSink::WaitStatus::Closed) {
            break;
        }
        if (status == ByteCountSink::WaitStatus::Value) {
            total_bytes_ += delta;
        }

        if (!stopped && scope.isStopped()) {
            stopped = true;
            logger_.log("Progress observer stopped: batch {}", toString(scope.reason()));
            closeOutputs();
        }

        const auto now = Clock::now();
        if (now >= next_tick) {
            tick();
            while (next_tick <= now) {
                next_tick += interval_;
            }
        }
    }

    if (!stopped && !scope.isStopped()) {
        publishProgress();
    }
    closeOutputs();
    logger_.log("Progress observer finished, {} / {} bytes", total_bytes_, total_expected_bytes_);
}

void ProgressAggregator::tick() {
    const std::int64_t delta = total_bytes_ - last_tick_bytes_;
    last_tick_bytes_ = total_bytes_;
    const std::int64_t per_second = delta * 1000 / std::max<std::int64_t>(1, interval_.count());

    logger_.log("Downloaded {}/s, {} / {} bytes",
                formatSize(static_cast<std::uint64_t>(std::max<std::int64_t>(0, per_second))),
                total_bytes_,
                total_expected_bytes_);

    if (outputs_open_ && throughput_) {
        throughput_->pushDropOldest(per_second);
    }
    publishProgress();
}

void ProgressAggregator::publishProgress() {
    // Nothing to divide by: an empty batch never reports a fraction.
    if (!outputs_open_ || !progress_ || total_expected_bytes_ <= 0) {
        return;
    }
    const double fraction = static_cast<double>(total_bytes_) / static_cast<double>(total_expected_bytes_);
    progress_->pushDropOldest(std::clamp(fraction, 0.0, 1.0));
}

void ProgressAggregator::closeOutputs() {
    if (!outputs_open_) {
        return;
    }
    outputs_open_ = false;
    if (progress_) {
        progress_->close();
    }
    if (throughput_) {
        throughput_->close();
    }
}

} // namespace batchdl
