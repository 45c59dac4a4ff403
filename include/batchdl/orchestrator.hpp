#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "outcome.hpp"
#include "progress_aggregator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace batchdl {

class ExecutionScope;

enum class BatchState {
    Ready,
    Running,
    Terminal,
};

[[nodiscard]] std::string_view toString(BatchState state) noexcept;

// Downloads a batch of resources with at most max_concurrent_transfers
// transfers in flight. An instance runs exactly one batch.
class Orchestrator {
public:
    // Null collaborators select the libcurl implementations.
    explicit Orchestrator(Config config = {},
                          SizeProberPtr prober = nullptr,
                          TransferWorkerPtr worker = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Both throw InvalidStateError unless state() is Ready, ProbeError when a
    // size cannot be determined, and ScopeError when the batch is cancelled
    // or times out. With fail_on_transfer_error they also throw TransferError
    // when any transfer failed.
    void runSingle(const std::string& url, const std::string& destination);
    void runBatch(const std::vector<DownloadRequest>& requests);

    // Stops the running batch. Returns false when no batch is running.
    bool cancel();

    [[nodiscard]] BatchState state() const noexcept { return state_.load(); }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] std::int64_t totalExpectedBytes() const noexcept { return total_expected_bytes_.load(); }
    [[nodiscard]] std::int64_t transferredBytes() const noexcept { return transferred_bytes_.load(); }

    // Valid once the run has returned.
    [[nodiscard]] const std::vector<TransferOutcome>& outcomes() const noexcept { return outcomes_; }

    // Null unless detailed_progress is enabled. Closed once the batch ends.
    [[nodiscard]] std::shared_ptr<ProgressChannel> progress() const noexcept { return progress_; }
    [[nodiscard]] std::shared_ptr<ThroughputChannel> throughput() const noexcept { return throughput_; }

private:
    void begin();
    void execute(const std::vector<DownloadRequest>& requests);
    std::vector<ResumeInfo> probeAll(const std::vector<DownloadRequest>& requests);
    void dispatch(ExecutionScope& scope,
                  const std::vector<DownloadRequest>& requests,
                  const std::vector<ResumeInfo>& resume,
                  ByteCountSink& inbox);
    void runTransfer(const ExecutionScope& scope,
                     TransferOutcome& outcome,
                     const ResumeInfo& resume,
                     ByteCountSink& inbox);
    void publishScope(std::shared_ptr<ExecutionScope> scope);
    void closeTelemetry();
    void throwIfFailed() const;

    const Config config_;
    Logger logger_;
    SizeProberPtr prober_;
    TransferWorkerPtr worker_;

    std::atomic<BatchState> state_{BatchState::Ready};
    std::atomic<std::int64_t> total_expected_bytes_{0};
    std::atomic<std::int64_t> transferred_bytes_{0};
    std::vector<TransferOutcome> outcomes_;

    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<ThroughputChannel> throughput_;

    std::mutex scope_mutex_;
    std::shared_ptr<ExecutionScope> scope_;
    bool cancel_requested_{false};
    bool scope_retired_{false};
};

} // namespace batchdl
