#include "batchdl/orchestrator.hpp"

#include "batchdl/admission_controller.hpp"
#include "batchdl/curl_transfer.hpp"
#include "batchdl/errors.hpp"
#include "batchdl/execution_scope.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

namespace {

Config validated(Config config) {
    if (config.max_concurrent_transfers < 1) {
        throw ConfigurationError(fmt::format(
            "max_concurrent_transfers must be at least 1, got {}", config.max_concurrent_transfers));
    }
    if (config.max_retry < 0) {
        throw ConfigurationError(fmt::format("max_retry cannot be negative, got {}", config.max_retry));
    }
    if (config.timeout <= std::chrono::milliseconds::zero()) {
        throw ConfigurationError("timeout must be positive");
    }
    if (config.progress_interval <= std::chrono::milliseconds::zero()) {
        throw ConfigurationError("progress_interval must be positive");
    }
    if (config.telemetry_capacity == 0) {
        throw ConfigurationError("telemetry_capacity must be at least 1");
    }
    return config;
}

} // namespace

std::string_view toString(BatchState state) noexcept {
    switch (state) {
    case BatchState::Ready:
        return "ready";
    case BatchState::Running:
        return "running";
    case BatchState::Terminal:
        return "terminal";
    }
    return "unknown";
}

std::string_view toString(TransferStatus status) noexcept {
    switch (status) {
    case TransferStatus::Pending:
        return "pending";
    case TransferStatus::Completed:
        return "completed";
    case TransferStatus::Failed:
        return "failed";
    case TransferStatus::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

Orchestrator::Orchestrator(Config config, SizeProberPtr prober, TransferWorkerPtr worker)
    : config_(validated(std::move(config))),
      logger_(config_.log_sink),
      prober_(prober ? std::move(prober) : std::make_shared<CurlSizeProber>()),
      worker_(worker ? std::move(worker) : std::make_shared<CurlTransferWorker>()) {
    if (config_.detailed_progress) {
        progress_ = std::make_shared<ProgressChannel>(config_.telemetry_capacity);
        throughput_ = std::make_shared<ThroughputChannel>(config_.telemetry_capacity);
    }
    if (config_.max_retry > 0) {
        logger_.log("max_retry={} ignored: failed transfers are not retried", config_.max_retry);
    }
}

Orchestrator::~Orchestrator() { closeTelemetry(); }

void Orchestrator::runSingle(const std::string& url, const std::string& destination) {
    runBatch({DownloadRequest{url, destination}});
}

void Orchestrator::runBatch(const std::vector<DownloadRequest>& requests) {
    begin();

    struct TerminalGuard {
        Orchestrator& self;
        ~TerminalGuard() {
            self.publishScope(nullptr);
            self.closeTelemetry();
            self.state_.store(BatchState::Terminal);
        }
    } guard{*this};

    try {
        execute(requests);
    } catch (const Error& e) {
        logger_.log("Batch failed: {}", e.what());
        throw;
    }
}

bool Orchestrator::cancel() {
    std::shared_ptr<ExecutionScope> scope;
    {
        std::lock_guard<std::mutex> lock(scope_mutex_);
        if (state_.load() != BatchState::Running || scope_retired_) {
            return false;
        }
        if (!scope_) {
            cancel_requested_ = true;
            logger_.log("Cancel requested before transfers started");
            return true;
        }
        scope = scope_;
    }

    logger_.log("Cancel requested");
    return scope->cancel();
}

void Orchestrator::begin() {
    auto expected = BatchState::Ready;
    if (!state_.compare_exchange_strong(expected, BatchState::Running)) {
        throw InvalidStateError(fmt::format("cannot start a batch that is {}", toString(expected)));
    }
}

void Orchestrator::execute(const std::vector<DownloadRequest>& requests) {
    logger_.log("Download files: {}", requests.size());

    outcomes_.clear();
    outcomes_.reserve(requests.size());
    for (const auto& request : requests) {
        outcomes_.push_back(TransferOutcome{request, TransferStatus::Pending, 0, {}});
    }

    const auto resume = probeAll(requests);
    std::int64_t total = 0;
    for (std::size_t i = 0; i < resume.size(); ++i) {
        outcomes_[i].expected_bytes = resume[i].content_length;
        total += resume[i].content_length;
    }
    total_expected_bytes_.store(total);
    logger_.log("Total download bytes: {} ({})", total, formatSize(static_cast<std::uint64_t>(total)));

    auto scope = std::make_shared<ExecutionScope>(config_.timeout);
    auto inbox = std::make_shared<ByteCountSink>();
    ProgressAggregator aggregator(total, config_.progress_interval, inbox, progress_, throughput_, logger_);
    aggregator.start(*scope);
    publishScope(scope);

    dispatch(*scope, requests, resume, *inbox);

    transferred_bytes_.store(aggregator.finish());
    const auto stop = scope->reason();
    publishScope(nullptr);
    logger_.log("All download tasks done, {} / {} bytes", transferred_bytes_.load(), total);

    if (stop != StopReason::None) {
        throw ScopeError(stop);
    }
    if (config_.fail_on_transfer_error) {
        throwIfFailed();
    }
}

std::vector<ResumeInfo> Orchestrator::probeAll(const std::vector<DownloadRequest>& requests) {
    std::vector<ResumeInfo> resume;
    resume.reserve(requests.size());

    for (const auto& request : requests) {
        {
            std::lock_guard<std::mutex> lock(scope_mutex_);
            if (cancel_requested_) {
                throw ScopeError(StopReason::Cancelled);
            }
        }

        ResumeInfo info;
        try {
            info = prober_->probe(request.url);
        } catch (const ProbeError&) {
            throw;
        } catch (const std::exception& e) {
            throw ProbeError(request.url, e.what());
        }

        if (info.content_length < 0) {
            throw ProbeError(request.url, "server did not report the content length");
        }
        logger_.log("Probed {}: {} bytes, {}",
                    request.url,
                    info.content_length,
                    info.resumable ? "resumable" : "not resumable");
        resume.push_back(info);
    }
    return resume;
}

void Orchestrator::dispatch(ExecutionScope& scope,
                            const std::vector<DownloadRequest>& requests,
                            const std::vector<ResumeInfo>& resume,
                            ByteCountSink& inbox) {
    AdmissionController admission(config_.max_concurrent_transfers);

    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (scope.isStopped()) {
            logger_.log("Batch {}, {} transfers not started", toString(scope.reason()), requests.size() - i);
            for (std::size_t j = i; j < requests.size(); ++j) {
                outcomes_[j].status = TransferStatus::Cancelled;
                outcomes_[j].error_message = "not started";
            }
            break;
        }

        auto& outcome = outcomes_[i];
        const auto& info = resume[i];

        if (admission.running() >= admission.limit()) {
            logger_.log("All {} transfer slots busy, waiting", admission.limit());
        }
        admission.submit([this, &scope, &outcome, &info, &inbox] { runTransfer(scope, outcome, info, inbox); });
        logger_.log("Dispatched {} -> {}", outcome.request.url, outcome.request.destination);
    }

    logger_.log("Waiting for {} transfer tasks", admission.started());
    admission.waitAll();
}

void Orchestrator::runTransfer(const ExecutionScope& scope,
                               TransferOutcome& outcome,
                               const ResumeInfo& resume,
                               ByteCountSink& inbox) {
    const auto& request = outcome.request;
    if (scope.isStopped()) {
        outcome.status = TransferStatus::Cancelled;
        outcome.error_message = "not started";
        logger_.log("Transfer of {} not started: batch {}", request.url, toString(scope.reason()));
        return;
    }

    try {
        worker_->transfer(scope, request, resume, inbox);
        if (scope.isStopped()) {
            outcome.status = TransferStatus::Cancelled;
            logger_.log("Transfer of {} stopped: batch {}", request.url, toString(scope.reason()));
        } else {
            outcome.status = TransferStatus::Completed;
            logger_.log("Transfer of {} completed", request.url);
        }
    } catch (const ScopeError& e) {
        outcome.status = TransferStatus::Cancelled;
        outcome.error_message = e.what();
        logger_.log("Transfer of {} stopped: {}", request.url, e.what());
    } catch (const std::exception& e) {
        outcome.status = TransferStatus::Failed;
        outcome.error_message = e.what();
        logger_.log("Transfer of {} failed: {}", request.url, e.what());
    }
}

void Orchestrator::publishScope(std::shared_ptr<ExecutionScope> scope) {
    bool cancel_now = false;
    {
        std::lock_guard<std::mutex> lock(scope_mutex_);
        scope_ = scope;
        scope_retired_ = !scope_;
        cancel_now = scope_ && cancel_requested_;
    }
    if (cancel_now) {
        scope->cancel();
    }
}

void Orchestrator::closeTelemetry() {
    if (progress_) {
        progress_->close();
    }
    if (throughput_) {
        throughput_->close();
    }
}

void Orchestrator::throwIfFailed() const {
    const TransferOutcome* first_failure = nullptr;
    std::size_t failed = 0;
    for (const auto& outcome : outcomes_) {
        if (outcome.status == TransferStatus::Failed) {
            if (!first_failure) {
                first_failure = &outcome;
            }
            ++failed;
        }
    }

    if (first_failure) {
        throw TransferError(first_failure->request.url,
                            fmt::format("{} ({} of {} transfers failed)",
                                        first_failure->error_message,
                                        failed,
                                        outcomes_.size()));
    }
}

} // namespace batchdl
