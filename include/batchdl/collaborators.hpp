#pragma once

#include "channel.hpp"
#include "config.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace batchdl {

class ExecutionScope;

// Incremental (not cumulative) byte counts, fed by every running transfer.
using ByteCountSink = Channel<std::int64_t>;

class SizeProber {
public:
    virtual ~SizeProber() = default;

    // Throws ProbeError when the size cannot be determined.
    [[nodiscard]] virtual ResumeInfo probe(const std::string& url) = 0;
};

class TransferWorker {
public:
    virtual ~TransferWorker() = default;

    // Returns normally on success and when stopped by the scope; throws
    // TransferError on failure. Partially written files are left in place.
    virtual void transfer(const ExecutionScope& scope,
                          const DownloadRequest& request,
                          const ResumeInfo& resume,
                          ByteCountSink& sink) = 0;
};

using SizeProberPtr = std::shared_ptr<SizeProber>;
using TransferWorkerPtr = std::shared_ptr<TransferWorker>;

} // namespace batchdl
