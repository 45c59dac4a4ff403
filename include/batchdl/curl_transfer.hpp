#pragma once

#include "collaborators.hpp"

#include <chrono>
#include <string>

namespace batchdl {

struct CurlOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
    bool follow_redirects{true};
    std::string user_agent{"batchdl/1.0"};
};

// HEAD request: Content-Length (-1 when the server omits it) and
// "Accept-Ranges: bytes" support.
class CurlSizeProber final : public SizeProber {
public:
    explicit CurlSizeProber(CurlOptions options = {});

    [[nodiscard]] ResumeInfo probe(const std::string& url) override;

private:
    CurlOptions options_;
};

// GET into the destination file, resuming a partial file with a range
// request when the server allows it.
class CurlTransferWorker final : public TransferWorker {
public:
    explicit CurlTransferWorker(CurlOptions options = {});

    void transfer(const ExecutionScope& scope,
                  const DownloadRequest& request,
                  const ResumeInfo& resume,
                  ByteCountSink& sink) override;

private:
    CurlOptions options_;
};

} // namespace batchdl
