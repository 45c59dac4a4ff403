#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace batchdl {

using LogSink = std::function<void(const std::string&)>;

struct Config {
    int max_concurrent_transfers{3};
    // Accepted for compatibility, no retry is performed.
    int max_retry{0};
    std::chrono::milliseconds timeout{std::chrono::minutes(60)};
    bool detailed_progress{false};
    std::chrono::milliseconds progress_interval{std::chrono::seconds(1)};
    std::size_t telemetry_capacity{10};
    bool fail_on_transfer_error{false};
    LogSink log_sink{};
};

struct DownloadRequest {
    std::string url;
    std::string destination;
};

struct ResumeInfo {
    bool resumable{false};
    std::int64_t content_length{0};
};

} // namespace batchdl
