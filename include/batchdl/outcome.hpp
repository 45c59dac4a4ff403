#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace batchdl {

enum class TransferStatus {
    Pending,
    Completed,
    Failed,
    Cancelled,
};

[[nodiscard]] std::string_view toString(TransferStatus status) noexcept;

struct TransferOutcome {
    DownloadRequest request;
    TransferStatus status{TransferStatus::Pending};
    std::int64_t expected_bytes{0};
    std::string error_message;
};

} // namespace batchdl
