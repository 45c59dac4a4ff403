#include "batchdl/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace batchdl {

std::string_view toString(StopReason reason) noexcept {
    switch (reason) {
    case StopReason::None:
        return "none";
    case StopReason::Cancelled:
        return "cancelled";
    case StopReason::TimedOut:
        return "timed out";
    }
    return "unknown";
}

ProbeError::ProbeError(std::string url, const std::string& reason)
    : Error(fmt::format("cannot probe {}: {}", url, reason)), url_(std::move(url)) {}

TransferError::TransferError(std::string url, const std::string& reason)
    : Error(fmt::format("transfer of {} failed: {}", url, reason)), url_(std::move(url)) {}

ScopeError::ScopeError(StopReason reason)
    : Error(fmt::format("batch {}", toString(reason))), reason_(reason) {}

} // namespace batchdl
