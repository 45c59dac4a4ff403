#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace batchdl {

enum class StopReason {
    None,
    Cancelled,
    TimedOut,
};

[[nodiscard]] std::string_view toString(StopReason reason) noexcept;

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigurationError : public Error {
public:
    using Error::Error;
};

class InvalidStateError : public Error {
public:
    using Error::Error;
};

class ProbeError : public Error {
public:
    ProbeError(std::string url, const std::string& reason);

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
};

class TransferError : public Error {
public:
    TransferError(std::string url, const std::string& reason);

    [[nodiscard]] const std::string& url() const noexcept { return url_; }

private:
    std::string url_;
};

class ScopeError : public Error {
public:
    explicit ScopeError(StopReason reason);

    [[nodiscard]] StopReason reason() const noexcept { return reason_; }

private:
    StopReason reason_;
};

} // namespace batchdl
