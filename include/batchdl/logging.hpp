#pragma once

#include "config.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

// Writes "[YYYY-mm-dd HH:MM:SS] message" to std::clog.
void defaultLogSink(const std::string& message);

// Sink that drops every message.
void nullLogSink(const std::string& message);

[[nodiscard]] std::string formatSize(std::uint64_t bytes);

// Serializes a sink shared by the control, task and aggregator threads.
class Logger {
public:
    explicit Logger(LogSink sink = {});

    template <typename... Args>
    void log(fmt::format_string<Args...> format, Args&&... args) const {
        write(fmt::format(format, std::forward<Args>(args)...));
    }

    void write(const std::string& message) const;

private:
    LogSink sink_;
    mutable std::mutex mutex_;
};

} // namespace batchdl
