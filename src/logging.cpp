#include "batchdl/logging.hpp"

#include <chrono>
#include <ctime>
#include <iostream>

namespace batchdl {

namespace {
std::mutex clog_mutex;
} // namespace

void defaultLogSink(const std::string& message) {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    std::lock_guard<std::mutex> lock(clog_mutex);
    std::clog << '[' << stamp << "] " << message << '\n';
}

void nullLogSink(const std::string&) {}

std::string formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

Logger::Logger(LogSink sink) : sink_(sink ? std::move(sink) : LogSink{&defaultLogSink}) {}

void Logger::write(const std::string& message) const {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(message);
}

} // namespace batchdl
