#pragma once

#include "progress_aggregator.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <thread>

namespace batchdl {

// Renders the telemetry streams of a running batch as a panel redrawn in
// place. The panel thread exits once the progress channel is closed.
class ProgressPanel {
public:
    ProgressPanel(std::string title,
                  std::shared_ptr<ProgressChannel> progress,
                  std::shared_ptr<ThroughputChannel> throughput,
                  std::ostream& out);
    ~ProgressPanel();

    ProgressPanel(const ProgressPanel&) = delete;
    ProgressPanel& operator=(const ProgressPanel&) = delete;

    void start();
    void wait();

    [[nodiscard]] static std::string buildPanel(const std::string& title,
                                                double fraction,
                                                std::int64_t bytes_per_second,
                                                bool finished);
    [[nodiscard]] static std::string formatBar(double fraction, int width);

private:
    void renderLoop();
    void redrawPanel(const std::string& panel);

    std::string title_;
    std::shared_ptr<ProgressChannel> progress_;
    std::shared_ptr<ThroughputChannel> throughput_;
    std::ostream& out_;
    std::thread thread_;
    std::size_t previous_lines_{0};
};

} // namespace batchdl
