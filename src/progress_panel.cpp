#include "batchdl/progress_panel.hpp"

#include "batchdl/logging.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

#include <fmt/format.h>

namespace batchdl {

ProgressPanel::ProgressPanel(std::string title,
                             std::shared_ptr<ProgressChannel> progress,
                             std::shared_ptr<ThroughputChannel> throughput,
                             std::ostream& out)
    : title_(std::move(title)),
      progress_(std::move(progress)),
      throughput_(std::move(throughput)),
      out_(out) {}

ProgressPanel::~ProgressPanel() { wait(); }

void ProgressPanel::start() {
    if (!progress_ || thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this] { renderLoop(); });
}

void ProgressPanel::wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ProgressPanel::renderLoop() {
    double fraction = 0.0;
    std::int64_t bytes_per_second = 0;

    redrawPanel(buildPanel(title_, fraction, bytes_per_second, false));
    while (auto sample = progress_->pop()) {
        fraction = *sample;
        // Throughput is published just before progress on every tick.
        if (throughput_) {
            while (auto rate = throughput_->tryPop()) {
                bytes_per_second = *rate;
            }
        }
        redrawPanel(buildPanel(title_, fraction, bytes_per_second, false));
    }
    redrawPanel(buildPanel(title_, fraction, bytes_per_second, true));
    out_ << std::flush;
}

std::string ProgressPanel::buildPanel(const std::string& title,
                                      double fraction,
                                      std::int64_t bytes_per_second,
                                      bool finished) {
    constexpr int bar_width = 30;
    fraction = std::clamp(fraction, 0.0, 1.0);

    std::string panel;
    panel.reserve(512);
    panel.append("==================================================\n");
    panel += fmt::format("{}\n", title);
    panel.append("--------------------------------------------------\n");
    panel += fmt::format("[{}] {:>3}%  {}/s",
                         formatBar(fraction, bar_width),
                         static_cast<int>(fraction * 100.0),
                         formatSize(static_cast<std::uint64_t>(std::max<std::int64_t>(0, bytes_per_second))));
    if (finished) {
        panel.append(fraction >= 1.0 ? "  Done" : "  Stopped");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ProgressPanel::formatBar(double fraction, int width) {
    const int bar_pos = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * width);

    std::string bar;
    bar.reserve(static_cast<std::size_t>(width) * 3);
    for (int i = 0; i < width; ++i) {
        bar += (i < bar_pos) ? "█" : "░";
    }
    return bar;
}

void ProgressPanel::redrawPanel(const std::string& panel) {
    const std::size_t current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

} // namespace batchdl
