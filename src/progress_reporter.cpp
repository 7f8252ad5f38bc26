/**
 * @file progress_reporter.cpp
 * @brief Progress rendering loop implementation
 */

#include "dashcam_merge/progress_reporter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <fmt/color.h>
#include <fmt/core.h>

#include "dashcam_merge/logging.hpp"
#include "dashcam_merge/types.hpp"

namespace dashcam_merge {

// **---- Formatting ----**

ProgressStyle parse_progress_style(const std::string &name) {
  return name == "bar" ? ProgressStyle::Bar : ProgressStyle::Simple;
}

std::string format_duration(double seconds) {
  if (!(seconds > 0))
    seconds = 0;
  long s = static_cast<long>(std::lround(seconds));
  if (s < 60)
    return fmt::format("{}s", s);
  if (s < 3600)
    return fmt::format("{}m{}s", s / 60, s % 60);
  return fmt::format("{}h{}m", s / 3600, (s % 3600) / 60);
}

std::string render_bar(double percentage, int width) {
  percentage = std::clamp(percentage, 0.0, 100.0);
  int filled = static_cast<int>(width * percentage / 100.0);
  std::string bar;
  bar.reserve(static_cast<size_t>(width) * 3);
  for (int i = 0; i < width; ++i)
    bar += (i < filled) ? "█" : "░";
  return bar;
}

std::string render_simple(const ProgressSnapshot &snap) {
  std::string line;
  for (const auto &g : snap.groups) {
    line += fmt::format("{}: {:.1f}% ({}/{}) | ", g.state.label,
                        g.metrics.percentage, g.state.current_file,
                        g.state.total_files);
  }
  line += fmt::format("Overall: {:.1f}% ({}/{})", snap.overall.metrics.percentage,
                      snap.overall.state.current_file,
                      snap.overall.state.total_files);
  return line;
}

std::string render_boxes(const ProgressSnapshot &snap) {
  std::string out = "\033[2J\033[H";
  out += "=== Dashcam Merge - Progress ===\n\n";

  for (const auto &g : snap.groups) {
    const ProgressState &s = g.state;
    const ProgressMetrics &m = g.metrics;
    out += fmt::format("┌─ {}\n", s.status);
    out += fmt::format("│ [{}] {:5.1f}%\n", render_bar(m.percentage),
                       m.percentage);
    out += fmt::format("│ Files: {}/{} | Size: {:.1f}/{:.1f}MB\n",
                       s.current_file, s.total_files,
                       s.processed_bytes / BYTES_PER_MB,
                       s.total_bytes / BYTES_PER_MB);
    if (s.current_file > 0) {
      out += fmt::format("│ Remaining: {} | Speed: {:.1f}MB/s\n",
                         format_duration(m.eta_sec),
                         m.throughput_bps / BYTES_PER_MB);
    }
    if (!s.current_file_name.empty())
      out += fmt::format("│ Current: {}\n", s.current_file_name);
    out += "└";
    for (int i = 0; i < 48; ++i)
      out += "─";
    out += "\n\n";
  }

  const ProgressState &o = snap.overall.state;
  const ProgressMetrics &om = snap.overall.metrics;
  out += std::string(50, '=') + "\n";
  out += fmt::format("Overall: [{}] {:5.1f}%\n", render_bar(om.percentage),
                     om.percentage);
  out += fmt::format("Files: {}/{} | Size: {:.1f}/{:.1f}MB | {}\n",
                     o.current_file, o.total_files,
                     o.processed_bytes / BYTES_PER_MB,
                     o.total_bytes / BYTES_PER_MB, o.status);
  if (o.current_file > 0) {
    out += fmt::format("Elapsed: {} | Remaining: {} | Avg speed: {:.1f}MB/s\n",
                       format_duration(om.elapsed_sec),
                       format_duration(om.eta_sec),
                       om.throughput_bps / BYTES_PER_MB);
  }
  return out;
}

// **---- ProgressReporter ----**

ProgressReporter::ProgressReporter(const ProgressAggregator &aggregator,
                                   std::chrono::milliseconds interval,
                                   Sink sink)
    : aggregator_(aggregator), interval_(interval), sink_(std::move(sink)) {
  if (interval_.count() <= 0)
    interval_ = std::chrono::milliseconds(500);
}

ProgressReporter::ProgressReporter(const ProgressAggregator &aggregator,
                                   std::chrono::milliseconds interval,
                                   ProgressStyle style)
    : ProgressReporter(aggregator, interval,
                       [style](const ProgressSnapshot &snap) {
                         std::lock_guard<std::mutex> lock(log_mutex);
                         if (style == ProgressStyle::Bar) {
                           fmt::print("{}", render_boxes(snap));
                         } else {
                           fmt::print("\r\033[K{}", render_simple(snap));
                         }
                         std::fflush(stdout);
                       }) {}

ProgressReporter::~ProgressReporter() { stop(); }

void ProgressReporter::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (thread_.joinable())
    return;
  stop_requested_ = false;
  thread_ = std::thread(&ProgressReporter::loop, this);
}

void ProgressReporter::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!thread_.joinable())
      return;
    stop_requested_ = true;
  }
  cv_.notify_all();
  thread_.join();
  render_once();
}

bool ProgressReporter::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return thread_.joinable() && !stop_requested_;
}

long ProgressReporter::frames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_;
}

void ProgressReporter::render_once() {
  ProgressSnapshot snap = aggregator_.snapshot();
  if (sink_)
    sink_(snap);
  std::lock_guard<std::mutex> lock(mutex_);
  ++frames_;
}

void ProgressReporter::loop() {
  for (;;) {
    render_once();

    std::unique_lock<std::mutex> lock(mutex_);
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; }))
      return;
  }
}

} // namespace dashcam_merge
