/**
 * @file progress.cpp
 * @brief Progress aggregation implementation
 */

#include "dashcam_merge/progress.hpp"

#include <algorithm>

#include <fmt/core.h>

namespace dashcam_merge {

// **---- Metrics ----**

ProgressMetrics compute_metrics(const ProgressState &state,
                                ProgressClock::time_point now) {
  ProgressMetrics m;

  if (state.total_files > 0) {
    m.percentage = std::min(
        100.0, 100.0 * static_cast<double>(state.current_file) /
                   static_cast<double>(state.total_files));
    m.percentage = std::max(0.0, m.percentage);
  }

  m.elapsed_sec = std::chrono::duration<double>(now - state.start).count();
  if (m.elapsed_sec < 0)
    m.elapsed_sec = 0;

  if (m.elapsed_sec > 0)
    m.throughput_bps = static_cast<double>(state.processed_bytes) / m.elapsed_sec;

  if (m.percentage > 0)
    m.eta_sec = m.elapsed_sec * (100.0 - m.percentage) / m.percentage;

  return m;
}

// **---- ProgressAggregator ----**

ProgressAggregator::ProgressAggregator() {
  overall_.id = "overall";
  overall_.label = "Overall";
  overall_.start = ProgressClock::now();
}

void ProgressAggregator::register_group(const std::string &id, int total_files,
                                        std::uint64_t total_bytes,
                                        const std::string &label) {
  ProgressState state;
  state.id = id;
  state.label = label.empty() ? id : label;
  state.total_files = std::max(0, total_files);
  state.total_bytes = total_bytes;
  state.status = fmt::format("{}: waiting", state.label);
  state.start = ProgressClock::now();

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it != index_.end()) {
    groups_[it->second] = std::move(state);
  } else {
    index_.emplace(id, groups_.size());
    groups_.push_back(std::move(state));
  }
  recompute_overall_locked();
}

bool ProgressAggregator::update_group(const std::string &id, int current_file,
                                      const std::string &current_file_name,
                                      std::uint64_t processed_bytes,
                                      const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end())
    return false;

  ProgressState &state = groups_[it->second];
  state.current_file = std::max(0, current_file);
  state.current_file_name = current_file_name;
  state.processed_bytes = processed_bytes;
  state.status = status;
  recompute_overall_locked();
  return true;
}

void ProgressAggregator::recompute_overall_locked() {
  int total_files = 0;
  int current_files = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t processed_bytes = 0;
  int started = 0;

  for (const auto &g : groups_) {
    total_files += g.total_files;
    current_files += g.current_file;
    total_bytes += g.total_bytes;
    processed_bytes += g.processed_bytes;
    if (g.current_file > 0)
      ++started;
  }

  overall_.total_files = total_files;
  overall_.current_file = current_files;
  overall_.total_bytes = total_bytes;
  overall_.processed_bytes = processed_bytes;
  overall_.status =
      fmt::format("Processing ({}/{} groups)", started, groups_.size());
}

ProgressSnapshot ProgressAggregator::snapshot() const {
  return snapshot(ProgressClock::now());
}

ProgressSnapshot
ProgressAggregator::snapshot(ProgressClock::time_point now) const {
  ProgressSnapshot snap;
  snap.taken_at = now;

  std::lock_guard<std::mutex> lock(mutex_);
  snap.groups.reserve(groups_.size());
  for (const auto &g : groups_) {
    snap.groups.push_back({g, compute_metrics(g, now)});
    if (g.current_file > 0)
      ++snap.groups_started;
  }
  snap.overall = {overall_, compute_metrics(overall_, now)};
  return snap;
}

} // namespace dashcam_merge
