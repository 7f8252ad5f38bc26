/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Defines log_mutex and the TimingCollector store.
 */

#include "dashcam_merge/logging.hpp"

#include <map>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

namespace dashcam_merge {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Merge attempts are labelled "<date> <camera> <tier>"
  std::map<std::string, std::pair<int, long>> per_tier;
  for (const auto &e : entries) {
    for (const char *tier : {"stream copy", "re-encode"}) {
      std::string suffix = std::string(" ") + tier;
      if (e.name.size() > suffix.size() &&
          e.name.compare(e.name.size() - suffix.size(), suffix.size(),
                         suffix) == 0) {
        per_tier[tier].first += 1;
        per_tier[tier].second += e.microseconds;
      }
    }
  }

  std::lock_guard<std::mutex> out_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan), "{:=^56}\n", " TIMING ");
  for (const auto &e : entries) {
    fmt::print("{:<40} {:>12.2f}s\n", e.name, e.microseconds / 1e6);
  }
  if (!per_tier.empty()) {
    fmt::print("{:-<56}\n", "");
    for (const auto &[tier, stats] : per_tier) {
      fmt::print("{:<40} {:>12.2f}s\n",
                 fmt::format("{} x{}", tier, stats.first),
                 stats.second / 1e6);
    }
  }
  fmt::print(fg(fmt::color::cyan), "{:=<56}\n", "");
  std::fflush(stdout);
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace dashcam_merge
