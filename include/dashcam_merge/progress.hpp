/**
 * @file progress.hpp
 * @brief Thread-safe progress aggregation across concurrent merge jobs
 *
 * @details The ProgressAggregator is the only mutable state shared between
 *          merge workers. It is owned by the batch driver and handed to each
 *          worker by reference.
 *
 * @attention CONSISTENCY:
 *
 *   - Every mutation and the overall recomputation happen under one mutex
 *
 *   - snapshot() copies group and overall state under the same mutex, so a
 *     reader never sees group totals that the overall totals do not reflect
 *
 *   - Derived metrics (percentage, ETA, throughput) are computed on read
 */

#ifndef DASHCAM_MERGE_PROGRESS_HPP
#define DASHCAM_MERGE_PROGRESS_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dashcam_merge {

using ProgressClock = std::chrono::steady_clock;

/**
 * @struct ProgressState
 * @brief Raw progress of one group (or the overall sum).
 */
struct ProgressState {
  std::string id;                    //< Group id ("<date>_<camera>")
  std::string label;                 //< Display label
  int current_file = 0;              //< Files done / current index
  int total_files = 0;
  std::string current_file_name;
  std::uint64_t processed_bytes = 0;
  std::uint64_t total_bytes = 0;
  std::string status;
  ProgressClock::time_point start;
};

/**
 * @struct ProgressMetrics
 * @brief Values derived from a ProgressState at a given instant.
 */
struct ProgressMetrics {
  double percentage = 0;     //< 0..100, by file count
  double elapsed_sec = 0;
  double eta_sec = 0;
  double throughput_bps = 0; //< Processed bytes per second
};

/**
 * @brief Derive metrics. Never divides by zero:
 *
 *   - total_files == 0  -> percentage 0
 *
 *   - elapsed == 0      -> throughput 0 (and ETA 0)
 *
 *   - percentage == 0   -> ETA 0
 */
ProgressMetrics compute_metrics(const ProgressState &state,
                                ProgressClock::time_point now);

/**
 * @struct GroupProgress
 * @brief State plus metrics as captured by a snapshot.
 */
struct GroupProgress {
  ProgressState state;
  ProgressMetrics metrics;
};

/**
 * @struct ProgressSnapshot
 * @brief Consistent copy of all progress at one instant.
 */
struct ProgressSnapshot {
  std::vector<GroupProgress> groups; //< Registration order
  GroupProgress overall;
  int groups_started = 0;            //< Groups with current_file > 0
  ProgressClock::time_point taken_at;
};

/**
 * @class ProgressAggregator
 * @brief Lock-protected per-group progress with an always-consistent sum.
 */
class ProgressAggregator {
public:
  ProgressAggregator();

  ProgressAggregator(const ProgressAggregator &) = delete;
  ProgressAggregator &operator=(const ProgressAggregator &) = delete;

  /**
   * @brief Start tracking a group. Re-registering an id resets it.
   * @param id Group id
   * @param total_files Number of clips in the group
   * @param total_bytes Sum of clip sizes
   * @param label Display label (defaults to id)
   */
  void register_group(const std::string &id, int total_files,
                      std::uint64_t total_bytes,
                      const std::string &label = "");

  /**
   * @brief Update a group's progress.
   * @return false if the id was never registered (update ignored)
   */
  bool update_group(const std::string &id, int current_file,
                    const std::string &current_file_name,
                    std::uint64_t processed_bytes, const std::string &status);

  /// Snapshot with metrics computed now.
  ProgressSnapshot snapshot() const;

  /// Snapshot with metrics computed at a given instant.
  ProgressSnapshot snapshot(ProgressClock::time_point now) const;

private:
  mutable std::mutex mutex_;
  std::vector<ProgressState> groups_;   //< Registration order
  std::map<std::string, size_t> index_; //< id -> position in groups_
  ProgressState overall_;

  /// Caller must hold mutex_.
  void recompute_overall_locked();
};

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_PROGRESS_HPP
