/**
 * @file batch_merger.hpp
 * @brief Concurrent merge of every group in a run
 *
 * @details The BatchMerger plans one MergeJob per group and runs them on
 *          worker threads:
 *
 *          - One worker per group, or at most max_parallel workers when a
 *            limit is set (0 = unbounded)
 *
 *          - Every group is registered with the ProgressAggregator before any
 *            job starts, so the display shows waiting groups too
 *
 *          - A failure in one job never stops another; results keep group
 *            order
 *
 *          - When the stop flag is raised, queued jobs are dropped and
 *            running jobs finish their current tool invocation
 */

#ifndef DASHCAM_MERGE_BATCH_MERGER_HPP
#define DASHCAM_MERGE_BATCH_MERGER_HPP

#include <atomic>
#include <string>
#include <vector>

#include "config.hpp"
#include "merge_executor.hpp"
#include "progress.hpp"
#include "types.hpp"

namespace dashcam_merge {

/**
 * @struct BatchSummary
 * @brief Aggregate outcome of a run.
 */
struct BatchSummary {
  std::vector<MergeResult> results; //< Group order
  int total = 0;                    //< Groups planned
  int succeeded = 0;                //< Success + PartialSalvage
  int salvaged = 0;
  int failed = 0;
  int skipped = 0;                  //< Dropped after an interrupt
  double wall_clock_sec = 0;
  bool interrupted = false;
};

/**
 * @class BatchMerger
 * @brief Orchestrates concurrent merge jobs.
 */
class BatchMerger {
public:
  /**
   * @param config Validated configuration (must outlive the merger)
   * @param progress Shared aggregator (must outlive the merger)
   * @param max_parallel Worker limit, 0 = one worker per group
   * @param stop Interrupt flag (may be nullptr)
   */
  BatchMerger(const MergerConfig &config, ProgressAggregator &progress,
              int max_parallel = 0, const std::atomic<bool> *stop = nullptr);

  /**
   * @brief Merge all groups and wait for every worker.
   */
  BatchSummary run(const std::vector<Group> &groups);

  /// Number of workers the last run() used.
  int workers_used() const { return workers_used_; }

  /**
   * @brief Print the final per-group table and batch totals.
   */
  void print_summary(const BatchSummary &summary) const;

private:
  const MergerConfig &config_;
  ProgressAggregator &progress_;
  int max_parallel_;
  const std::atomic<bool> *stop_;
  int workers_used_ = 0;

  bool stop_requested() const { return stop_ && stop_->load(); }
};

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_BATCH_MERGER_HPP
