/**
 * @file job_queue.hpp
 * @brief Thread-safe merge job queue and result collection
 *
 * @details Provides:
 *          - JobQueue: shared queue the merge workers pull from
 *
 *          - ResultCollector: thread-safe, position-indexed result store
 */

#ifndef DASHCAM_MERGE_JOB_QUEUE_HPP
#define DASHCAM_MERGE_JOB_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "merge_executor.hpp"
#include "merge_planner.hpp"

namespace dashcam_merge {

/**
 * @struct QueuedJob
 * @brief A job plus its position in the run, so results keep group order.
 */
struct QueuedJob {
  size_t index;
  MergeJob job;
};

/**
 * @class JobQueue
 * @brief Blocking multi-consumer queue of merge jobs.
 *
 * @attention USAGE:
 *
 *   - Driver pushes every job, then calls finish()
 *
 *   - Workers call pop() until it returns false
 *
 *   - cancel() drops queued jobs and wakes all workers
 */
class JobQueue {
public:
  /// Add a job; notifies one waiting worker.
  void push(QueuedJob job);

  /**
   * @brief Pop a job (blocking).
   * @param job Output parameter for the job
   * @return true if a job was retrieved, false if finished or cancelled
   */
  bool pop(QueuedJob &job);

  /// Signal that no more jobs will be added.
  void finish();

  /**
   * @brief Discard queued jobs and release waiting workers.
   * @return The discarded jobs, in queue order
   */
  std::vector<QueuedJob> cancel();

  size_t size() const;

private:
  std::queue<QueuedJob> jobs_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> done_{false};
};

/**
 * @class ResultCollector
 * @brief Thread-safe store of merge results by job position.
 */
class ResultCollector {
public:
  explicit ResultCollector(size_t n);

  void add(size_t index, MergeResult &&result);

  /**
   * @brief Extract all collected results in position order.
   * @attention Slots never filled (cancelled jobs) are skipped.
   */
  std::vector<MergeResult> extract();

private:
  std::vector<std::optional<MergeResult>> results_;
  std::mutex mutex_;
};

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_JOB_QUEUE_HPP
