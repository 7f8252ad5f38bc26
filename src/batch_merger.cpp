/**
 * @file batch_merger.cpp
 * @brief Concurrent merge orchestration implementation
 */

#include "dashcam_merge/batch_merger.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "dashcam_merge/job_queue.hpp"
#include "dashcam_merge/logging.hpp"
#include "dashcam_merge/merge_planner.hpp"
#include "dashcam_merge/progress_reporter.hpp"
#include "dashcam_merge/system.hpp"

namespace dashcam_merge {

BatchMerger::BatchMerger(const MergerConfig &config,
                         ProgressAggregator &progress, int max_parallel,
                         const std::atomic<bool> *stop)
    : config_(config), progress_(progress),
      max_parallel_(std::max(0, max_parallel)), stop_(stop) {}

BatchSummary BatchMerger::run(const std::vector<Group> &groups) {
  BatchSummary summary;
  summary.total = static_cast<int>(groups.size());
  if (groups.empty()) {
    LOG_WARN("No groups to merge");
    return summary;
  }

  auto batch_start = std::chrono::high_resolution_clock::now();

  /// Plan and register every group up front
  JobQueue queue;
  for (size_t i = 0; i < groups.size(); ++i) {
    MergeJob job = plan_merge(groups[i], config_);
    progress_.register_group(
        job.id(), static_cast<int>(job.inputs.size()), job.total_bytes,
        fmt::format("{} {}", format_date(job.date), job.camera_name));
    queue.push(QueuedJob{i, std::move(job)});
  }
  queue.finish();

  int workers = max_parallel_ > 0
                    ? std::min(max_parallel_, summary.total)
                    : summary.total;
  workers_used_ = workers;

  /// Split the CPUs between concurrent re-encodes unless pinned in config
  MergerConfig effective = config_;
  if (effective.reencode.threads == 0 && workers > 1)
    effective.reencode.threads = threads_per_job(detect_cpu_limit(), workers);

  LOG_PHASE("==================== MERGE ====================");
  LOG_INFO("Groups to merge: {}", summary.total);
  LOG_INFO("Parallel jobs: {}{}", workers,
           max_parallel_ > 0 ? "" : " (one per group)");
  LOG_INFO("Local staging: {}",
           config_.use_local_processing ? config_.scratch_dir.string()
                                        : std::string("off"));
  if (effective.reencode.threads > 0)
    LOG_INFO("Re-encode threads per job: {}", effective.reencode.threads);
  LOG_PHASE("===============================================");

  MergeExecutor executor(effective, &progress_, stop_);
  ResultCollector collector(groups.size());
  std::atomic<int> skipped{0};

  auto worker = [&](int worker_id) {
    QueuedJob item;
    while (queue.pop(item)) {
      if (stop_requested()) {
        std::vector<QueuedJob> dropped = queue.cancel();
        dropped.insert(dropped.begin(), std::move(item));
        skipped += static_cast<int>(dropped.size());
        for (const auto &d : dropped) {
          progress_.update_group(
              d.job.id(), 0, "", 0,
              fmt::format("{} {}: interrupted before start",
                          format_date(d.job.date), d.job.camera_name));
        }
        break;
      }

      MergeResult result;
      try {
        result = executor.execute(item.job);
      } catch (const std::exception &e) {
        /// Nothing escapes a job boundary
        result.id = item.job.id();
        result.label = fmt::format("{} {}", format_date(item.job.date),
                                   item.job.camera_name);
        result.output = item.job.final_output;
        result.state = MergeState::Failed;
        result.transitions.push_back(MergeState::Failed);
        result.error = MergeError::TranscodeFailed;
        result.status = fmt::format("unexpected error: {}", e.what());
        LOG_ERROR("[Worker {}] {} {}", worker_id, item.job.tag(),
                  result.status);
        progress_.update_group(item.job.id(), 0, "", 0,
                               fmt::format("{}: failed", result.label));
      }
      collector.add(item.index, std::move(result));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(static_cast<size_t>(workers));
  for (int i = 0; i < workers; ++i)
    threads.emplace_back(worker, i);
  for (auto &t : threads)
    t.join();

  auto batch_end = std::chrono::high_resolution_clock::now();
  summary.wall_clock_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  summary.results = collector.extract();
  summary.skipped = skipped.load();
  summary.interrupted = stop_requested();
  for (const auto &r : summary.results) {
    if (r.success()) {
      ++summary.succeeded;
      if (r.salvaged())
        ++summary.salvaged;
    } else {
      ++summary.failed;
    }
  }
  return summary;
}

void BatchMerger::print_summary(const BatchSummary &summary) const {
  ProgressSnapshot snap = progress_.snapshot();

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= MERGE SUMMARY =================\n");

  for (const auto &g : snap.groups) {
    fmt::print("{:<28} {:>4} files ({:>8.1f}MB) time: {:>7} avg: {:.1f}MB/s\n",
               g.state.label, g.state.total_files,
               g.state.total_bytes / BYTES_PER_MB,
               format_duration(g.metrics.elapsed_sec),
               g.metrics.throughput_bps / BYTES_PER_MB);
  }
  fmt::print("{:-<49}\n", "");
  fmt::print("{:<25} {:>23}\n", "Total groups:", summary.total);
  fmt::print("{:<25} {:>23}\n", "Successful:", summary.succeeded);
  if (summary.salvaged > 0)
    fmt::print("{:<25} {:>23}\n", "  of which salvaged:", summary.salvaged);
  fmt::print("{:<25} {:>23}\n", "Failed:", summary.failed);
  if (summary.skipped > 0)
    fmt::print("{:<25} {:>23}\n", "Not started:", summary.skipped);
  fmt::print("{:<25} {:>23}\n", "Parallel jobs:", workers_used_);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", summary.wall_clock_sec);
  fmt::print("{:<25} {:>20.1f}MB\n", "Input size:",
             snap.overall.state.total_bytes / BYTES_PER_MB);
  fmt::print(fg(fmt::color::cyan),
             "=================================================\n");

  /// List failed groups if any
  if (summary.failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed groups:\n");
    for (const auto &r : summary.results) {
      if (!r.success()) {
        fmt::print(fg(fmt::color::red), "  - {}: {}\n", r.label, r.status);
      }
    }
  }
  fmt::print("\nMerge complete: {}/{} groups\n", summary.succeeded,
             summary.total);
  std::fflush(stdout);
}

} // namespace dashcam_merge
