/**
 * @file merge_executor.hpp
 * @brief Two-tier merge protocol for one group
 *
 * @details Each job runs as an explicit state machine:
 *
 *          Planned -> CopyAttempt -> { Success | ReencodeAttempt }
 *
 *          ReencodeAttempt -> { Success | PartialSalvage | Failed }
 *
 *          - A missing tool ends the job at once (ToolNotFound)
 *
 *          - A non-zero copy exit escalates exactly once to re-encode
 *
 *          - A non-zero re-encode exit that still left a non-empty output is
 *            accepted as PartialSalvage
 *
 *          - The tool always writes to the job's work path; only a Success
 *            or PartialSalvage output is moved onto the final name, so a
 *            failed rerun never touches an earlier merge
 *
 *          - A failed move downgrades Success or PartialSalvage to Failed
 *            (RelocationFailed); the work file is kept for manual recovery
 *
 *          - The manifest is always removed; removal errors are ignored
 *
 * @note The executor holds no per-job state, so one instance may run many
 *       jobs from many threads at once.
 */

#ifndef DASHCAM_MERGE_MERGE_EXECUTOR_HPP
#define DASHCAM_MERGE_MERGE_EXECUTOR_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "ffmpeg_executor.hpp"
#include "merge_planner.hpp"
#include "progress.hpp"

namespace dashcam_merge {

/**
 * @enum MergeState
 * @brief States of the per-job merge state machine.
 */
enum class MergeState {
  Planned,
  CopyAttempt,
  ReencodeAttempt,
  Success,
  PartialSalvage,
  Failed
};

/**
 * @enum MergeError
 * @brief Why a job ended in Failed (None otherwise).
 */
enum class MergeError {
  None,
  ToolNotFound,     //< Media tool missing; no attempt ran
  TranscodeFailed,  //< Re-encode failed and left no usable output
  RelocationFailed, //< Transcode succeeded, move to destination failed
  ManifestFailed,   //< Manifest could not be written
  Interrupted       //< Run interrupted before escalation
};

const char *to_string(MergeState state);
const char *to_string(MergeError error);

/**
 * @struct MergeResult
 * @brief Outcome of one job.
 */
struct MergeResult {
  std::string id;                      //< Group id
  std::string label;                   //< "<date> <camera name>"
  MergeState state = MergeState::Planned;
  MergeError error = MergeError::None;
  std::vector<MergeState> transitions; //< Every state entered, in order
  TranscodeProfile profile = TranscodeProfile::Copy; //< Last tier attempted
  std::string status;                  //< Human-readable outcome
  std::string stderr_tail;             //< Tool diagnostics of the last failure
  std::filesystem::path output;        //< Final output path
  std::uintmax_t output_bytes = 0;
  int file_count = 0;
  std::uintmax_t input_bytes = 0;
  double elapsed_sec = 0;

  bool success() const {
    return state == MergeState::Success || state == MergeState::PartialSalvage;
  }
  bool salvaged() const { return state == MergeState::PartialSalvage; }
};

/**
 * @class MergeExecutor
 * @brief Runs MergeJobs through the two-tier protocol.
 */
class MergeExecutor {
public:
  /**
   * @param config Tool path and codec profiles (must outlive the executor)
   * @param progress Aggregator to report checkpoints to (may be nullptr)
   * @param stop Set when the run is interrupted (may be nullptr)
   */
  explicit MergeExecutor(const MergerConfig &config,
                         ProgressAggregator *progress = nullptr,
                         const std::atomic<bool> *stop = nullptr);

  /**
   * @brief Merge one group. Never throws for per-job failures.
   */
  MergeResult execute(const MergeJob &job) const;

private:
  const MergerConfig &config_;
  ProgressAggregator *progress_;
  const std::atomic<bool> *stop_;

  ToolResult attempt(const MergeJob &job, TranscodeProfile profile) const;
  bool relocate(const MergeJob &job, std::string &error) const;
  void cleanup(const MergeJob &job, bool keep_work_output) const;
  void report(const MergeJob &job, int file_index, const std::string &file,
              std::uint64_t bytes, const std::string &status) const;
  bool stop_requested() const { return stop_ && stop_->load(); }
};

/**
 * @brief Size of a file, or 0 if it does not exist or cannot be read.
 */
std::uintmax_t file_size_or_zero(const std::filesystem::path &path);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_MERGE_EXECUTOR_HPP
