/**
 * @file ffmpeg_executor.hpp
 * @brief External media tool invocation
 *
 * @details Builds FFmpeg concat command lines for the two merge profiles and
 *          runs them as blocking child processes:
 *
 *          - stdin/stdout go to /dev/null
 *
 *          - stderr is captured (tail kept) for diagnostics only
 *
 *          - A missing binary is reported as ToolStatus::NotFound, distinct
 *            from a non-zero exit
 *
 * @note Safe to call from several merge workers at once. All pipes are
 *       created close-on-exec so concurrent children never inherit each
 *       other's descriptors.
 */

#ifndef DASHCAM_MERGE_FFMPEG_EXECUTOR_HPP
#define DASHCAM_MERGE_FFMPEG_EXECUTOR_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "merge_planner.hpp"

namespace dashcam_merge {

/// Bytes of stderr kept from a tool run.
constexpr size_t STDERR_TAIL_BYTES = 4096;

/**
 * @enum ToolStatus
 * @brief How a tool run ended.
 */
enum class ToolStatus {
  Exited,     //< Process ran and exited (see exit_code)
  Signaled,   //< Process was killed by a signal
  NotFound,   //< Binary missing or not executable
  SpawnFailed //< pipe/fork failure on our side
};

/**
 * @struct ToolResult
 * @brief Outcome of one tool run.
 */
struct ToolResult {
  ToolStatus status = ToolStatus::SpawnFailed;
  int exit_code = -1;      //< Valid when status == Exited
  int signal = 0;          //< Valid when status == Signaled
  std::string stderr_tail; //< Last STDERR_TAIL_BYTES of stderr

  bool ok() const { return status == ToolStatus::Exited && exit_code == 0; }

  /// One-line description, e.g. "exit code 1" or "killed by signal 2"
  std::string describe() const;
};

/**
 * @brief Resolve an executable the way execvp would.
 * @param name Bare name (searched in PATH) or a path containing '/'
 * @return Absolute or given path if executable, std::nullopt otherwise
 */
std::optional<std::filesystem::path> find_executable(const std::string &name);

/**
 * @brief Build the FFmpeg argument vector (argv[0] excluded) for a profile.
 *
 * @param job Planned merge job (manifest_path, work_output)
 * @param profile Copy or Reencode
 * @param config Codec parameters
 * @return Arguments in order
 */
std::vector<std::string> build_merge_args(const MergeJob &job,
                                          TranscodeProfile profile,
                                          const MergerConfig &config);

/**
 * @brief Run a tool and wait for it.
 *
 * @param tool Executable name or path
 * @param args Arguments (argv[0] excluded)
 * @return ToolResult; never throws
 */
ToolResult run_tool(const std::string &tool,
                    const std::vector<std::string> &args);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_FFMPEG_EXECUTOR_HPP
