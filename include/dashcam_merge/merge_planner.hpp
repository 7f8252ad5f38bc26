/**
 * @file merge_planner.hpp
 * @brief Group -> MergeJob planning
 *
 * @details Decides output naming and where the manifest and the transcode
 *          output live:
 *
 *          - Local staging on: manifest and work output in the scratch
 *            directory, final output relocated after success
 *
 *          - Local staging off: manifest and work output in the output
 *            directory, the work output being a hidden ".part" sibling that
 *            is renamed onto the final name only after a usable transcode
 *
 * @note Names are keyed only by (date, camera), so reruns overwrite and no
 *       two jobs of one run ever share a path.
 */

#ifndef DASHCAM_MERGE_MERGE_PLANNER_HPP
#define DASHCAM_MERGE_MERGE_PLANNER_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace dashcam_merge {

/**
 * @enum TranscodeProfile
 * @brief Which tool parameters a merge attempt uses.
 */
enum class TranscodeProfile { Copy, Reencode };

const char *to_string(TranscodeProfile profile);

/**
 * @struct MergeJob
 * @brief Everything the executor needs for one group. Consumed once.
 */
struct MergeJob {
  std::string date;                          //< YYYYMMDD
  std::string camera;                        //< Camera tag
  std::string camera_name;                   //< Display name
  std::vector<std::filesystem::path> inputs; //< Ordered clip paths
  std::vector<std::uintmax_t> input_sizes;   //< Parallel to inputs
  std::uintmax_t total_bytes = 0;
  std::filesystem::path manifest_path;       //< filelist_<date>_<cam>.txt
  std::filesystem::path work_output;         //< Where the tool writes
  std::filesystem::path final_output;        //< merged_<Y-M-D>_<cam>.<ext>
  bool staged = false;                       //< Work files in scratch_dir
  TranscodeProfile profile = TranscodeProfile::Copy;

  /// Same id as Group::id()
  std::string id() const { return date + "_" + camera; }

  /// Log prefix, e.g. "[2025-09-06 F]"
  std::string tag() const;
};

/// "merged_2025-09-06_F.mp4"
std::string output_filename(const std::string &date, const std::string &camera,
                            const std::string &extension);

/// "merged_2025-09-06_F.mp4" -> ".merged_2025-09-06_F.mp4.part"
std::string work_filename(const std::string &output_name);

/// "filelist_20250906_F.txt"
std::string manifest_filename(const std::string &date,
                              const std::string &camera);

/**
 * @brief Plan the merge of one group. Pure; touches no files.
 */
MergeJob plan_merge(const Group &group, const MergerConfig &config);

/**
 * @brief Concat-demuxer manifest text: one "file '<abs path>'" per line,
 *        embedded single quotes escaped as '\''.
 */
std::string render_manifest(const std::vector<std::filesystem::path> &inputs);

/**
 * @brief Write the job's manifest, creating its directory if needed.
 * @return true on success
 */
bool write_manifest(const MergeJob &job, std::string &error);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_MERGE_PLANNER_HPP
