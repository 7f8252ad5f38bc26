/**
 * @file catalog.hpp
 * @brief Clip discovery and grouping
 *
 * @details The CatalogBuilder walks each configured camera directory and
 *          produces date -> camera -> time-ordered clips:
 *
 *          - Missing camera directories are warned about and skipped
 *
 *          - Files that do not match the pattern are skipped
 *
 *          - Files whose camera tag disagrees with their directory are
 *            excluded (misfiled or renamed clips)
 *
 *          - Each list is sorted by (time, sequence) as text
 */

#ifndef DASHCAM_MERGE_CATALOG_HPP
#define DASHCAM_MERGE_CATALOG_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "filename_parser.hpp"
#include "types.hpp"

namespace dashcam_merge {

/**
 * @struct CatalogStats
 * @brief Counters from the last build, for the startup report.
 */
struct CatalogStats {
  int cameras_scanned = 0;
  int cameras_missing = 0;
  int clips_accepted = 0;
  int names_unmatched = 0;  //< NoMatch
  int camera_mismatch = 0;  //< Tag disagrees with directory
};

/**
 * @class CatalogBuilder
 * @brief Builds a Catalog from the configured camera paths.
 */
class CatalogBuilder {
public:
  /**
   * @param parser Filename parser (must outlive the builder)
   * @param input_extension Extension including the dot, e.g. ".MP4"
   */
  CatalogBuilder(const FilenameParser &parser, std::string input_extension);

  /**
   * @brief Scan every camera directory and group the clips.
   * @param camera_paths camera tag -> directory
   * @return date -> camera -> ordered clips; empty groups never appear
   */
  Catalog build(const std::map<std::string, std::filesystem::path> &camera_paths);

  const CatalogStats &stats() const { return stats_; }

private:
  const FilenameParser &parser_;
  std::string input_extension_;
  CatalogStats stats_;

  void scan_camera(const std::string &camera,
                   const std::filesystem::path &dir, Catalog &catalog);
};

/**
 * @brief Restrict a catalog to one date (exact string match).
 * @return Catalog holding only that date, or an empty catalog.
 */
Catalog filter_by_date(const Catalog &catalog, const std::string &date);

/**
 * @brief Flatten a catalog into groups ordered by (date, camera).
 */
std::vector<Group> flatten(const Catalog &catalog);

/**
 * @struct GroupInfo
 * @brief Summary shown before merging a group.
 */
struct GroupInfo {
  std::string start_time;     //< HH:MM:SS of the first clip
  std::string end_time;       //< HH:MM:SS of the last clip
  size_t file_count = 0;
  double total_size_mb = 0;
  double duration_sec = 0;    //< Sum of probed durations
  int unprobed = 0;           //< Clips whose duration could not be read
  bool interrupted = false;   //< Probing stopped early by the stop flag
};

/**
 * @brief Describe a group for the info display.
 * @param probe When true, read each clip's container duration.
 * @param stop Checked before each probe; clips left unprobed once it is set
 *        count as unprobed (may be nullptr)
 */
GroupInfo describe_group(const Group &group, bool probe,
                         const std::atomic<bool> *stop = nullptr);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_CATALOG_HPP
