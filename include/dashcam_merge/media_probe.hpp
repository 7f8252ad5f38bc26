/**
 * @file media_probe.hpp
 * @brief Container duration probing through libavformat
 *
 * @details Used only for the per-group info display; merging never depends
 *          on probe results.
 */

#ifndef DASHCAM_MERGE_MEDIA_PROBE_HPP
#define DASHCAM_MERGE_MEDIA_PROBE_HPP

#include <filesystem>
#include <optional>

namespace dashcam_merge {

/**
 * @brief Read the container duration of a media file.
 * @param path File to probe
 * @return Duration in seconds, or std::nullopt if the file cannot be opened,
 *         has no stream info, or reports no duration.
 */
std::optional<double> probe_duration(const std::filesystem::path &path);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_MEDIA_PROBE_HPP
