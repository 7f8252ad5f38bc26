/**
 * @file catalog.cpp
 * @brief Clip discovery and grouping implementation
 */

#include "dashcam_merge/catalog.hpp"

#include <algorithm>
#include <system_error>

#include "dashcam_merge/logging.hpp"
#include "dashcam_merge/media_probe.hpp"

namespace dashcam_merge {

namespace fs = std::filesystem;

CatalogBuilder::CatalogBuilder(const FilenameParser &parser,
                               std::string input_extension)
    : parser_(parser), input_extension_(std::move(input_extension)) {}

Catalog CatalogBuilder::build(
    const std::map<std::string, fs::path> &camera_paths) {
  stats_ = CatalogStats{};
  Catalog catalog;

  for (const auto &[camera, dir] : camera_paths) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      LOG_WARN("Camera {} path not found: {}", camera, dir.string());
      ++stats_.cameras_missing;
      continue;
    }
    ++stats_.cameras_scanned;
    scan_camera(camera, dir, catalog);
  }

  /// Order every group by (time, sequence)
  for (auto &[date, cameras] : catalog) {
    for (auto &[camera, clips] : cameras) {
      std::sort(clips.begin(), clips.end(), clip_order);
    }
  }

  return catalog;
}

void CatalogBuilder::scan_camera(const std::string &camera, const fs::path &dir,
                                 Catalog &catalog) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    LOG_WARN("Camera {} directory unreadable: {} ({})", camera, dir.string(),
             ec.message());
    return;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOG_WARN("Camera {} directory scan stopped: {}", camera, ec.message());
      break;
    }

    const fs::directory_entry &entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec))
      continue;
    if (entry.path().extension().string() != input_extension_)
      continue;

    std::string name = entry.path().filename().string();
    auto parsed = parser_.parse(name);
    if (!parsed) {
      ++stats_.names_unmatched;
      continue;
    }

    /// Clip filed under the wrong camera directory
    if (parsed->camera != camera) {
      ++stats_.camera_mismatch;
      continue;
    }

    std::error_code size_ec;
    std::uintmax_t size = entry.file_size(size_ec);
    if (size_ec)
      size = 0;

    fs::path abs = fs::absolute(entry.path(), size_ec);
    if (size_ec)
      abs = entry.path();

    catalog[parsed->date][camera].push_back(Clip{abs, parsed->date,
                                                 parsed->time, parsed->sequence,
                                                 camera, size});
    ++stats_.clips_accepted;
  }
}

Catalog filter_by_date(const Catalog &catalog, const std::string &date) {
  Catalog filtered;
  auto it = catalog.find(date);
  if (it != catalog.end())
    filtered.emplace(it->first, it->second);
  return filtered;
}

std::vector<Group> flatten(const Catalog &catalog) {
  std::vector<Group> groups;
  for (const auto &[date, cameras] : catalog) {
    for (const auto &[camera, clips] : cameras) {
      if (clips.empty())
        continue;
      groups.push_back(Group{date, camera, clips});
    }
  }
  return groups;
}

GroupInfo describe_group(const Group &group, bool probe,
                         const std::atomic<bool> *stop) {
  GroupInfo info;
  if (group.clips.empty())
    return info;

  info.start_time = format_clock(group.clips.front().time);
  info.end_time = format_clock(group.clips.back().time);
  info.file_count = group.clips.size();
  info.total_size_mb = group.total_bytes() / BYTES_PER_MB;

  if (probe) {
    for (const auto &clip : group.clips) {
      if (stop && stop->load()) {
        info.interrupted = true;
        ++info.unprobed;
        continue;
      }
      auto duration = probe_duration(clip.path);
      if (duration) {
        info.duration_sec += *duration;
      } else {
        ++info.unprobed;
      }
    }
  }
  return info;
}

} // namespace dashcam_merge
