/**
 * @file merge_planner.cpp
 * @brief Group -> MergeJob planning implementation
 */

#include "dashcam_merge/merge_planner.hpp"

#include <fstream>
#include <system_error>

#include <fmt/core.h>

namespace dashcam_merge {

namespace fs = std::filesystem;

const char *to_string(TranscodeProfile profile) {
  switch (profile) {
  case TranscodeProfile::Copy:
    return "stream copy";
  case TranscodeProfile::Reencode:
    return "re-encode";
  }
  return "unknown";
}

std::string MergeJob::tag() const {
  return fmt::format("[{} {}]", format_date(date), camera);
}

std::string output_filename(const std::string &date, const std::string &camera,
                            const std::string &extension) {
  return fmt::format("merged_{}_{}.{}", format_date(date), camera, extension);
}

std::string work_filename(const std::string &output_name) {
  return fmt::format(".{}.part", output_name);
}

std::string manifest_filename(const std::string &date,
                              const std::string &camera) {
  return fmt::format("filelist_{}_{}.txt", date, camera);
}

MergeJob plan_merge(const Group &group, const MergerConfig &config) {
  MergeJob job;
  job.date = group.date;
  job.camera = group.camera;
  job.camera_name = config.camera_name(group.camera);

  job.inputs.reserve(group.clips.size());
  job.input_sizes.reserve(group.clips.size());
  for (const auto &clip : group.clips) {
    job.inputs.push_back(clip.path);
    job.input_sizes.push_back(clip.size_bytes);
    job.total_bytes += clip.size_bytes;
  }

  std::string out_name =
      output_filename(group.date, group.camera, config.output_extension);
  std::string list_name = manifest_filename(group.date, group.camera);

  job.final_output = config.output_dir / out_name;
  job.staged = config.use_local_processing;
  if (job.staged) {
    /// Keep transcode I/O off the (possibly networked) destination
    job.manifest_path = config.scratch_dir / list_name;
    job.work_output = config.scratch_dir / out_name;
  } else {
    /// Sibling temporary, so a failed rerun leaves the previous merge intact
    job.manifest_path = config.output_dir / list_name;
    job.work_output = config.output_dir / work_filename(out_name);
  }
  return job;
}

std::string render_manifest(const std::vector<fs::path> &inputs) {
  std::string content;
  content.reserve(inputs.size() * 96);

  for (const auto &input : inputs) {
    std::string path = input.string();
    std::string escaped;
    escaped.reserve(path.size());
    for (char c : path) {
      if (c == '\'')
        escaped += "'\\''";
      else
        escaped += c;
    }
    content += fmt::format("file '{}'\n", escaped);
  }
  return content;
}

bool write_manifest(const MergeJob &job, std::string &error) {
  std::error_code ec;
  fs::create_directories(job.manifest_path.parent_path(), ec);
  if (ec) {
    error = fmt::format("cannot create {}: {}",
                        job.manifest_path.parent_path().string(), ec.message());
    return false;
  }

  std::ofstream out(job.manifest_path, std::ios::trunc);
  if (!out) {
    error = fmt::format("cannot open {}", job.manifest_path.string());
    return false;
  }
  out << render_manifest(job.inputs);
  out.flush();
  if (!out) {
    error = fmt::format("write failed: {}", job.manifest_path.string());
    return false;
  }
  return true;
}

} // namespace dashcam_merge
