/**
 * @file merge_executor.cpp
 * @brief Two-tier merge protocol implementation
 */

#include "dashcam_merge/merge_executor.hpp"

#include <chrono>
#include <system_error>

#include <fmt/core.h>

#include "dashcam_merge/logging.hpp"
#include "dashcam_merge/types.hpp"

namespace dashcam_merge {

namespace fs = std::filesystem;

// **---- Names ----**

const char *to_string(MergeState state) {
  switch (state) {
  case MergeState::Planned:
    return "Planned";
  case MergeState::CopyAttempt:
    return "CopyAttempt";
  case MergeState::ReencodeAttempt:
    return "ReencodeAttempt";
  case MergeState::Success:
    return "Success";
  case MergeState::PartialSalvage:
    return "PartialSalvage";
  case MergeState::Failed:
    return "Failed";
  }
  return "Unknown";
}

const char *to_string(MergeError error) {
  switch (error) {
  case MergeError::None:
    return "none";
  case MergeError::ToolNotFound:
    return "tool not found";
  case MergeError::TranscodeFailed:
    return "transcode failed";
  case MergeError::RelocationFailed:
    return "relocation failed";
  case MergeError::ManifestFailed:
    return "manifest write failed";
  case MergeError::Interrupted:
    return "interrupted";
  }
  return "unknown";
}

std::uintmax_t file_size_or_zero(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return 0;
  std::uintmax_t size = fs::file_size(path, ec);
  return ec ? 0 : size;
}

// **---- Internal Helpers ----**

namespace {

/// Best-effort removal; failures are never escalated.
void remove_quietly(const fs::path &path) {
  std::error_code ec;
  fs::remove(path, ec);
}

void enter(MergeResult &result, MergeState state) {
  result.state = state;
  result.transitions.push_back(state);
}

/// Last non-empty line of the tool's stderr, for one-line status text
std::string last_line(const std::string &text) {
  size_t end = text.find_last_not_of("\r\n ");
  if (end == std::string::npos)
    return "";
  size_t begin = text.find_last_of('\n', end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

// **---- MergeExecutor ----**

MergeExecutor::MergeExecutor(const MergerConfig &config,
                             ProgressAggregator *progress,
                             const std::atomic<bool> *stop)
    : config_(config), progress_(progress), stop_(stop) {}

void MergeExecutor::report(const MergeJob &job, int file_index,
                           const std::string &file, std::uint64_t bytes,
                           const std::string &status) const {
  if (progress_)
    progress_->update_group(job.id(), file_index, file, bytes, status);
}

ToolResult MergeExecutor::attempt(const MergeJob &job,
                                  TranscodeProfile profile) const {
  /// Stale bytes from an earlier attempt must not pass the salvage check
  remove_quietly(job.work_output);

  auto start = std::chrono::high_resolution_clock::now();
  ToolResult tool = run_tool(config_.ffmpeg_path,
                             build_merge_args(job, profile, config_));
  auto end = std::chrono::high_resolution_clock::now();

  TimingCollector::record(
      fmt::format("{} {} {}", job.date, job.camera, to_string(profile)),
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count());
  return tool;
}

bool MergeExecutor::relocate(const MergeJob &job, std::string &error) const {
  std::error_code ec;
  fs::create_directories(job.final_output.parent_path(), ec);
  if (ec) {
    error = fmt::format("cannot create {}: {}",
                        job.final_output.parent_path().string(), ec.message());
    return false;
  }

  fs::rename(job.work_output, job.final_output, ec);
  if (!ec)
    return true;

  /// Scratch and destination are usually on different filesystems
  if (ec != std::errc::cross_device_link) {
    error = fmt::format("rename to {} failed: {}", job.final_output.string(),
                        ec.message());
    return false;
  }

  /// Copy next to the destination first, so the final name only ever sees a
  /// complete file
  fs::path landing = job.final_output.parent_path() /
                     work_filename(job.final_output.filename().string());
  ec.clear();
  fs::copy_file(job.work_output, landing, fs::copy_options::overwrite_existing,
                ec);
  if (!ec)
    fs::rename(landing, job.final_output, ec);
  if (ec) {
    error = fmt::format("copy to {} failed: {}", job.final_output.string(),
                        ec.message());
    remove_quietly(landing);
    return false;
  }
  remove_quietly(job.work_output);
  return true;
}

void MergeExecutor::cleanup(const MergeJob &job, bool keep_work_output) const {
  remove_quietly(job.manifest_path);
  if (!keep_work_output)
    remove_quietly(job.work_output);
}

MergeResult MergeExecutor::execute(const MergeJob &job) const {
  auto start = std::chrono::steady_clock::now();
  const std::string tag = job.tag();
  const std::string name = fmt::format("{} {}", format_date(job.date),
                                       job.camera_name);
  const int n_files = static_cast<int>(job.inputs.size());

  MergeResult result;
  result.id = job.id();
  result.label = name;
  result.output = job.final_output;
  result.file_count = n_files;
  result.input_bytes = job.total_bytes;
  enter(result, MergeState::Planned);

  auto finish = [&]() -> MergeResult {
    result.elapsed_sec = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - start)
                             .count();
    return result;
  };

  report(job, 0, "", 0, fmt::format("{}: preparing", name));

  if (job.inputs.empty()) {
    enter(result, MergeState::Failed);
    result.error = MergeError::TranscodeFailed;
    result.status = "no input clips";
    LOG_ERROR("{} No input clips", tag);
    report(job, 0, "", 0, fmt::format("{}: failed (no clips)", name));
    return finish();
  }

  std::string manifest_error;
  if (!write_manifest(job, manifest_error)) {
    enter(result, MergeState::Failed);
    result.error = MergeError::ManifestFailed;
    result.status = manifest_error;
    LOG_ERROR("{} Cannot write file list: {}", tag, manifest_error);
    report(job, 0, "", 0, fmt::format("{}: failed (file list)", name));
    cleanup(job, false);
    return finish();
  }

  const std::string first_file = job.inputs.front().filename().string();
  const std::string last_file = job.inputs.back().filename().string();

  // **----- TIER 1: STREAM COPY -----**

  enter(result, MergeState::CopyAttempt);
  result.profile = TranscodeProfile::Copy;
  LOG_INFO("{} Merging {} files with stream copy...", tag, n_files);
  report(job, 0, first_file, 0,
         fmt::format("{}: merging {} files (stream copy)", name, n_files));

  ToolResult tool = attempt(job, TranscodeProfile::Copy);

  if (tool.ok()) {
    enter(result, MergeState::Success);
  } else if (tool.status == ToolStatus::NotFound) {
    enter(result, MergeState::Failed);
    result.error = MergeError::ToolNotFound;
    result.status = fmt::format(
        "'{}' not found; install FFmpeg or set ffmpeg_path in the config",
        config_.ffmpeg_path);
    LOG_ERROR("{} {}", tag, result.status);
  } else if (stop_requested()) {
    enter(result, MergeState::Failed);
    result.error = MergeError::Interrupted;
    result.status = "interrupted";
    result.stderr_tail = tool.stderr_tail;
  } else {
    // **----- TIER 2: RE-ENCODE -----**

    LOG_WARN("{} Stream copy failed ({}), re-encoding...", tag,
             tool.describe());
    if (!tool.stderr_tail.empty())
      LOG_WARN("{} ffmpeg: {}", tag, last_line(tool.stderr_tail));

    enter(result, MergeState::ReencodeAttempt);
    result.profile = TranscodeProfile::Reencode;
    report(job, 0, first_file, 0,
           fmt::format("{}: re-encoding {} files", name, n_files));

    tool = attempt(job, TranscodeProfile::Reencode);
    std::uintmax_t produced = file_size_or_zero(job.work_output);

    if (tool.ok()) {
      enter(result, MergeState::Success);
    } else if (tool.status == ToolStatus::NotFound) {
      enter(result, MergeState::Failed);
      result.error = MergeError::ToolNotFound;
      result.status = fmt::format(
          "'{}' not found; install FFmpeg or set ffmpeg_path in the config",
          config_.ffmpeg_path);
      LOG_ERROR("{} {}", tag, result.status);
    } else if (produced > 0) {
      enter(result, MergeState::PartialSalvage);
      result.stderr_tail = tool.stderr_tail;
      LOG_WARN("{} Re-encode reported {} but wrote {:.1f} MB; keeping the "
               "salvaged output",
               tag, tool.describe(), produced / BYTES_PER_MB);
    } else {
      enter(result, MergeState::Failed);
      result.error = MergeError::TranscodeFailed;
      result.stderr_tail = tool.stderr_tail;
      result.status = fmt::format("re-encode failed ({})", tool.describe());
      LOG_ERROR("{} Re-encode failed ({})", tag, tool.describe());
      if (!tool.stderr_tail.empty())
        LOG_ERROR("{} ffmpeg: {}", tag, last_line(tool.stderr_tail));
    }
  }

  // **----- POST-TRANSCODE -----**

  bool keep_work = false;
  if (result.success()) {
    report(job, n_files, last_file, job.total_bytes,
           fmt::format("{}: merged ({})", name, to_string(result.profile)));

    std::string move_error;
    if (relocate(job, move_error)) {
      if (job.staged)
        report(job, n_files, last_file, job.total_bytes,
               fmt::format("{}: moved to destination", name));
    } else {
      /// Transcoded bytes stay at the work path for manual recovery
      keep_work = true;
      enter(result, MergeState::Failed);
      result.error = MergeError::RelocationFailed;
      result.status = fmt::format("{}; merged file kept at {}", move_error,
                                  job.work_output.string());
      LOG_ERROR("{} Relocation failed: {}", tag, result.status);
    }
  }

  cleanup(job, keep_work);

  // **----- TERMINAL -----**

  if (result.success()) {
    result.output_bytes = file_size_or_zero(job.final_output);
    if (result.salvaged()) {
      result.status = fmt::format("salvaged after re-encode error ({:.1f} MB)",
                                  result.output_bytes / BYTES_PER_MB);
    } else {
      result.status = fmt::format("merged via {} ({:.1f} MB)",
                                  to_string(result.profile),
                                  result.output_bytes / BYTES_PER_MB);
    }
    report(job, n_files, last_file, job.total_bytes,
           fmt::format("{}: done, {}", name, result.status));
    LOG_SUCCESS("{} Done: {}", tag, job.final_output.string());
  } else {
    report(job, 0, "", 0,
           fmt::format("{}: failed ({})", name, to_string(result.error)));
  }

  return finish();
}

} // namespace dashcam_merge
