/**
 * @file config.cpp
 * @brief Configuration document loading and validation
 */

#include "dashcam_merge/config.hpp"

#include <fstream>
#include <regex>

#include <fmt/core.h>

namespace dashcam_merge {

namespace fs = std::filesystem;
using json = nlohmann::json;

// **---- Internal Helpers ----**

namespace {

const json &require(const json &obj, const char *key, const std::string &where) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    throw ConfigError(fmt::format("missing required field '{}{}'", where, key));
  return *it;
}

const json &require_object(const json &obj, const char *key,
                           const std::string &where) {
  const json &v = require(obj, key, where);
  if (!v.is_object())
    throw ConfigError(fmt::format("field '{}{}' must be an object", where, key));
  return v;
}

std::string require_string(const json &obj, const char *key,
                           const std::string &where) {
  const json &v = require(obj, key, where);
  if (!v.is_string() || v.get<std::string>().empty())
    throw ConfigError(
        fmt::format("field '{}{}' must be a non-empty string", where, key));
  return v.get<std::string>();
}

std::string optional_string(const json &obj, const char *key,
                            const std::string &default_val) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return default_val;
  if (!it->is_string())
    throw ConfigError(fmt::format("field '{}' must be a string", key));
  return it->get<std::string>();
}

/// Quality values appear both as "23" and 23 in the wild.
std::string require_string_or_number(const json &obj, const char *key,
                                     const std::string &where) {
  const json &v = require(obj, key, where);
  if (v.is_string() && !v.get<std::string>().empty())
    return v.get<std::string>();
  if (v.is_number_integer())
    return std::to_string(v.get<long>());
  if (v.is_number())
    return fmt::format("{}", v.get<double>());
  throw ConfigError(
      fmt::format("field '{}{}' must be a string or number", where, key));
}

int optional_int(const json &obj, const char *key, int default_val) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return default_val;
  if (!it->is_number_integer())
    throw ConfigError(fmt::format("field '{}' must be an integer", key));
  return it->get<int>();
}

bool optional_bool(const json &obj, const char *key, bool default_val) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null())
    return default_val;
  if (!it->is_boolean())
    throw ConfigError(fmt::format("field '{}' must be a boolean", key));
  return it->get<bool>();
}

void validate_pattern(const std::string &pattern) {
  try {
    std::regex re(pattern);
    if (re.mark_count() != 4) {
      throw ConfigError(fmt::format(
          "video_pattern must have exactly 4 capture groups "
          "(date, time, sequence, camera), found {}",
          re.mark_count()));
    }
  } catch (const std::regex_error &e) {
    throw ConfigError(fmt::format("video_pattern is not a valid regex: {}",
                                  e.what()));
  }
}

} // anonymous namespace

// **---- Public API ----**

MergerConfig parse_config(const json &doc) {
  if (!doc.is_object())
    throw ConfigError("configuration root must be an object");

  MergerConfig cfg;

  /// Camera paths (required, non-empty)
  const json &cameras = require_object(doc, "camera_paths", "");
  if (cameras.empty())
    throw ConfigError("camera_paths must list at least one camera");
  for (auto it = cameras.begin(); it != cameras.end(); ++it) {
    if (!it.value().is_string() || it.value().get<std::string>().empty())
      throw ConfigError(fmt::format(
          "camera_paths.{} must be a non-empty string", it.key()));
    cfg.camera_paths[it.key()] = fs::path(it.value().get<std::string>());
  }

  /// Display names (optional)
  auto names = doc.find("camera_names");
  if (names != doc.end() && !names->is_null()) {
    if (!names->is_object())
      throw ConfigError("field 'camera_names' must be an object");
    for (auto it = names->begin(); it != names->end(); ++it) {
      if (it.value().is_string())
        cfg.camera_names[it.key()] = it.value().get<std::string>();
    }
  }

  cfg.output_dir = fs::path(require_string(doc, "output_dir", ""));
  cfg.video_pattern = require_string(doc, "video_pattern", "");
  validate_pattern(cfg.video_pattern);

  cfg.input_extension = optional_string(doc, "input_extension", ".MP4");
  if (!cfg.input_extension.empty() && cfg.input_extension.front() != '.')
    cfg.input_extension.insert(cfg.input_extension.begin(), '.');
  cfg.output_extension = optional_string(doc, "output_extension", "mp4");
  if (!cfg.output_extension.empty() && cfg.output_extension.front() == '.')
    cfg.output_extension.erase(0, 1);
  if (cfg.output_extension.empty())
    throw ConfigError("output_extension must not be empty");
  cfg.ffmpeg_path = optional_string(doc, "ffmpeg_path", "ffmpeg");
  if (cfg.ffmpeg_path.empty())
    throw ConfigError("ffmpeg_path must not be empty");

  /// FFmpeg profiles (required)
  const json &ffmpeg = require_object(doc, "ffmpeg_settings", "");
  const json &copy =
      require_object(ffmpeg, "copy_codec", "ffmpeg_settings.");
  cfg.copy.video_codec =
      require_string(copy, "video", "ffmpeg_settings.copy_codec.");
  cfg.copy.audio_codec =
      require_string(copy, "audio", "ffmpeg_settings.copy_codec.");

  const std::string re_where = "ffmpeg_settings.reencode_settings.";
  const json &reencode =
      require_object(ffmpeg, "reencode_settings", "ffmpeg_settings.");
  cfg.reencode.video_codec = require_string(reencode, "video_codec", re_where);
  cfg.reencode.audio_codec = require_string(reencode, "audio_codec", re_where);
  cfg.reencode.preset = require_string(reencode, "preset", re_where);
  cfg.reencode.crf = require_string_or_number(reencode, "crf", re_where);
  cfg.reencode.threads = optional_int(reencode, "threads", 0);
  if (cfg.reencode.threads < 0)
    throw ConfigError("reencode_settings.threads must be >= 0");

  /// Performance settings (optional block)
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  cfg.scratch_dir = (ec ? fs::path("/tmp") : tmp) / "dashcam_merge";
  auto perf = doc.find("performance_settings");
  if (perf != doc.end() && !perf->is_null()) {
    if (!perf->is_object())
      throw ConfigError("field 'performance_settings' must be an object");
    cfg.use_local_processing =
        optional_bool(*perf, "use_local_processing", true);
    std::string scratch = optional_string(*perf, "scratch_dir", "");
    if (!scratch.empty())
      cfg.scratch_dir = fs::path(scratch);
    cfg.max_parallel_jobs = optional_int(*perf, "max_parallel_jobs", 0);
    if (cfg.max_parallel_jobs < 0)
      throw ConfigError("performance_settings.max_parallel_jobs must be >= 0");
  }

  return cfg;
}

MergerConfig load_config(const fs::path &path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError(fmt::format(
        "configuration file not found: {} (copy config/config.json.example "
        "to config/config.json)",
        path.string()));
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error &e) {
    throw ConfigError(
        fmt::format("configuration file is not valid JSON: {}", e.what()));
  }

  try {
    return parse_config(doc);
  } catch (const json::exception &e) {
    throw ConfigError(fmt::format("configuration error: {}", e.what()));
  }
}

} // namespace dashcam_merge
