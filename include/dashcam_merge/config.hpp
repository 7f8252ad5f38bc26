/**
 * @file config.hpp
 * @brief Configuration: JSON document plus environment tuning knobs
 *
 * @details Two layers:
 *
 *          - MergerConfig: validated struct built once from the JSON
 *            configuration document (camera paths, pattern, FFmpeg profiles,
 *            local staging). Loading fails fast with ConfigError.
 *
 *          - Config namespace: lazy-initialized, memoized runtime knobs read
 *            from environment variables (parallelism, progress display).
 *            See config/dashcam_merge.env for the list.
 */

#ifndef DASHCAM_MERGE_CONFIG_HPP
#define DASHCAM_MERGE_CONFIG_HPP

#include <cstdlib>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace dashcam_merge {

/**
 * @class ConfigError
 * @brief Missing or malformed configuration document. Fatal at startup.
 */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @struct CopyProfile
 * @brief Stream-copy codec identifiers (normally "copy" / "copy").
 */
struct CopyProfile {
  std::string video_codec;
  std::string audio_codec;
};

/**
 * @struct ReencodeProfile
 * @brief Fallback transcode parameters.
 */
struct ReencodeProfile {
  std::string video_codec; //< e.g. libx264
  std::string audio_codec; //< e.g. aac
  std::string preset;      //< e.g. fast
  std::string crf;         //< Quality value, passed verbatim as -crf
  int threads = 0;         //< 0 = auto (CPUs split across parallel jobs)
};

/**
 * @struct MergerConfig
 * @brief Validated configuration document.
 *
 * @attention DEFAULTING RULES (applied in parse_config):
 *
 *   - camera_names[tag]     -> tag itself
 *
 *   - input_extension       -> ".MP4"
 *
 *   - output_extension      -> "mp4"
 *
 *   - ffmpeg_path           -> "ffmpeg" (resolved through PATH)
 *
 *   - reencode threads      -> 0 (auto)
 *
 *   - use_local_processing  -> true
 *
 *   - scratch_dir           -> <temp_directory_path>/dashcam_merge
 *
 *   - max_parallel_jobs     -> 0 (unbounded)
 */
struct MergerConfig {
  std::map<std::string, std::filesystem::path> camera_paths;
  std::map<std::string, std::string> camera_names;
  std::filesystem::path output_dir;
  std::string video_pattern;
  std::string input_extension = ".MP4";
  std::string output_extension = "mp4";
  std::string ffmpeg_path = "ffmpeg";
  CopyProfile copy;
  ReencodeProfile reencode;
  bool use_local_processing = true;
  std::filesystem::path scratch_dir;
  int max_parallel_jobs = 0;

  /// Display name for a camera tag, falling back to the tag.
  std::string camera_name(const std::string &tag) const {
    auto it = camera_names.find(tag);
    return it != camera_names.end() ? it->second : tag;
  }
};

/**
 * @brief Build a MergerConfig from a parsed JSON document.
 * @throws ConfigError on missing required fields, wrong types, or a
 *         video_pattern that is not a regex with exactly four groups.
 */
MergerConfig parse_config(const nlohmann::json &doc);

/**
 * @brief Read and parse a configuration file.
 * @throws ConfigError if the file is missing or not valid JSON.
 */
MergerConfig load_config(const std::filesystem::path &path);

/// Default location of the configuration document.
inline std::filesystem::path default_config_path() {
  return std::filesystem::path("config") / "config.json";
}

namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or not numeric
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 */
inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

/**
 * @brief Parallel merge jobs override (-1 = not set, use the document).
 * @note 0 = unbounded, one worker per group.
 */
inline int parallel_jobs() {
  static int val = get_env_int("PARALLEL_JOBS", -1);
  return val;
}

/// Progress reporter poll interval in milliseconds
inline int progress_interval_ms() {
  static int val = get_env_int("PROGRESS_INTERVAL_MS", 500);
  return val;
}

/// Progress rendering style: "simple" (one line) or "bar" (per group box)
inline std::string progress_style() {
  static std::string val = get_env_string("PROGRESS_STYLE", "simple");
  return val;
}

/// Enable the live progress reporter
inline bool show_progress() {
  static bool val = (get_env_int("SHOW_PROGRESS", 1) != 0);
  return val;
}

/// Print the TimingCollector table at exit
inline bool show_timing() {
  static bool val = (get_env_int("SHOW_TIMING", 0) != 0);
  return val;
}

} // namespace Config
} // namespace dashcam_merge

#endif // DASHCAM_MERGE_CONFIG_HPP
