/**
 * @file types.hpp
 * @brief Core data types for the dashcam merger
 *
 * @details Contains the data structures shared across modules:
 *          - Clip: one fragment file recorded by the device
 *
 *          - CameraClips / Catalog: date -> camera -> ordered clips
 *
 *          - Date and time formatting helpers for the device's digit forms
 */

#ifndef DASHCAM_MERGE_TYPES_HPP
#define DASHCAM_MERGE_TYPES_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace dashcam_merge {

// **----- CONSTANTS -----**

/// Bytes per mebibyte, used for every size shown to the user.
constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

// **----- DATA STRUCTURES -----**

/**
 * @struct Clip
 * @brief One source fragment. Immutable once the catalog is built.
 * @note (date, camera, sequence) is unique within a camera path.
 *       Ordering key is (time, sequence), both compared as text, with the
 *       path as a final tiebreak.
 */
struct Clip {
  std::filesystem::path path; //< Absolute path to the file
  std::string date;           //< YYYYMMDD
  std::string time;           //< HHMMSS
  std::string sequence;       //< Device sequence token, zero-padded text
  std::string camera;         //< Camera position tag, e.g. "F"
  std::uintmax_t size_bytes;  //< File size at catalog time

  std::string filename() const { return path.filename().string(); }
};

/// Ordering used for every clip list: (time, sequence) ascending, then path
/// so duplicate keys still sort the same way on every run.
inline bool clip_order(const Clip &a, const Clip &b) {
  if (a.time != b.time)
    return a.time < b.time;
  if (a.sequence != b.sequence)
    return a.sequence < b.sequence;
  return a.path < b.path;
}

/// camera tag -> time-ordered clips (never empty)
using CameraClips = std::map<std::string, std::vector<Clip>>;

/// date (YYYYMMDD) -> camera clips
using Catalog = std::map<std::string, CameraClips>;

/**
 * @struct Group
 * @brief The unit of merge work: all clips of one date and one camera.
 */
struct Group {
  std::string date;        //< YYYYMMDD
  std::string camera;      //< Camera position tag
  std::vector<Clip> clips; //< Time-ordered, non-empty

  /// Stable id used for progress tracking and log prefixes.
  std::string id() const { return date + "_" + camera; }

  std::uintmax_t total_bytes() const {
    std::uintmax_t total = 0;
    for (const auto &c : clips)
      total += c.size_bytes;
    return total;
  }
};

// **----- FORMATTING HELPERS -----**

/// "20250906" -> "2025-09-06". Inputs shorter than 8 chars are returned as is.
inline std::string format_date(const std::string &yyyymmdd) {
  if (yyyymmdd.size() < 8)
    return yyyymmdd;
  return yyyymmdd.substr(0, 4) + "-" + yyyymmdd.substr(4, 2) + "-" +
         yyyymmdd.substr(6, 2);
}

/// "134056" -> "13:40:56"
inline std::string format_clock(const std::string &hhmmss) {
  if (hhmmss.size() < 6)
    return hhmmss;
  return hhmmss.substr(0, 2) + ":" + hhmmss.substr(2, 2) + ":" +
         hhmmss.substr(4, 2);
}

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_TYPES_HPP
