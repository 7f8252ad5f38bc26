/**
 * @file filename_parser.cpp
 * @brief Filename pattern matching implementation
 */

#include "dashcam_merge/filename_parser.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace dashcam_merge {

FilenameParser::FilenameParser(const std::string &pattern) : pattern_(pattern) {
  try {
    regex_ = std::regex(pattern_);
  } catch (const std::regex_error &e) {
    throw std::invalid_argument(
        fmt::format("invalid filename pattern '{}': {}", pattern_, e.what()));
  }
  if (regex_.mark_count() != 4) {
    throw std::invalid_argument(fmt::format(
        "filename pattern '{}' must have 4 capture groups, has {}", pattern_,
        regex_.mark_count()));
  }
}

std::optional<ParsedName>
FilenameParser::parse(const std::string &filename) const {
  /// Anchored at the start only, so a pattern may omit the extension
  std::smatch m;
  if (!std::regex_search(filename, m, regex_,
                         std::regex_constants::match_continuous))
    return std::nullopt;

  /// All four groups must have participated in the match
  for (size_t i = 1; i <= 4; ++i) {
    if (!m[i].matched)
      return std::nullopt;
  }

  return ParsedName{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
}

} // namespace dashcam_merge
