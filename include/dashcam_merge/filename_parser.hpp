/**
 * @file filename_parser.hpp
 * @brief Extracts (date, time, sequence, camera) from clip filenames
 *
 * @details The pattern comes from the configuration document and must hold
 *          exactly four capture groups in that order, e.g.
 *          NO(\d{8})-(\d{6})-(\d{6})([FR])\.MP4 matches
 *          "NO20250906-134056-000895F.MP4".
 */

#ifndef DASHCAM_MERGE_FILENAME_PARSER_HPP
#define DASHCAM_MERGE_FILENAME_PARSER_HPP

#include <optional>
#include <regex>
#include <string>

namespace dashcam_merge {

/**
 * @struct ParsedName
 * @brief The four fields carried by a device filename, as exact substrings.
 */
struct ParsedName {
  std::string date;     //< YYYYMMDD
  std::string time;     //< HHMMSS
  std::string sequence; //< Zero-padded device sequence
  std::string camera;   //< Camera position tag
};

/**
 * @class FilenameParser
 * @brief Pure filename -> ParsedName mapping. Safe to share across threads.
 */
class FilenameParser {
public:
  /**
   * @brief Compile the pattern.
   * @throws std::invalid_argument if the pattern is not a valid regex or does
   *         not have exactly four capture groups.
   */
  explicit FilenameParser(const std::string &pattern);

  /**
   * @brief Parse a bare filename (no directory part).
   * @return The four fields, or std::nullopt when the name does not match.
   */
  std::optional<ParsedName> parse(const std::string &filename) const;

  const std::string &pattern() const { return pattern_; }

private:
  std::string pattern_;
  std::regex regex_;
};

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_FILENAME_PARSER_HPP
