/**
 * @file test_support.hpp
 * @brief Shared helpers for the unit tests
 *
 * @details Provides:
 *          - TempDir: unique scratch directory removed on destruction
 *
 *          - write_file / read_file helpers
 *
 *          - write_fake_tool: POSIX shell stand-in for ffmpeg whose stream
 *            copy and re-encode behaviour is chosen per test
 *
 *          - make_config: MergerConfig pointing at a TempDir
 */

#ifndef DASHCAM_MERGE_TESTS_TEST_SUPPORT_HPP
#define DASHCAM_MERGE_TESTS_TEST_SUPPORT_HPP

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include "dashcam_merge/config.hpp"
#include "dashcam_merge/types.hpp"

namespace dashcam_merge::testing {

namespace fs = std::filesystem;

class TempDir {
public:
  TempDir() {
    std::string tmpl =
        (fs::temp_directory_path() / "dashcam_merge_test_XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data()))
      throw std::runtime_error("mkdtemp failed");
    path_ = fs::path(buf.data());
  }

  ~TempDir() {
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const fs::path &path() const { return path_; }
  fs::path operator/(const std::string &name) const { return path_ / name; }

private:
  fs::path path_;
};

inline void write_file(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << content;
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

/// Tool behaviour for one profile
enum class FakeBehavior {
  Succeed, //< writes "<mode>-output" and exits 0
  Fail,    //< writes nothing, prints to stderr, exits 1
  Partial  //< writes "partial" and exits 1
};

inline std::string behavior_script(FakeBehavior b) {
  switch (b) {
  case FakeBehavior::Succeed:
    return "printf '%s-output' \"$mode\" > \"$out\"; exit 0";
  case FakeBehavior::Fail:
    return "echo \"fake: $mode failed\" >&2; exit 1";
  case FakeBehavior::Partial:
    return "printf 'partial' > \"$out\"; echo 'fake: trailing frames' >&2; "
           "exit 1";
  }
  return "exit 1";
}

/**
 * @brief Write an executable ffmpeg stand-in.
 *
 * @param dir Directory to create the script in
 * @param copy Behaviour when called with -c:v copy
 * @param reencode Behaviour otherwise
 * @param fail_on Output-path substring that forces failure in both modes
 * @return Path of the script. Each call appends its mode to "calls.log" and
 *         copies the manifest to "manifest.seen" in the same directory.
 */
inline fs::path write_fake_tool(const fs::path &dir, FakeBehavior copy,
                                FakeBehavior reencode,
                                const std::string &fail_on = "") {
  fs::path script = dir / "fake_ffmpeg.sh";
  fs::path calls = dir / "calls.log";
  fs::path seen = dir / "manifest.seen";

  std::string body = "#!/bin/sh\n"
                     "out=''\nmanifest=''\nmode=reencode\nprev=''\n"
                     "for a in \"$@\"; do\n"
                     "  if [ \"$prev\" = '-i' ]; then manifest=\"$a\"; fi\n"
                     "  if [ \"$prev\" = '-c:v' ] && [ \"$a\" = 'copy' ]; "
                     "then mode=copy; fi\n"
                     "  prev=\"$a\"\n  out=\"$a\"\n"
                     "done\n";
  body += "echo \"$mode\" >> '" + calls.string() + "'\n";
  body += "cp \"$manifest\" '" + seen.string() + "' 2>/dev/null\n";
  if (!fail_on.empty()) {
    body += "case \"$out\" in *'" + fail_on +
            "'*) echo 'fake: forced failure' >&2; exit 1;; esac\n";
  }
  body += "if [ \"$mode\" = copy ]; then\n  " + behavior_script(copy) +
          "\nelse\n  " + behavior_script(reencode) + "\nfi\n";

  write_file(script, body);
  fs::permissions(script,
                  fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read |
                      fs::perms::others_exec,
                  fs::perm_options::replace);
  return script;
}

/// Lines of the fake tool's call log ("copy" / "reencode")
inline std::vector<std::string> tool_calls(const fs::path &dir) {
  std::vector<std::string> calls;
  std::ifstream in(dir / "calls.log");
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      calls.push_back(line);
  }
  return calls;
}

/**
 * @brief Config rooted in a temp directory.
 * @note Pattern matches names like NO20250906-134056-000895F.MP4
 */
inline MergerConfig make_config(const fs::path &root, bool staged) {
  MergerConfig cfg;
  cfg.camera_paths = {{"F", root / "front"}, {"R", root / "rear"}};
  cfg.camera_names = {{"F", "Front"}, {"R", "Rear"}};
  cfg.output_dir = root / "out";
  cfg.video_pattern = R"(NO(\d{8})-(\d{6})-(\d{6})([FR])\.MP4)";
  cfg.copy = {"copy", "copy"};
  cfg.reencode = {"libx264", "aac", "fast", "23", 0};
  cfg.use_local_processing = staged;
  cfg.scratch_dir = root / "scratch";
  fs::create_directories(cfg.output_dir);
  return cfg;
}

/// Clip record with a real file behind it
inline Clip make_clip(const fs::path &dir, const std::string &date,
                      const std::string &time, const std::string &seq,
                      const std::string &camera,
                      const std::string &content = "clip") {
  fs::path path = dir / ("NO" + date + "-" + time + "-" + seq + camera + ".MP4");
  write_file(path, content);
  return Clip{path, date, time, seq, camera, content.size()};
}

} // namespace dashcam_merge::testing

#endif // DASHCAM_MERGE_TESTS_TEST_SUPPORT_HPP
