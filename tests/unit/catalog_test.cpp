#include "dashcam_merge/catalog.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.hpp"

namespace {

using namespace dashcam_merge;
namespace fs = std::filesystem;
using dashcam_merge::testing::make_config;
using dashcam_merge::testing::TempDir;
using dashcam_merge::testing::write_file;

void TestGroupsAreOrderedRegardlessOfDirectoryOrder() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);

  /// Written out of order on purpose
  write_file(tmp / "front/NO20250906-134057-000896F.MP4", "ccc");
  write_file(tmp / "front/NO20250906-134055-000894F.MP4", "a");
  write_file(tmp / "front/NO20250906-134056-000895F.MP4", "bb");
  fs::create_directories(tmp / "rear");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  assert(catalog.size() == 1);
  const auto &clips = catalog.at("20250906").at("F");
  assert(clips.size() == 3);
  assert(clips[0].time == "134055" && clips[0].sequence == "000894");
  assert(clips[1].time == "134056" && clips[1].sequence == "000895");
  assert(clips[2].time == "134057" && clips[2].sequence == "000896");
  assert(clips[0].size_bytes == 1);
  assert(clips[2].size_bytes == 3);
  assert(clips[0].path.is_absolute());

  /// Rear directory exists but is empty: no group materialized
  assert(catalog.at("20250906").count("R") == 0);
}

void TestSequenceBreaksTimeTiesAsText() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  write_file(tmp / "front/NO20250906-134056-000900F.MP4", "x");
  write_file(tmp / "front/NO20250906-134056-000899F.MP4", "x");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  const auto &clips = catalog.at("20250906").at("F");
  assert(clips.size() == 2);
  assert(clips[0].sequence == "000899");
  assert(clips[1].sequence == "000900");
}

void TestDuplicateKeysOrderedByPath() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  /// Pattern without the extension accepts renamed copies with the same key
  cfg.video_pattern = R"(NO(\d{8})-(\d{6})-(\d{6})([FR]))";
  write_file(tmp / "front/NO20250906-134056-000895F_b.MP4", "x");
  write_file(tmp / "front/NO20250906-134056-000895F.MP4", "x");
  write_file(tmp / "front/NO20250906-134056-000895F_a.MP4", "x");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  const auto &clips = catalog.at("20250906").at("F");
  assert(clips.size() == 3);
  assert(clips[0].filename() == "NO20250906-134056-000895F.MP4");
  assert(clips[1].filename() == "NO20250906-134056-000895F_a.MP4");
  assert(clips[2].filename() == "NO20250906-134056-000895F_b.MP4");

  Clip a{"/x/a.MP4", "20250906", "134056", "000895", "F", 1};
  Clip b{"/x/b.MP4", "20250906", "134056", "000895", "F", 1};
  assert(clip_order(a, b));
  assert(!clip_order(b, a));
  assert(!clip_order(a, a));
}

void TestMisfiledAndUnrecognizedFilesAreExcluded() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  write_file(tmp / "front/NO20250906-134056-000895F.MP4", "x");
  write_file(tmp / "front/NO20250906-134056-000895R.MP4", "x"); // misfiled
  write_file(tmp / "front/notes.MP4", "x");                     // no match
  write_file(tmp / "front/NO20250906-134057-000896F.mov", "x"); // extension
  fs::create_directories(tmp / "front/NO20250906-134058-000897F.MP4");
  fs::create_directories(tmp / "rear");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  assert(catalog.at("20250906").at("F").size() == 1);
  assert(catalog.at("20250906").count("R") == 0);
  assert(builder.stats().clips_accepted == 1);
  assert(builder.stats().camera_mismatch == 1);
  assert(builder.stats().names_unmatched == 1);
}

void TestMissingCameraDirectoryIsSkipped() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  /// No "front" directory at all
  write_file(tmp / "rear/NO20250906-134056-000895R.MP4", "x");
  write_file(tmp / "rear/NO20250907-080000-000001R.MP4", "x");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  assert(builder.stats().cameras_missing == 1);
  assert(builder.stats().cameras_scanned == 1);
  assert(catalog.size() == 2);
  assert(catalog.at("20250906").count("F") == 0);
  assert(catalog.at("20250906").at("R").size() == 1);
}

void TestFilterByDate() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  write_file(tmp / "front/NO20250906-134056-000895F.MP4", "x");
  write_file(tmp / "front/NO20250907-080000-000001F.MP4", "x");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  Catalog catalog = builder.build(cfg.camera_paths);

  Catalog one = filter_by_date(catalog, "20250907");
  assert(one.size() == 1);
  assert(one.count("20250907") == 1);

  Catalog none = filter_by_date(catalog, "20250908");
  assert(none.empty());
}

void TestFlattenOrdersByDateThenCamera() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  write_file(tmp / "rear/NO20250906-134056-000895R.MP4", "x");
  write_file(tmp / "front/NO20250907-080000-000001F.MP4", "x");
  write_file(tmp / "front/NO20250906-134056-000895F.MP4", "x");

  FilenameParser parser(cfg.video_pattern);
  CatalogBuilder builder(parser, ".MP4");
  std::vector<Group> groups = flatten(builder.build(cfg.camera_paths));

  assert(groups.size() == 3);
  assert(groups[0].id() == "20250906_F");
  assert(groups[1].id() == "20250906_R");
  assert(groups[2].id() == "20250907_F");
}

void TestDescribeGroupWithoutProbe() {
  Group group{"20250906",
              "F",
              {Clip{"/a", "20250906", "134055", "000894", "F", 1024 * 1024},
               Clip{"/b", "20250906", "140000", "000895", "F", 1024 * 1024}}};
  GroupInfo info = describe_group(group, false);
  assert(info.start_time == "13:40:55");
  assert(info.end_time == "14:00:00");
  assert(info.file_count == 2);
  assert(info.total_size_mb == 2.0);
  assert(info.duration_sec == 0);
  assert(info.unprobed == 0);
}

void TestDescribeGroupCountsUnprobeableClips() {
  TempDir tmp;
  write_file(tmp / "NO20250906-134055-000894F.MP4", "not a video");
  Group group{"20250906",
              "F",
              {Clip{tmp / "NO20250906-134055-000894F.MP4", "20250906",
                    "134055", "000894", "F", 11}}};
  GroupInfo info = describe_group(group, true);
  assert(info.unprobed == 1);
  assert(info.duration_sec == 0);
}

void TestDescribeGroupStopsProbingWhenInterrupted() {
  Group group{"20250906",
              "F",
              {Clip{"/a", "20250906", "134055", "000894", "F", 10},
               Clip{"/b", "20250906", "140000", "000895", "F", 10}}};
  std::atomic<bool> stop{true};
  GroupInfo info = describe_group(group, true, &stop);
  assert(info.interrupted);
  assert(info.unprobed == 2);
  assert(info.file_count == 2);
  assert(info.start_time == "13:40:55");

  stop = false;
  assert(!describe_group(group, false, &stop).interrupted);
}

} // namespace

int main() {
  TestGroupsAreOrderedRegardlessOfDirectoryOrder();
  TestSequenceBreaksTimeTiesAsText();
  TestDuplicateKeysOrderedByPath();
  TestMisfiledAndUnrecognizedFilesAreExcluded();
  TestMissingCameraDirectoryIsSkipped();
  TestFilterByDate();
  TestFlattenOrdersByDateThenCamera();
  TestDescribeGroupWithoutProbe();
  TestDescribeGroupCountsUnprobeableClips();
  TestDescribeGroupStopsProbingWhenInterrupted();

  std::cout << "dashcam_merge_unit_catalog: pass\n";
  return 0;
}
