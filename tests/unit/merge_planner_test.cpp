#include "dashcam_merge/merge_planner.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "test_support.hpp"

namespace {

using namespace dashcam_merge;
namespace fs = std::filesystem;
using dashcam_merge::testing::make_clip;
using dashcam_merge::testing::make_config;
using dashcam_merge::testing::read_file;
using dashcam_merge::testing::TempDir;

void TestOutputNames() {
  assert(output_filename("20250906", "F", "mp4") == "merged_2025-09-06_F.mp4");
  assert(output_filename("20250906", "R", "mkv") == "merged_2025-09-06_R.mkv");
  assert(manifest_filename("20250906", "F") == "filelist_20250906_F.txt");
  assert(work_filename("merged_2025-09-06_F.mp4") ==
         ".merged_2025-09-06_F.mp4.part");
}

void TestNonStagedJobWritesInPlace() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  Group group{"20250906",
              "F",
              {make_clip(tmp / "front", "20250906", "134055", "000894", "F",
                         "aa"),
               make_clip(tmp / "front", "20250906", "134056", "000895", "F",
                         "bbb")}};

  MergeJob job = plan_merge(group, cfg);
  assert(!job.staged);
  assert(job.camera_name == "Front");
  assert(job.final_output == cfg.output_dir / "merged_2025-09-06_F.mp4");
  assert(job.work_output == cfg.output_dir / ".merged_2025-09-06_F.mp4.part");
  assert(job.manifest_path == cfg.output_dir / "filelist_20250906_F.txt");
  assert(job.inputs.size() == 2);
  assert(job.inputs[0] == group.clips[0].path);
  assert(job.input_sizes[1] == 3);
  assert(job.total_bytes == 5);
  assert(job.id() == "20250906_F");
  assert(job.tag() == "[2025-09-06 F]");
  assert(job.profile == TranscodeProfile::Copy);

  /// Planning touches no files
  assert(!fs::exists(job.manifest_path));
}

void TestStagedJobUsesScratch() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), true);
  Group group{"20250906",
              "R",
              {make_clip(tmp / "rear", "20250906", "134055", "000894", "R")}};

  MergeJob job = plan_merge(group, cfg);
  assert(job.staged);
  assert(job.camera_name == "Rear");
  assert(job.manifest_path == cfg.scratch_dir / "filelist_20250906_R.txt");
  assert(job.work_output == cfg.scratch_dir / "merged_2025-09-06_R.mp4");
  assert(job.final_output == cfg.output_dir / "merged_2025-09-06_R.mp4");
}

void TestUnnamedCameraFallsBackToTag() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), false);
  cfg.camera_names.clear();
  Group group{"20250906",
              "F",
              {make_clip(tmp / "front", "20250906", "134055", "000894", "F")}};
  assert(plan_merge(group, cfg).camera_name == "F");
}

void TestManifestQuotesPaths() {
  std::string text = render_manifest(
      {fs::path("/data/a.MP4"), fs::path("/data/it's here/b.MP4")});
  assert(text == "file '/data/a.MP4'\n"
                 "file '/data/it'\\''s here/b.MP4'\n");
  assert(render_manifest({}).empty());
}

void TestWriteManifestCreatesDirectory() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), true);
  Group group{"20250906",
              "F",
              {make_clip(tmp / "front", "20250906", "134055", "000894", "F"),
               make_clip(tmp / "front", "20250906", "134056", "000895", "F")}};
  MergeJob job = plan_merge(group, cfg);
  assert(!fs::exists(cfg.scratch_dir));

  std::string error;
  assert(write_manifest(job, error));
  assert(error.empty());
  assert(read_file(job.manifest_path) == render_manifest(job.inputs));
}

void TestWriteManifestReportsFailure() {
  TempDir tmp;
  MergerConfig cfg = make_config(tmp.path(), true);
  /// A regular file where the scratch directory should be
  testing::write_file(cfg.scratch_dir, "not a directory");
  Group group{"20250906",
              "F",
              {make_clip(tmp / "front", "20250906", "134055", "000894", "F")}};
  MergeJob job = plan_merge(group, cfg);

  std::string error;
  assert(!write_manifest(job, error));
  assert(!error.empty());
}

} // namespace

int main() {
  TestOutputNames();
  TestNonStagedJobWritesInPlace();
  TestStagedJobUsesScratch();
  TestUnnamedCameraFallsBackToTag();
  TestManifestQuotesPaths();
  TestWriteManifestCreatesDirectory();
  TestWriteManifestReportsFailure();

  std::cout << "dashcam_merge_unit_merge_planner: pass\n";
  return 0;
}
