#include "dashcam_merge/config.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "test_support.hpp"

namespace {

using namespace dashcam_merge;
using json = nlohmann::json;
using dashcam_merge::testing::TempDir;

json minimal_doc() {
  return json::parse(R"({
    "camera_paths": {"F": "/media/front", "R": "/media/rear"},
    "output_dir": "/media/merged",
    "video_pattern": "NO(\\d{8})-(\\d{6})-(\\d{6})([FR])\\.MP4",
    "ffmpeg_settings": {
      "copy_codec": {"video": "copy", "audio": "copy"},
      "reencode_settings": {
        "video_codec": "libx264",
        "audio_codec": "aac",
        "preset": "fast",
        "crf": "23"
      }
    }
  })");
}

bool throws_config_error(const json &doc) {
  try {
    parse_config(doc);
  } catch (const ConfigError &) {
    return true;
  }
  return false;
}

void TestDefaultsApplied() {
  MergerConfig cfg = parse_config(minimal_doc());
  assert(cfg.camera_paths.size() == 2);
  assert(cfg.camera_paths.at("F") == "/media/front");
  assert(cfg.output_dir == "/media/merged");
  assert(cfg.input_extension == ".MP4");
  assert(cfg.output_extension == "mp4");
  assert(cfg.ffmpeg_path == "ffmpeg");
  assert(cfg.copy.video_codec == "copy");
  assert(cfg.reencode.crf == "23");
  assert(cfg.reencode.threads == 0);
  assert(cfg.use_local_processing);
  assert(cfg.scratch_dir.filename() == "dashcam_merge");
  assert(cfg.max_parallel_jobs == 0);
  assert(cfg.camera_name("F") == "F");
}

void TestOptionalFieldsParsed() {
  json doc = minimal_doc();
  doc["camera_names"] = {{"F", "Front"}, {"R", "Rear"}};
  doc["input_extension"] = "mp4";
  doc["output_extension"] = ".mkv";
  doc["ffmpeg_path"] = "/opt/ffmpeg/bin/ffmpeg";
  doc["ffmpeg_settings"]["reencode_settings"]["crf"] = 20;
  doc["ffmpeg_settings"]["reencode_settings"]["threads"] = 4;
  doc["performance_settings"] = {{"use_local_processing", false},
                                 {"scratch_dir", "/fast/scratch"},
                                 {"max_parallel_jobs", 2}};

  MergerConfig cfg = parse_config(doc);
  assert(cfg.camera_name("R") == "Rear");
  assert(cfg.input_extension == ".mp4");
  assert(cfg.output_extension == "mkv");
  assert(cfg.ffmpeg_path == "/opt/ffmpeg/bin/ffmpeg");
  assert(cfg.reencode.crf == "20");
  assert(cfg.reencode.threads == 4);
  assert(!cfg.use_local_processing);
  assert(cfg.scratch_dir == "/fast/scratch");
  assert(cfg.max_parallel_jobs == 2);
}

void TestMissingRequiredFieldsRejected() {
  for (const char *key :
       {"camera_paths", "output_dir", "video_pattern", "ffmpeg_settings"}) {
    json doc = minimal_doc();
    doc.erase(std::string(key));
    assert(throws_config_error(doc));
  }

  json doc = minimal_doc();
  doc["ffmpeg_settings"]["reencode_settings"].erase(std::string("preset"));
  assert(throws_config_error(doc));

  doc = minimal_doc();
  doc["camera_paths"] = json::object();
  assert(throws_config_error(doc));

  assert(throws_config_error(json::array()));
}

void TestPatternGroupCountChecked() {
  json doc = minimal_doc();
  doc["video_pattern"] = "NO(\\d{8})-(\\d{6})-(\\d{6})[FR]\\.MP4";
  assert(throws_config_error(doc));

  doc["video_pattern"] = "NO((\\d{8})";
  assert(throws_config_error(doc));
}

void TestWrongTypesRejected() {
  json doc = minimal_doc();
  doc["output_dir"] = 42;
  assert(throws_config_error(doc));

  doc = minimal_doc();
  doc["performance_settings"] = {{"max_parallel_jobs", -1}};
  assert(throws_config_error(doc));

  doc = minimal_doc();
  doc["performance_settings"] = {{"use_local_processing", "yes"}};
  assert(throws_config_error(doc));

  doc = minimal_doc();
  doc["ffmpeg_settings"]["reencode_settings"]["threads"] = -2;
  assert(throws_config_error(doc));
}

void TestLoadConfigFromFile() {
  TempDir tmp;
  testing::write_file(tmp / "config.json", minimal_doc().dump(2));
  MergerConfig cfg = load_config(tmp / "config.json");
  assert(cfg.camera_paths.size() == 2);

  bool missing = false;
  try {
    load_config(tmp / "absent.json");
  } catch (const ConfigError &e) {
    missing = std::string(e.what()).find("not found") != std::string::npos;
  }
  assert(missing);

  testing::write_file(tmp / "broken.json", "{ \"camera_paths\": ");
  bool invalid = false;
  try {
    load_config(tmp / "broken.json");
  } catch (const ConfigError &e) {
    invalid = std::string(e.what()).find("JSON") != std::string::npos;
  }
  assert(invalid);
}

void TestEnvironmentHelpers() {
  ::setenv("DASHCAM_MERGE_TEST_INT", "7", 1);
  ::setenv("DASHCAM_MERGE_TEST_BAD", "7x", 1);
  assert(Config::get_env_int("DASHCAM_MERGE_TEST_INT", 1) == 7);
  assert(Config::get_env_int("DASHCAM_MERGE_TEST_BAD", 1) == 1);
  assert(Config::get_env_int("DASHCAM_MERGE_TEST_UNSET", 3) == 3);
  assert(Config::get_env_string("DASHCAM_MERGE_TEST_INT", "x") == "7");
  assert(Config::get_env_string("DASHCAM_MERGE_TEST_UNSET", "x") == "x");
}

} // namespace

int main() {
  TestDefaultsApplied();
  TestOptionalFieldsParsed();
  TestMissingRequiredFieldsRejected();
  TestPatternGroupCountChecked();
  TestWrongTypesRejected();
  TestLoadConfigFromFile();
  TestEnvironmentHelpers();

  std::cout << "dashcam_merge_unit_config: pass\n";
  return 0;
}
