/**
 * @file main.cpp
 * @brief Entry point for the dashcam merger
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Configuration loading (exit 1 on failure)
 *
 *          - Catalog scan, optional date filter and per-group info display
 *
 *          - Concurrent merge with live progress, final summary
 *
 * @note Exit codes: 0 when the run completes (even if some groups failed),
 *       1 on configuration or argument errors, 130 when interrupted.
 *       Set PARALLEL_JOBS to cap concurrent merges.
 */

#include <atomic>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "dashcam_merge/batch_merger.hpp"
#include "dashcam_merge/catalog.hpp"
#include "dashcam_merge/config.hpp"
#include "dashcam_merge/filename_parser.hpp"
#include "dashcam_merge/logging.hpp"
#include "dashcam_merge/progress.hpp"
#include "dashcam_merge/progress_reporter.hpp"

using namespace dashcam_merge;

namespace {

constexpr const char *VERSION = "1.0.0";

std::atomic<bool> g_stop{false};

void handle_interrupt(int) { g_stop.store(true); }

void install_interrupt_handlers() {
  struct sigaction sa {};
  sa.sa_handler = handle_interrupt;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

struct Options {
  std::string config_path;
  std::string target_date;
  bool show_info = true;
};

void print_usage(const char *prog) {
  fmt::print("Usage: {} [-c CONFIG] [-d YYYYMMDD] [--no-info]\n\n"
             "Merge fragmented dashcam clips into one file per date and "
             "camera.\n\n"
             "  -c, --config PATH   configuration file "
             "(default: config/config.json)\n"
             "  -d, --date DATE     merge only this date (YYYYMMDD)\n"
             "      --no-info       do not print per-group file information\n"
             "      --version       print version and exit\n"
             "  -h, --help          show this help\n",
             prog);
}

bool is_date(const std::string &s) {
  if (s.size() != 8)
    return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

void print_config_info(const MergerConfig &config) {
  LOG_INFO("Configured camera paths:");
  for (const auto &[camera, path] : config.camera_paths) {
    LOG_INFO("  {} camera ({}): {}", config.camera_name(camera), camera,
             path.string());
  }
  LOG_INFO("Output directory: {}", config.output_dir.string());
}

void print_group_info(const Group &group, const MergerConfig &config) {
  GroupInfo info = describe_group(group, true, &g_stop);
  if (info.interrupted)
    return;
  LOG_PHASE("--- {} {} camera ({}) ---", format_date(group.date),
            config.camera_name(group.camera), group.camera);
  LOG_INFO("  Start time: {}", info.start_time);
  LOG_INFO("  End time:   {}", info.end_time);
  LOG_INFO("  Files:      {}", info.file_count);
  LOG_INFO("  Total size: {:.1f} MB", info.total_size_mb);
  if (info.unprobed < static_cast<int>(info.file_count)) {
    LOG_INFO("  Duration:   {}", format_duration(info.duration_sec));
  }
  if (info.unprobed > 0) {
    LOG_WARN("  {} clip(s) could not be probed for duration", info.unprobed);
  }
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  Options opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      opts.config_path = argv[++i];
    } else if ((arg == "-d" || arg == "--date") && i + 1 < argc) {
      opts.target_date = argv[++i];
    } else if (arg == "--no-info") {
      opts.show_info = false;
    } else if (arg == "--version") {
      fmt::print("dashcam_merge {}\n", VERSION);
      return 0;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      LOG_ERROR("Unknown or incomplete argument: {}", arg);
      print_usage(argv[0]);
      return 1;
    }
  }

  if (!opts.target_date.empty() && !is_date(opts.target_date)) {
    LOG_ERROR("Date must be YYYYMMDD, got '{}'", opts.target_date);
    return 1;
  }

  // **---- CONFIGURATION ----**

  namespace fs = std::filesystem;
  fs::path config_path = opts.config_path.empty()
                             ? default_config_path()
                             : fs::path(opts.config_path);

  MergerConfig config;
  try {
    config = load_config(config_path);
  } catch (const ConfigError &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  std::error_code ec;
  fs::create_directories(config.output_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}",
              config.output_dir.string(), ec.message());
    return 1;
  }

  install_interrupt_handlers();

  // **---- CATALOG ----**

  FilenameParser parser(config.video_pattern);
  CatalogBuilder builder(parser, config.input_extension);

  TIMER_START(catalog_scan);
  Catalog catalog = builder.build(config.camera_paths);
  TIMER_END(catalog_scan);

  const CatalogStats &stats = builder.stats();
  LOG_INFO("Scanned {} camera(s), {} clip(s) accepted", stats.cameras_scanned,
           stats.clips_accepted);
  if (stats.names_unmatched > 0 || stats.camera_mismatch > 0) {
    LOG_INFO("Skipped {} unrecognized name(s), {} clip(s) in the wrong camera "
             "directory",
             stats.names_unmatched, stats.camera_mismatch);
  }

  if (catalog.empty()) {
    LOG_WARN("No video files to merge were found");
    return 0;
  }

  print_config_info(config);

  if (!opts.target_date.empty()) {
    catalog = filter_by_date(catalog, opts.target_date);
    if (catalog.empty()) {
      LOG_WARN("No video files found for date {}",
               format_date(opts.target_date));
      return 0;
    }
    LOG_INFO("Target date: {}", format_date(opts.target_date));
  } else {
    LOG_INFO("Dates found: {}", catalog.size());
  }

  std::vector<Group> groups = flatten(catalog);

  if (opts.show_info) {
    for (const auto &group : groups) {
      if (g_stop.load()) {
        LOG_WARN("Interrupted during file information display");
        break;
      }
      print_group_info(group, config);
    }
  }

  // **---- MERGE ----**

  int parallel = Config::parallel_jobs() >= 0 ? Config::parallel_jobs()
                                              : config.max_parallel_jobs;

  ProgressAggregator progress;
  BatchMerger merger(config, progress, parallel, &g_stop);
  ProgressReporter reporter(
      progress, std::chrono::milliseconds(Config::progress_interval_ms()),
      parse_progress_style(Config::progress_style()));

  if (Config::show_progress())
    reporter.start();

  BatchSummary summary = merger.run(groups);

  if (Config::show_progress()) {
    reporter.stop();
    fmt::print("\n");
  }

  merger.print_summary(summary);

  if (Config::show_timing())
    TimingCollector::print_summary();

  if (summary.interrupted) {
    LOG_WARN("Interrupted");
    return 130;
  }
  return 0;
}
