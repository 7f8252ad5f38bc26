/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details LOG_* macros print one coloured line under log_mutex and flush.
 *          The progress reporter and the summary tables draw under the same
 *          mutex, so output from merge workers never interleaves.
 *
 *          TIMER_START / TIMER_END and TimingCollector time the catalog scan
 *          and every merge tier; SHOW_TIMING=1 prints the table at exit.
 */

#ifndef DASHCAM_MERGE_LOGGING_HPP
#define DASHCAM_MERGE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace dashcam_merge {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
/// One log line under log_mutex; `style` may be an empty fmt::text_style.
#define DASHCAM_MERGE_LOG(style, prefix, format_str, ...)                      \
  do {                                                                         \
    std::lock_guard<std::mutex> dm_log_lock(dashcam_merge::log_mutex);         \
    fmt::print(style, prefix format_str "\n", ##__VA_ARGS__);                  \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  DASHCAM_MERGE_LOG(fmt::text_style(), "[INFO] ", format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  DASHCAM_MERGE_LOG(fmt::fg(fmt::color::yellow), "[WARN] ", format_str,       \
                    ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  DASHCAM_MERGE_LOG(fmt::fg(fmt::color::red), "[ERROR] ", format_str,         \
                    ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  DASHCAM_MERGE_LOG(fmt::fg(fmt::color::cyan), "", format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  DASHCAM_MERGE_LOG(fmt::fg(fmt::color::green), "", format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @struct TimingEntry
 * @brief One timed step: the catalog scan or a single merge tier attempt.
 */
struct TimingEntry {
  std::string name;  //< e.g. "catalog_scan", "20250906 F stream copy"
  long microseconds;
};

/**
 * @class TimingCollector
 * @brief Process-wide, thread-safe store of TimingEntry records.
 * @note Merge workers record concurrently; print_summary() is called once,
 *       after every worker has joined.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /// Table of every entry, then the summed time per merge tier.
  static void print_summary();

  static size_t size();
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::high_resolution_clock::now();         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    dashcam_merge::TimingCollector::record(#name, timer_duration_##name);      \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_LOGGING_HPP
