/**
 * @file progress_reporter.hpp
 * @brief Background loop that renders ProgressAggregator snapshots
 *
 * @details The reporter owns one thread that wakes every interval, takes a
 *          snapshot and draws it. stop() signals the thread through a
 *          condition variable and joins it, so the join waits at most for
 *          one in-flight render.
 */

#ifndef DASHCAM_MERGE_PROGRESS_REPORTER_HPP
#define DASHCAM_MERGE_PROGRESS_REPORTER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "progress.hpp"

namespace dashcam_merge {

/**
 * @enum ProgressStyle
 * @brief How a snapshot is drawn.
 */
enum class ProgressStyle {
  Simple, //< One line, rewritten in place
  Bar     //< Screen redraw with a box per group
};

/// "bar" -> Bar, anything else -> Simple
ProgressStyle parse_progress_style(const std::string &name);

/// "42s", "3m5s", "1h20m"
std::string format_duration(double seconds);

/// Text bar of `width` cells filled to `percentage`
std::string render_bar(double percentage, int width = 40);

/// One-line rendering of a snapshot (no trailing newline)
std::string render_simple(const ProgressSnapshot &snap);

/// Multi-line rendering of a snapshot (ANSI clear-screen prefix included)
std::string render_boxes(const ProgressSnapshot &snap);

/**
 * @class ProgressReporter
 * @brief Periodic snapshot-and-render task with cooperative stop.
 */
class ProgressReporter {
public:
  using Sink = std::function<void(const ProgressSnapshot &)>;

  /**
   * @param aggregator Source of snapshots (must outlive the reporter)
   * @param interval Poll interval
   * @param sink Called with each snapshot from the reporter thread
   */
  ProgressReporter(const ProgressAggregator &aggregator,
                   std::chrono::milliseconds interval, Sink sink);

  /// Reporter that writes to stdout in the given style
  ProgressReporter(const ProgressAggregator &aggregator,
                   std::chrono::milliseconds interval, ProgressStyle style);

  ~ProgressReporter();

  ProgressReporter(const ProgressReporter &) = delete;
  ProgressReporter &operator=(const ProgressReporter &) = delete;

  /// Start the render thread. No-op if already running.
  void start();

  /**
   * @brief Signal the thread and join it. Safe to call more than once.
   * @note Renders one last frame so the final state is on screen.
   */
  void stop();

  bool running() const;

  /// Number of frames rendered so far.
  long frames() const;

private:
  const ProgressAggregator &aggregator_;
  std::chrono::milliseconds interval_;
  Sink sink_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  long frames_ = 0;
  std::thread thread_;

  void loop();
  void render_once();
};

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_PROGRESS_REPORTER_HPP
