/**
 * @file media_probe.cpp
 * @brief Container duration probing implementation
 */

#include "dashcam_merge/media_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/log.h>
}

namespace dashcam_merge {

namespace {

/// Owns an opened AVFormatContext.
class FormatInput {
public:
  FormatInput() = default;
  ~FormatInput() {
    if (ctx_)
      avformat_close_input(&ctx_);
  }

  FormatInput(const FormatInput &) = delete;
  FormatInput &operator=(const FormatInput &) = delete;

  bool open(const char *path) {
    return avformat_open_input(&ctx_, path, nullptr, nullptr) >= 0;
  }

  AVFormatContext *get() const { return ctx_; }

private:
  AVFormatContext *ctx_ = nullptr;
};

} // anonymous namespace

std::optional<double> probe_duration(const std::filesystem::path &path) {
  /// Probe errors are reported by the caller, keep libav quiet
  av_log_set_level(AV_LOG_QUIET);

  FormatInput input;
  if (!input.open(path.c_str()))
    return std::nullopt;

  /// Some containers only expose duration after reading stream info
  if (input.get()->duration == AV_NOPTS_VALUE &&
      avformat_find_stream_info(input.get(), nullptr) < 0)
    return std::nullopt;

  if (input.get()->duration == AV_NOPTS_VALUE || input.get()->duration < 0)
    return std::nullopt;

  return static_cast<double>(input.get()->duration) / AV_TIME_BASE;
}

} // namespace dashcam_merge
