/**
 * @file media_probe.cpp
 * @brief libavformat probing implementation
 */

#include "vidcap/media_probe.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
}

#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

MediaProbe::~MediaProbe() {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);
}

bool MediaProbe::open(const std::string &path) {
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);

  int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_open_input failed for {}: {}", path,
              av_error_string(ret));
    return false;
  }

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}: {}", path,
              av_error_string(ret));
    return false;
  }
  return true;
}

double MediaProbe::duration() const {
  if (!fmt_ctx || fmt_ctx->duration == AV_NOPTS_VALUE ||
      fmt_ctx->duration <= 0)
    return 0.0;
  return static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
}

bool MediaProbe::video_size(ImageSize &out) const {
  if (!fmt_ctx)
    return false;

  int idx = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (idx < 0)
    return false;

  const AVCodecParameters *par = fmt_ctx->streams[idx]->codecpar;
  if (par->width <= 0 || par->height <= 0)
    return false;

  out.width = par->width;
  out.height = par->height;
  return true;
}

bool probe_duration(const std::string &path, double &seconds) {
  MediaProbe probe;
  if (!probe.open(path))
    return false;
  double d = probe.duration();
  if (d <= 0) {
    LOG_ERROR("Could not determine duration of {}", path);
    return false;
  }
  seconds = d;
  return true;
}

bool probe_image_size(const std::string &path, ImageSize &size) {
  MediaProbe probe;
  if (!probe.open(path))
    return false;
  if (!probe.video_size(size)) {
    LOG_ERROR("No image stream found in {}", path);
    return false;
  }
  return true;
}

} // namespace vidcap
