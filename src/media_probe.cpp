/**
 * @file media_probe.cpp
 * @brief Media inspection implementation
 */

#include "img2reel/media_probe.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/log.h>
}

#include <fmt/core.h>

namespace img2reel {

namespace {

/// Closes the format context on scope exit
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

std::string av_error_string(int code) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, buf, sizeof(buf));
  return buf;
}

} // anonymous namespace

bool probe_media(const std::string &path, MediaInfo &info, Error &err) {
  FormatContextGuard guard;

  int ret = avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    err.set(ErrorKind::Validation,
            fmt::format("Source is not a readable image ({})",
                        av_error_string(ret)));
    return false;
  }

  ret = avformat_find_stream_info(guard.ctx, nullptr);
  if (ret < 0) {
    err.set(ErrorKind::Validation,
            fmt::format("Source has no decodable stream info ({})",
                        av_error_string(ret)));
    return false;
  }

  int video_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    err.set(ErrorKind::Validation, "No image or video stream found");
    return false;
  }

  AVStream *stream = guard.ctx->streams[video_idx];
  const AVCodecParameters *par = stream->codecpar;
  if (par->width <= 0 || par->height <= 0) {
    err.set(ErrorKind::Validation, "Image has no usable dimensions");
    return false;
  }

  info.width = par->width;
  info.height = par->height;
  info.codec_name = avcodec_get_name(par->codec_id);

  AVRational rate = av_guess_frame_rate(guard.ctx, stream, nullptr);
  info.fps = (rate.num > 0 && rate.den > 0) ? av_q2d(rate) : 0.0;
  info.duration_sec = guard.ctx->duration > 0
                          ? static_cast<double>(guard.ctx->duration) /
                                AV_TIME_BASE
                          : 0.0;

  info.has_audio = av_find_best_stream(guard.ctx, AVMEDIA_TYPE_AUDIO, -1, -1,
                                       nullptr, 0) >= 0;
  return true;
}

bool encoder_available(const std::string &name) {
  return avcodec_find_encoder_by_name(name.c_str()) != nullptr;
}

void quiet_libav_logging() { av_log_set_level(AV_LOG_ERROR); }

} // namespace img2reel
