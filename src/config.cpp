/**
 * @file config.cpp
 * @brief Startup validation and summary of the environment configuration
 */

#include "img2reel/config.hpp"

#include <exception>

#include "img2reel/content_fetcher.hpp"
#include "img2reel/filter_graph.hpp"
#include "img2reel/logging.hpp"
#include "img2reel/media_probe.hpp"
#include "img2reel/request_handler.hpp"
#include "img2reel/system.hpp"

namespace img2reel {
namespace Config {

namespace {

bool check_range(const char *name, long long value, long long lo,
                 long long hi) {
  if (value < lo || value > hi) {
    LOG_ERROR("{}={} is out of range [{}, {}]", name, value, lo, hi);
    return false;
  }
  return true;
}

} // anonymous namespace

bool validate() {
  bool ok = true;

  try {
    ok &= check_range("PORT", port(), 0, 65535);
    ok &= check_range("SERVER_THREADS", server_threads(), 1, 1024);
    ok &= check_range("MAX_UPLOAD_BYTES", static_cast<long long>(max_upload_bytes()),
                      1, 1LL << 32);
    ok &= check_range("MAX_IMAGE_BYTES", static_cast<long long>(max_image_bytes()),
                      1, 1LL << 32);
    ok &= check_range("DOWNLOAD_TIMEOUT_MS", download_timeout_ms(), 1,
                      600000);
    ok &= check_range("MAX_REDIRECTS", max_redirects(), 0, 20);

    FetchStrategy strategy;
    if (!parse_fetch_strategy(fetch_strategy(), strategy)) {
      LOG_ERROR("FETCH_STRATEGY must be 'streamed' or 'buffered' (got '{}')",
                fetch_strategy());
      ok = false;
    }

    ProfileKind profile;
    if (!parse_profile_kind(encode_profile(), profile)) {
      LOG_ERROR("ENCODE_PROFILE must be 'baseline' or 'compressed' (got '{}')",
                encode_profile());
      ok = false;
    }

    if (video_codec() != "libx264" && video_codec() != "libx265") {
      LOG_ERROR("VIDEO_CODEC must be 'libx264' or 'libx265' (got '{}')",
                video_codec());
      ok = false;
    } else if (!encoder_available(video_codec())) {
      LOG_ERROR("VIDEO_CODEC '{}' is not available in the linked FFmpeg "
                "libraries",
                video_codec());
      ok = false;
    }
    if (!is_known_preset(video_preset())) {
      LOG_ERROR("VIDEO_PRESET '{}' is not a known x264/x265 preset",
                video_preset());
      ok = false;
    }

    ok &= check_range("VIDEO_CRF", video_crf(), 0, 51);
    ok &= check_range("VIDEO_MAXRATE_KBPS", video_maxrate_kbps(), 1, 200000);
    ok &= check_range("VIDEO_BUFSIZE_KBPS", video_bufsize_kbps(), 1, 400000);
    ok &= check_range("VIDEO_KEYINT", video_keyint(), 1, 10000);
    ok &= check_range("AUDIO_BR_KBPS", audio_bitrate_kbps(), 8, 512);
    ok &= check_range("ENCODE_TIMEOUT_SEC", encode_timeout_sec(), 0, 86400);
    ok &= check_range("ENCODE_WORKERS", encode_workers(), 0, 256);
    ok &= check_range("TARGET_WIDTH", default_width(), MIN_DIMENSION,
                      MAX_DIMENSION);
    ok &= check_range("TARGET_HEIGHT", default_height(), MIN_DIMENSION,
                      MAX_DIMENSION);
    ok &= check_range("MAX_INTRO_DURATION_SEC", max_intro_duration_sec(), 0,
                      MAX_DURATION_SEC);

    if (background_color().empty()) {
      LOG_ERROR("BACKGROUND_COLOR must not be empty");
      ok = false;
    }
    if (video_dir().empty() || work_dir().empty()) {
      LOG_ERROR("VIDEO_DIR and WORK_DIR must not be empty");
      ok = false;
    }
  } catch (const std::exception &e) {
    LOG_ERROR("Malformed configuration value: {}", e.what());
    return false;
  }

  return ok;
}

void print_summary() {
  LOG_PHASE("img2reel configuration");
  LOG_INFO("Listen:       {}:{} ({} threads)", listen_addr(), port(),
           server_threads());
  LOG_INFO("Video dir:    {}", video_dir());
  LOG_INFO("Work dir:     {}", work_dir());
  LOG_INFO("Fetch:        {} cap={} bytes timeout={}ms redirects={}",
           fetch_strategy(), max_image_bytes(), download_timeout_ms(),
           max_redirects());
  LOG_INFO("Uploads:      cap={} bytes", max_upload_bytes());
  LOG_INFO("Profile:      {} codec={} crf={} preset={} maxrate={}k "
           "bufsize={}k keyint={} audio={}k",
           encode_profile(), video_codec(), video_crf(), video_preset(),
           video_maxrate_kbps(), video_bufsize_kbps(), video_keyint(),
           audio_bitrate_kbps());
  LOG_INFO("Defaults:     {}x{} background={} intro<= {}s", default_width(),
           default_height(), background_color(), max_intro_duration_sec());
  LOG_INFO("Encoder:      {} workers={} timeout={}s", ffmpeg_path(),
           calculate_encode_workers(), encode_timeout_sec());
}

} // namespace Config
} // namespace img2reel
