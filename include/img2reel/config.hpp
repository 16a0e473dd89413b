/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          See config/img2reel.env for detailed documentation of each
 *          parameter. Every value is resolved once and is immutable for the
 *          process lifetime; Config::validate() forces resolution at startup
 *          so malformed values fail before the server starts listening.
 *
 */

#ifndef IMG2REEL_CONFIG_HPP
#define IMG2REEL_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace img2reel {
namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::invalid_argument / std::out_of_range on malformed values
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoi(val) : default_val;
}

/**
 * @brief Get an unsigned 64-bit value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed value or default
 */
inline uint64_t get_env_u64(const char *name, uint64_t default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::stoull(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- SERVER ----**

/// TCP port the HTTP server listens on
inline int port() {
  static int val = get_env_int("PORT", 3001);
  return val;
}

/// Bind address
inline const std::string &listen_addr() {
  static std::string val = get_env_string("LISTEN_ADDR", "0.0.0.0");
  return val;
}

/// HTTP worker threads
inline int server_threads() {
  static int val = get_env_int("SERVER_THREADS", 8);
  return val;
}

/// Maximum multipart payload accepted by the HTTP layer
inline uint64_t max_upload_bytes() {
  static uint64_t val = get_env_u64("MAX_UPLOAD_BYTES", 25ull * 1024 * 1024);
  return val;
}

// **---- STORAGE ----**

/// Public output directory (served under /videos)
inline const std::string &video_dir() {
  static std::string val = get_env_string("VIDEO_DIR", "/app/data/videos");
  return val;
}

/**
 * @brief Directory for staged inputs and intermediate segments.
 * @note Never exposed over HTTP. Defaults to the system temp directory.
 */
inline const std::string &work_dir() {
  static std::string val = get_env_string(
      "WORK_DIR", std::filesystem::temp_directory_path().string());
  return val;
}

// **---- FETCH ----**

/// Hard byte ceiling for remote sources (25 MB)
inline uint64_t max_image_bytes() {
  static uint64_t val = get_env_u64("MAX_IMAGE_BYTES", 25ull * 1024 * 1024);
  return val;
}

/// Whole-fetch deadline in milliseconds
inline int download_timeout_ms() {
  static int val = get_env_int("DOWNLOAD_TIMEOUT_MS", 15000);
  return val;
}

/// Maximum redirect hops followed per fetch
inline int max_redirects() {
  static int val = get_env_int("MAX_REDIRECTS", 3);
  return val;
}

/**
 * @brief Acquisition strategy: "streamed" or "buffered"
 * @note streamed writes chunks to disk as they arrive and is the right choice
 *       whenever many requests run at once; buffered holds up to
 *       MAX_IMAGE_BYTES per request in memory.
 */
inline const std::string &fetch_strategy() {
  static std::string val = get_env_string("FETCH_STRATEGY", "streamed");
  return val;
}

// **---- ENCODER ----**

/// Encoder profile: "baseline" or "compressed"
inline const std::string &encode_profile() {
  static std::string val = get_env_string("ENCODE_PROFILE", "compressed");
  return val;
}

/// Video codec for the compressed profile ('libx264' or 'libx265')
inline const std::string &video_codec() {
  static std::string val = get_env_string("VIDEO_CODEC", "libx264");
  return val;
}

/// Constant rate factor: 18 (best) .. 30 (smallest)
inline int video_crf() {
  static int val = get_env_int("VIDEO_CRF", 26);
  return val;
}

/// Speed/quality preset (ultrafast..veryslow)
inline const std::string &video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "slow");
  return val;
}

/// Peak bitrate cap in kbit/s
inline int video_maxrate_kbps() {
  static int val = get_env_int("VIDEO_MAXRATE_KBPS", 2500);
  return val;
}

/// VBV buffer size in kbit/s
inline int video_bufsize_kbps() {
  static int val = get_env_int("VIDEO_BUFSIZE_KBPS", 5000);
  return val;
}

/// GOP size in frames
inline int video_keyint() {
  static int val = get_env_int("VIDEO_KEYINT", 240);
  return val;
}

/// Mono AAC bitrate for the compressed profile
inline int audio_bitrate_kbps() {
  static int val = get_env_int("AUDIO_BR_KBPS", 64);
  return val;
}

/// Pad color around the fitted image
inline const std::string &background_color() {
  static std::string val = get_env_string("BACKGROUND_COLOR", "black");
  return val;
}

/// Encoder binary, resolved through PATH when not absolute
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/**
 * @brief Watchdog for a single encoder invocation, in seconds
 * @note 0 disables the watchdog.
 */
inline int encode_timeout_sec() {
  static int val = get_env_int("ENCODE_TIMEOUT_SEC", 300);
  return val;
}

/**
 * @brief Number of encoder processes allowed to run at once
 * @note 0 = auto-detect from the container CPU limit.
 */
inline int encode_workers() {
  static int val = get_env_int("ENCODE_WORKERS", 0);
  return val;
}

// **---- REQUEST DEFAULTS ----**

/// Default output width
inline int default_width() {
  static int val = get_env_int("TARGET_WIDTH", 1080);
  return val;
}

/// Default output height
inline int default_height() {
  static int val = get_env_int("TARGET_HEIGHT", 1920);
  return val;
}

/**
 * @brief Upper clamp for the intro segment duration, in seconds
 * @note Kept configurable: deployments have used both 1s stings and
 *       multi-second title cards.
 */
inline int max_intro_duration_sec() {
  static int val = get_env_int("MAX_INTRO_DURATION_SEC", 1);
  return val;
}

/**
 * @brief Resolve and range-check every value above.
 * @note Logs each problem found; called once before the server starts.
 * @return true if the configuration is usable
 */
bool validate();

/**
 * @brief Log the resolved configuration at startup.
 */
void print_summary();

} // namespace Config
} // namespace img2reel

#endif // IMG2REEL_CONFIG_HPP
