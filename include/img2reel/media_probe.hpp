/**
 * @file media_probe.hpp
 * @brief libav-based inspection of staged inputs and finished artifacts
 *
 * @details Used on both ends of the pipeline:
 *
 *          - before encoding, to reject sources that carry an allowed
 *            extension or content type but are not decodable images
 *
 *          - after encoding, to confirm the artifact has the requested
 *            dimensions and a video stream before it is published
 *
 *          - at startup, to check the configured encoder is compiled in
 */

#ifndef IMG2REEL_MEDIA_PROBE_HPP
#define IMG2REEL_MEDIA_PROBE_HPP

#include <string>

#include "types.hpp"

namespace img2reel {

/**
 * @struct MediaInfo
 * @brief Properties of the best video stream of a file.
 */
struct MediaInfo {
  int width = 0;
  int height = 0;
  double duration_sec = 0.0; //< Container duration, 0 when unknown
  double fps = 0.0;          //< Guessed frame rate, 0 when unknown
  std::string codec_name;    //< Decoder name ("png", "mjpeg", "h264")
  bool has_audio = false;
};

/**
 * @brief Open a file with libavformat and read its video stream info.
 *
 * @param path File to inspect
 * @param info Output: stream properties
 * @param err Output: Validation error when the file has no decodable video
 * @return true on success
 */
bool probe_media(const std::string &path, MediaInfo &info, Error &err);

/**
 * @brief True if libavcodec knows an encoder by this name.
 */
bool encoder_available(const std::string &name);

/**
 * @brief Limit libav's own console output to errors.
 */
void quiet_libav_logging();

} // namespace img2reel

#endif // IMG2REEL_MEDIA_PROBE_HPP
