/**
 * @file types.hpp
 * @brief Core data types shared by every stage of the reel pipeline
 *
 * @details Contains the value types that flow between the fetcher, the
 *          workspace, the orchestrator and the request handler:
 *
 *          - Error / ErrorKind for classified failures
 *
 *          - MediaParams for the resolved per-request encode parameters
 *
 *          - StagedInput for a validated local copy of a source image
 *
 *          - VideoArtifact for a published output file
 */

#ifndef IMG2REEL_TYPES_HPP
#define IMG2REEL_TYPES_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace img2reel {

// **----- ERRORS -----**

/**
 * @brief Failure classes, used to pick the HTTP status and to decide whether
 *        a failure is worth retrying on the client side.
 */
enum class ErrorKind {
  None,        //< No error recorded
  ClientInput, //< Missing source, conflicting sources, bad URL
  Validation,  //< Disallowed media type, unreadable image
  TooLarge,    //< Declared or received size above the byte ceiling
  Upstream,    //< Network failure, timeout, redirect limit, HTTP status
  Encode,      //< Encoder process failure or bad artifact
  Internal     //< Local filesystem or entropy failure
};

/**
 * @struct Error
 * @brief Classified failure filled in by every fallible operation.
 */
struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;

  bool is_set() const { return kind != ErrorKind::None; }

  void set(ErrorKind k, std::string msg) {
    kind = k;
    message = std::move(msg);
  }
};

/// Short lowercase name of an error kind, used in logs
const char *to_string(ErrorKind kind);

/// HTTP status code a failure of this kind is reported with
int http_status_for(ErrorKind kind);

// **----- MEDIA -----**

/**
 * @brief Image formats accepted as sources.
 */
enum class ImageType { Jpeg, Png };

/// Canonical file extension (with dot) for an image type
const char *extension_for(ImageType type);

/**
 * @struct MediaParams
 * @brief Resolved encode parameters after clamping.
 */
struct MediaParams {
  int duration_sec = 20; //< Main clip length, [1, 90]
  int fps = 30;          //< Output frame rate, [1, 60]
  int width = 1080;      //< Output width in pixels (even)
  int height = 1920;     //< Output height in pixels (even)
};

/**
 * @struct UploadedFile
 * @brief A multipart file already held in memory by the HTTP layer.
 * @note Non-owning: the request object outlives the handler call.
 */
struct UploadedFile {
  std::string filename;
  std::string_view content; //< Borrowed from the HTTP request body
};

/**
 * @struct StagedInput
 * @brief A validated local copy of a source image.
 * @note Owned by the request that created it and released before the
 *       request returns.
 */
struct StagedInput {
  std::string path;                 //< Absolute path inside the work directory
  ImageType type = ImageType::Jpeg; //< Allow-listed format
  uint64_t size_bytes{};            //< Bytes written to disk
};

/**
 * @struct VideoArtifact
 * @brief A finished, published video.
 */
struct VideoArtifact {
  std::string id;          //< Random UUID v4
  std::string filename;    //< reel-<id>.mp4
  std::string path;        //< Absolute path inside the output directory
  std::string public_path; //< /videos/<filename>
};

} // namespace img2reel

#endif // IMG2REEL_TYPES_HPP
