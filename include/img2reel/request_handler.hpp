/**
 * @file request_handler.hpp
 * @brief Parameter normalization and request sequencing
 *
 * @details Independent of the HTTP library: the server layer flattens a
 *          request into RequestInputs, and gets back a status code and a
 *          JSON body. The handler sequences
 *
 *          validate -> stage source(s) -> orchestrate -> respond
 *
 *          and releases every staged input on every exit path.
 */

#ifndef IMG2REEL_REQUEST_HANDLER_HPP
#define IMG2REEL_REQUEST_HANDLER_HPP

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "content_fetcher.hpp"
#include "orchestrator.hpp"
#include "types.hpp"
#include "workspace.hpp"

namespace img2reel {

using FieldMap = std::map<std::string, std::string>;

// **---- Parameter bounds ----**

constexpr int MIN_DURATION_SEC = 1;
constexpr int MAX_DURATION_SEC = 90;
constexpr int DEFAULT_DURATION_SEC = 20;
constexpr int MIN_FPS = 1;
constexpr int MAX_FPS = 60;
constexpr int DEFAULT_FPS = 30;
constexpr int MIN_DIMENSION = 16;
constexpr int MAX_DIMENSION = 4096;
constexpr int DEFAULT_INTRO_DURATION_SEC = 1;

/**
 * @brief Parse a leading integer, ignoring trailing garbage ("12px" -> 12).
 * @return fallback when the text has no leading digits
 */
int parse_lenient_int(const std::string &text, int fallback);

/// Clamp to [lo, hi]
int clamp_int(int value, int lo, int hi);

/// Clamp to the dimension bounds and round down to an even value
int normalize_dimension(int value);

/**
 * @brief Resolve duration, fps, width and height from request fields.
 * @note Missing, non-numeric or out-of-range values never fail: they fall
 *       back to the default or the nearest bound.
 */
MediaParams resolve_media_params(const FieldMap &fields, int default_width,
                                 int default_height);

/// Resolve intro_duration (default 1) clamped to [0, max_intro_sec]
int resolve_intro_duration(const FieldMap &fields, int max_intro_sec);

// **---- Handler ----**

/**
 * @struct RequestInputs
 * @brief Transport-neutral view of one encode request.
 */
struct RequestInputs {
  FieldMap fields;                       //< Query and multipart text fields
  std::optional<UploadedFile> file;       //< Multipart "file"
  std::optional<UploadedFile> intro_file; //< Multipart "intro"
  std::string scheme = "http";           //< Public scheme for the URL
  std::string host;                      //< Public host[:port] for the URL
};

/**
 * @struct HandlerResponse
 */
struct HandlerResponse {
  int status = 200;
  nlohmann::json body;
};

struct HandlerOptions {
  int default_width = 1080;
  int default_height = 1920;
  int max_intro_duration_sec = 1;

  static HandlerOptions from_config();
};

/**
 * @class RequestHandler
 * @brief Sequences fetcher -> orchestrator and builds the response.
 */
class RequestHandler {
public:
  RequestHandler(ContentFetcher &fetcher, WorkspaceManager &workspace,
                 EncodeOrchestrator &orchestrator, HandlerOptions options);

  /**
   * @brief Serve POST /image-to-video.
   * @return 200 with the artifact description, or the mapped error status
   *         with {"ok":false,"error":...}
   */
  HandlerResponse handle(const RequestInputs &in);

  /// Body of GET /health
  static nlohmann::json health_body();

  /// {"ok":false,"error":message}
  static nlohmann::json error_body(const std::string &message);

private:
  ContentFetcher &fetcher_;
  WorkspaceManager &workspace_;
  EncodeOrchestrator &orchestrator_;
  HandlerOptions options_;

  bool stage_source(const std::string &tag, const std::string &url,
                    const std::optional<UploadedFile> &upload,
                    const std::string &label, StagedInput &out, Error &err);
};

} // namespace img2reel

#endif // IMG2REEL_REQUEST_HANDLER_HPP
