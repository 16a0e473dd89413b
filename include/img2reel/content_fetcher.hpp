/**
 * @file content_fetcher.hpp
 * @brief Bounded acquisition of source images into the work directory
 *
 * @details The ContentFetcher turns a remote URL or an uploaded file into a
 *          StagedInput, or fails with a classified Error:
 *
 *          - Upstream: network failure, deadline exceeded, redirect limit,
 *            non-2xx status
 *
 *          - Validation: content type / extension not allow-listed
 *
 *          - TooLarge: declared Content-Length or received bytes above the
 *            ceiling (both values in the message)
 *
 *          Body bytes go through a BodySink chosen by FetchStrategy:
 *
 *          - Streamed: each chunk is written to disk as it arrives; the
 *            transfer is aborted the moment the byte count passes the cap
 *
 *          - Buffered: the body is held in memory (never more than the cap)
 *            and written out once complete
 *
 *          On every failure path the partially written file is removed.
 */

#ifndef IMG2REEL_CONTENT_FETCHER_HPP
#define IMG2REEL_CONTENT_FETCHER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "types.hpp"
#include "url.hpp"
#include "workspace.hpp"

namespace img2reel {

/**
 * @brief Body acquisition strategy.
 */
enum class FetchStrategy { Buffered, Streamed };

/// Parse "buffered" / "streamed" (case-sensitive)
bool parse_fetch_strategy(const std::string &name, FetchStrategy &out);

/// Name of a strategy, used in logs
const char *to_string(FetchStrategy strategy);

/**
 * @struct FetchOptions
 * @brief Limits applied to every remote fetch.
 */
struct FetchOptions {
  uint64_t max_bytes = 25ull * 1024 * 1024; //< Byte ceiling
  int timeout_ms = 15000;                   //< Whole-fetch deadline
  int max_redirects = 3;                    //< Redirect hops followed
  FetchStrategy strategy = FetchStrategy::Streamed;

  /// Build from the process configuration
  static FetchOptions from_config();
};

/**
 * @class BodySink
 * @brief Destination for response body bytes.
 */
class BodySink {
public:
  virtual ~BodySink() = default;

  /// Prepare to receive bytes destined for path
  virtual bool open(const std::string &path, Error &err) = 0;

  /// Accept one chunk; the byte cap is enforced by the caller
  virtual bool write(const char *data, size_t len, Error &err) = 0;

  /// Make the complete body durable at path
  virtual bool commit(Error &err) = 0;

  /// Drop everything received and remove any partial file
  virtual void discard() noexcept = 0;
};

/**
 * @brief Create the sink implementing a strategy.
 * @param strategy Buffered or Streamed
 * @param workspace Used for best-effort removal of partial files
 */
std::unique_ptr<BodySink> make_body_sink(FetchStrategy strategy,
                                         WorkspaceManager &workspace);

/**
 * @class ContentFetcher
 * @brief Produces StagedInputs from URLs and uploads.
 * @note Stateless between calls; one instance serves all requests.
 */
class ContentFetcher {
public:
  ContentFetcher(FetchOptions options, WorkspaceManager &workspace);

  /**
   * @brief Download a remote image into the work directory.
   *
   * @param url Absolute http(s) URL
   * @param label Short label used in the temp file name
   * @param out Output: staged input on success
   * @param err Output: classified failure
   * @return true on success
   */
  bool fetch(const std::string &url, const std::string &label,
             StagedInput &out, Error &err);

  /**
   * @brief Materialize an uploaded file as a staged input.
   * @note Validates only the file name extension; size limits belong to
   *       the HTTP layer.
   */
  bool stage_upload(const UploadedFile &upload, const std::string &label,
                    StagedInput &out, Error &err);

  /**
   * @brief Check an upload file name against the allow-list.
   * @note Called before any fetch or encode work starts.
   */
  static bool validate_upload_name(const std::string &filename,
                                   ImageType &type, Error &err);

  const FetchOptions &options() const { return options_; }

private:
  /// Result of a single request in the redirect chain
  struct HopResult {
    bool redirect = false;
    std::string location;
  };

  bool fetch_hop(const Url &current, const Url &original,
                 const std::string &label,
                 std::chrono::steady_clock::time_point deadline,
                 HopResult &hop, StagedInput &out, Error &err);

  FetchOptions options_;
  WorkspaceManager &workspace_;
};

} // namespace img2reel

#endif // IMG2REEL_CONTENT_FETCHER_HPP
