/**
 * @file orchestrator.hpp
 * @brief Encode orchestration: staged image(s) in, published artifact out
 *
 * @details The EncodeOrchestrator runs one request's encode workflow:
 *
 *          1. Verify and probe the staged input(s)
 *
 *          2. Generate the artifact identifier
 *
 *          3. Encode the main clip (and the intro clip, concurrently) into
 *             the work directory
 *
 *          4. Stream-copy concatenate intro + main when an intro is given
 *
 *          5. Probe the result against the requested dimensions
 *
 *          6. Publish through the WorkspaceManager (purge + move)
 *
 * @note Intermediate files are owned by TempFileGuards and removed on every
 *       exit path; only the published artifact survives.
 */

#ifndef IMG2REEL_ORCHESTRATOR_HPP
#define IMG2REEL_ORCHESTRATOR_HPP

#include <optional>
#include <string>

#include "encode_queue.hpp"
#include "filter_graph.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "workspace.hpp"

namespace img2reel {

/**
 * @struct ReelRequest
 * @brief Everything the orchestrator needs for one encode.
 */
struct ReelRequest {
  std::string tag;                  //< Log prefix, "[Req 1a2b3c4d]"
  StagedInput main;                 //< Main still image
  std::optional<StagedInput> intro; //< Optional intro still image
  int intro_duration_sec = 0;       //< Intro clip length (> 0 with intro)
  MediaParams media;                //< Clamped dimensions, fps, duration
};

/**
 * @class EncodeOrchestrator
 * @brief Builds encode jobs, runs them on the queue and publishes.
 */
class EncodeOrchestrator {
public:
  EncodeOrchestrator(EncodeQueue &queue, WorkspaceManager &workspace,
                     CodecProfile profile);

  /**
   * @brief Produce and publish one artifact.
   *
   * @param req Staged inputs and parameters
   * @param timings Stage timings of the request (probe, encode, publish)
   * @param out Output: published artifact
   * @param err Output: Validation for unreadable inputs, Encode for
   *            encoder failures, Internal for filesystem failures
   * @return true on success
   */
  bool produce(const ReelRequest &req, StageTimings &timings,
               VideoArtifact &out, Error &err);

  const CodecProfile &profile() const { return profile_; }

private:
  EncodeQueue &queue_;
  WorkspaceManager &workspace_;
  CodecProfile profile_;

  bool check_input(const ReelRequest &req, const StagedInput &input,
                   Error &err) const;

  EncodeJob still_clip_job(const ReelRequest &req, const std::string &label,
                           const StagedInput &input, int duration_sec,
                           const std::string &output) const;

  bool verify_artifact(const ReelRequest &req, const std::string &path,
                       Error &err) const;

  /// Encoder error text with workspace paths removed
  std::string public_error(const std::string &message) const;
};

} // namespace img2reel

#endif // IMG2REEL_ORCHESTRATOR_HPP
