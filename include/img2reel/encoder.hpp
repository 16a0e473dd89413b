/**
 * @file encoder.hpp
 * @brief Encoder capability interface
 *
 * @details The orchestrator describes work as EncodeJobs and hands them to an
 *          Encoder. FfmpegEncoder runs the ffmpeg binary; tests substitute
 *          fakes. An Encoder must either produce a complete, playable file
 *          at job.output_path or fail with the reason in the outcome.
 */

#ifndef IMG2REEL_ENCODER_HPP
#define IMG2REEL_ENCODER_HPP

#include <string>
#include <vector>

#include "filter_graph.hpp"
#include "types.hpp"

namespace img2reel {

/**
 * @brief What an encode job produces.
 */
enum class JobKind {
  StillClip, //< One looped still image -> clip with silent audio
  Concat     //< Stream-copy join of compatible clips
};

/**
 * @struct EncodeJob
 * @brief A single encoder invocation.
 */
struct EncodeJob {
  JobKind kind = JobKind::StillClip;
  std::vector<std::string> inputs; //< Still image, or clips to concatenate
  std::string output_path;         //< Destination in the work directory
  FilterGraph filters;             //< StillClip only
  CodecProfile profile;            //< StillClip only
  MediaParams media;               //< StillClip: dimensions and frame rate
  int duration_sec = 0;            //< StillClip: exact clip length
  std::string tag;                 //< Log prefix ("[Req 1a2b3c4d] intro")
};

/**
 * @struct EncodeOutcome
 * @brief Result of running one job.
 */
struct EncodeOutcome {
  bool ok = false;
  std::string error;   //< Encoder-reported failure text
  long elapsed_us = 0; //< Wall time of the invocation
};

/**
 * @class Encoder
 * @brief Applies a job's pipeline and profile to its inputs.
 * @note Implementations must be safe to call from several threads.
 */
class Encoder {
public:
  virtual ~Encoder() = default;

  /// Run the job to completion
  virtual EncodeOutcome run(const EncodeJob &job) = 0;
};

} // namespace img2reel

#endif // IMG2REEL_ENCODER_HPP
