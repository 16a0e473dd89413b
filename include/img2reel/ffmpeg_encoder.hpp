/**
 * @file ffmpeg_encoder.hpp
 * @brief Encoder backed by the ffmpeg command-line tool
 *
 * @details Each job becomes one ffmpeg child process:
 *
 *          - argv is built as a vector and exec'd directly (no shell), so
 *            paths and filter values are never re-parsed
 *
 *          - the concat list lives in a memfd and is handed to ffmpeg as
 *            /proc/<pid>/fd/<n>, so it never touches the filesystem
 *
 *          - stderr is captured; its tail becomes the error text
 *
 *          - a watchdog kills the child after the configured timeout
 */

#ifndef IMG2REEL_FFMPEG_ENCODER_HPP
#define IMG2REEL_FFMPEG_ENCODER_HPP

#include <string>
#include <vector>

#include "encoder.hpp"

namespace img2reel {

/**
 * @brief Build ffmpeg arguments for a still-image clip (argv[1..]).
 */
std::vector<std::string> build_still_clip_args(const EncodeJob &job);

/**
 * @brief Build ffmpeg arguments for a stream-copy concat (argv[1..]).
 * @param list_path Path ffmpeg reads the concat list from
 */
std::vector<std::string> build_concat_args(const EncodeJob &job,
                                           const std::string &list_path);

/**
 * @brief Render the concat demuxer list for a set of clips.
 * @note Paths are made absolute and single quotes escaped.
 */
std::string build_concat_list(const std::vector<std::string> &inputs);

/**
 * @struct ProcessResult
 * @brief Exit information for a finished child process.
 */
struct ProcessResult {
  bool started = false;   //< fork/exec succeeded
  bool timed_out = false; //< Killed by the watchdog
  int exit_code = -1;     //< Exit status, or -1 when killed by a signal
  int term_signal = 0;    //< Terminating signal, if any
  std::string stderr_tail;
};

/**
 * @brief Run a program with stdin/stdout on /dev/null, capturing stderr.
 *
 * @param argv Program and arguments (argv[0] resolved through PATH)
 * @param timeout_sec Watchdog in seconds, 0 = none
 * @return Exit information
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          int timeout_sec);

/**
 * @class FfmpegEncoder
 * @brief Encoder implementation spawning ffmpeg per job.
 */
class FfmpegEncoder : public Encoder {
public:
  /**
   * @param ffmpeg_path Binary name or absolute path
   * @param timeout_sec Watchdog per invocation (0 = off)
   */
  FfmpegEncoder(std::string ffmpeg_path, int timeout_sec);

  EncodeOutcome run(const EncodeJob &job) override;

private:
  std::string ffmpeg_path_;
  int timeout_sec_;

  EncodeOutcome execute(const EncodeJob &job, std::vector<std::string> args);
  EncodeOutcome run_concat(const EncodeJob &job);
};

} // namespace img2reel

#endif // IMG2REEL_FFMPEG_ENCODER_HPP
