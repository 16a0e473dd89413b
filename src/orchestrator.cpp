/**
 * @file orchestrator.cpp
 * @brief Encode orchestration implementation
 *
 * @details Single-clip requests encode straight into the final temp file.
 *          Intro requests encode both clips concurrently (the queue decides
 *          how many actually run at once), then join them with a stream
 *          copy. Both clips come from still_clip_job() with the same media
 *          parameters and profile, so their stream parameters match.
 */

#include "img2reel/orchestrator.hpp"

#include <exception>
#include <filesystem>
#include <future>
#include <utility>

#include <fmt/core.h>

#include "img2reel/media_probe.hpp"
#include "img2reel/system.hpp"

namespace img2reel {

namespace {

/// Wait for a job; an encoder exception becomes a failed outcome
EncodeOutcome wait_outcome(std::future<EncodeOutcome> &future) {
  try {
    return future.get();
  } catch (const std::exception &e) {
    EncodeOutcome failed;
    failed.error = e.what();
    return failed;
  }
}

} // anonymous namespace

EncodeOrchestrator::EncodeOrchestrator(EncodeQueue &queue,
                                       WorkspaceManager &workspace,
                                       CodecProfile profile)
    : queue_(queue), workspace_(workspace), profile_(std::move(profile)) {}

// **---- Helpers ----**

bool EncodeOrchestrator::check_input(const ReelRequest &req,
                                     const StagedInput &input,
                                     Error &err) const {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(input.path, ec)) {
    LOG_ERROR("{} Staged input missing: {}", req.tag, input.path);
    err.set(ErrorKind::Encode, "Staged input is missing");
    return false;
  }

  MediaInfo info;
  if (!probe_media(input.path, info, err)) {
    LOG_WARN("{} Rejected source: {}", req.tag, err.message);
    return false;
  }

  LOG_INFO("{} Source {}x{} {} ({} bytes)", req.tag, info.width, info.height,
           info.codec_name, input.size_bytes);
  return true;
}

EncodeJob EncodeOrchestrator::still_clip_job(const ReelRequest &req,
                                             const std::string &label,
                                             const StagedInput &input,
                                             int duration_sec,
                                             const std::string &output) const {
  EncodeJob job;
  job.kind = JobKind::StillClip;
  job.inputs = {input.path};
  job.output_path = output;
  job.filters = FilterGraph::fit_and_pad(req.media, profile_.background);
  job.profile = profile_;
  job.media = req.media;
  job.duration_sec = duration_sec;
  job.tag = fmt::format("{} {}", req.tag, label);
  return job;
}

bool EncodeOrchestrator::verify_artifact(const ReelRequest &req,
                                         const std::string &path,
                                         Error &err) const {
  MediaInfo info;
  Error probe_err;
  if (!probe_media(path, info, probe_err)) {
    LOG_ERROR("{} Encoded file unreadable: {}", req.tag, probe_err.message);
    err.set(ErrorKind::Encode, "Encoded video is not readable");
    return false;
  }

  if (info.width != req.media.width || info.height != req.media.height) {
    err.set(ErrorKind::Encode,
            fmt::format("Encoded video is {}x{}, expected {}x{}", info.width,
                        info.height, req.media.width, req.media.height));
    LOG_ERROR("{} {}", req.tag, err.message);
    return false;
  }

  LOG_INFO("{} Output {}x{} {} {:.2f}s @ {:.1f}fps", req.tag, info.width,
           info.height, info.codec_name, info.duration_sec, info.fps);
  return true;
}

std::string EncodeOrchestrator::public_error(const std::string &message) const {
  return redact_paths(message, {workspace_.work_dir().string(),
                                workspace_.output_dir().string()});
}

// **---- Main workflow ----**

bool EncodeOrchestrator::produce(const ReelRequest &req, StageTimings &timings,
                                 VideoArtifact &out, Error &err) {
  const bool with_intro = req.intro.has_value() && req.intro_duration_sec > 0;
  if (with_intro && profile_.kind == ProfileKind::Baseline) {
    err.set(ErrorKind::ClientInput,
            "Intro segments require the compressed encode profile");
    return false;
  }

  // **----- PHASE 1: INPUTS -----**

  TIMER_START(probe);
  if (!check_input(req, req.main, err)) {
    return false;
  }
  if (with_intro && !check_input(req, *req.intro, err)) {
    return false;
  }
  TIMER_END(timings, probe);

  std::string id;
  if (!generate_uuid_v4(id)) {
    err.set(ErrorKind::Internal, "Failed to generate artifact identifier");
    return false;
  }
  const std::string filename = WorkspaceManager::artifact_filename(id);

  std::string final_tmp;
  if (!workspace_.make_temp_path("out", ".mp4", final_tmp, err)) {
    return false;
  }
  TempFileGuard final_guard(workspace_, final_tmp);

  // **----- PHASE 2: ENCODE -----**

  LOG_PHASE("{} Encoding {}x{} @ {}fps, {}s{} ({})", req.tag, req.media.width,
            req.media.height, req.media.fps, req.media.duration_sec,
            with_intro ? fmt::format(" + {}s intro", req.intro_duration_sec)
                       : std::string(),
            to_string(profile_.kind));

  TIMER_START(encode);
  if (!with_intro) {
    auto future = queue_.submit(still_clip_job(
        req, "main", req.main, req.media.duration_sec, final_tmp));
    EncodeOutcome outcome = wait_outcome(future);
    if (!outcome.ok) {
      err.set(ErrorKind::Encode,
              fmt::format("Encoding failed: {}", public_error(outcome.error)));
      return false;
    }
  } else {
    std::string intro_tmp;
    std::string main_tmp;
    if (!workspace_.make_temp_path("intro", ".mp4", intro_tmp, err) ||
        !workspace_.make_temp_path("main", ".mp4", main_tmp, err)) {
      return false;
    }
    TempFileGuard intro_guard(workspace_, intro_tmp);
    TempFileGuard main_guard(workspace_, main_tmp);

    auto intro_future = queue_.submit(still_clip_job(
        req, "intro", *req.intro, req.intro_duration_sec, intro_tmp));
    auto main_future = queue_.submit(still_clip_job(
        req, "main", req.main, req.media.duration_sec, main_tmp));

    /// Both must finish before the guards may delete their outputs
    EncodeOutcome intro_outcome = wait_outcome(intro_future);
    EncodeOutcome main_outcome = wait_outcome(main_future);

    const EncodeOutcome &failed = !intro_outcome.ok ? intro_outcome
                                                    : main_outcome;
    if (!failed.ok) {
      err.set(ErrorKind::Encode,
              fmt::format("Encoding failed: {}", public_error(failed.error)));
      return false;
    }

    EncodeJob concat;
    concat.kind = JobKind::Concat;
    concat.inputs = {intro_tmp, main_tmp};
    concat.output_path = final_tmp;
    concat.tag = fmt::format("{} concat", req.tag);

    auto concat_future = queue_.submit(std::move(concat));
    EncodeOutcome concat_outcome = wait_outcome(concat_future);
    if (!concat_outcome.ok) {
      err.set(ErrorKind::Encode,
              fmt::format("Concatenation failed: {}",
                          public_error(concat_outcome.error)));
      return false;
    }
  }
  TIMER_END(timings, encode);

  // **----- PHASE 3: VERIFY + PUBLISH -----**

  if (!verify_artifact(req, final_tmp, err)) {
    return false;
  }

  TIMER_START(publish);
  std::string final_path;
  if (!workspace_.publish(req.tag, final_tmp, filename, final_path, err)) {
    return false;
  }
  TIMER_END(timings, publish);

  out.id = id;
  out.filename = filename;
  out.path = final_path;
  out.public_path = "/videos/" + filename;

  LOG_SUCCESS("{} Published {}", req.tag, filename);
  return true;
}

} // namespace img2reel
