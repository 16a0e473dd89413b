// End-to-end encode through the real ffmpeg binary. Exits 77 (skipped) when
// ffmpeg or its libx264 encoder is not available on this machine.

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>

#include "img2reel/encode_queue.hpp"
#include "img2reel/ffmpeg_encoder.hpp"
#include "img2reel/media_probe.hpp"
#include "img2reel/orchestrator.hpp"
#include "test_support.hpp"

namespace {

using img2reel::CodecProfile;
using img2reel::EncodeOrchestrator;
using img2reel::EncodeQueue;
using img2reel::Error;
using img2reel::FfmpegEncoder;
using img2reel::ImageType;
using img2reel::MediaInfo;
using img2reel::ProfileKind;
using img2reel::ReelRequest;
using img2reel::StagedInput;
using img2reel::StageTimings;
using img2reel::VideoArtifact;
using img2reel::WorkspaceManager;
using img2reel_test::CountEntries;
using img2reel_test::ScratchDir;
namespace fs = std::filesystem;

constexpr int kSkip = 77;

bool FfmpegUsable() {
  auto version = img2reel::run_process({"ffmpeg", "-version"}, 10);
  if (!version.started || version.exit_code != 0) return false;

  auto x264 = img2reel::run_process({"ffmpeg", "-hide_banner", "-loglevel", "error", "-f", "lavfi", "-i",
                                     "color=c=black:s=16x16:d=1", "-c:v", "libx264", "-f", "null", "-"},
                                    30);
  return x264.started && x264.exit_code == 0;
}

StagedInput Stage(const fs::path& dir, const std::string& name, const std::string& content) {
  StagedInput input;
  input.path       = (dir / name).string();
  input.type       = ImageType::Png;
  input.size_bytes = content.size();
  img2reel_test::WriteFile(input.path, content);
  return input;
}

void ProduceAndCheck(ProfileKind kind, bool with_intro) {
  ScratchDir       root(std::string("ffmpeg-") + img2reel::to_string(kind) + (with_intro ? "-intro" : ""));
  WorkspaceManager workspace(root / "out", root / "work");
  Error            err;
  assert(workspace.ensure_output_directory(err));
  assert(workspace.ensure_work_directory(err));

  FfmpegEncoder encoder("ffmpeg", 120);
  EncodeQueue   queue(encoder, 2);
  CodecProfile  profile;
  profile.kind   = kind;
  profile.preset = "veryfast";
  EncodeOrchestrator orchestrator(queue, workspace, profile);

  ReelRequest req;
  req.tag                = "[Req itest001]";
  req.main               = Stage(root / "work", "main.png", img2reel_test::Png32x16());
  req.media.width        = 360;
  req.media.height       = 640;
  req.media.fps          = 24;
  req.media.duration_sec = 2;
  if (with_intro) {
    req.intro              = Stage(root / "work", "intro.png", img2reel_test::Png16x16());
    req.intro_duration_sec = 1;
  }

  StageTimings  timings;
  VideoArtifact artifact;
  bool          ok = orchestrator.produce(req, timings, artifact, err);
  if (!ok) std::cerr << "produce failed: " << err.message << "\n";
  assert(ok);

  MediaInfo info;
  Error     probe_err;
  assert(img2reel::probe_media(artifact.path, info, probe_err));
  assert(info.width == 360);
  assert(info.height == 640);
  assert(info.has_audio);

  const double expected = req.media.duration_sec + (with_intro ? req.intro_duration_sec : 0);
  assert(std::fabs(info.duration_sec - expected) < 0.5);

  // Only the artifact remains; the two staged images belong to the caller.
  assert(CountEntries(root / "out") == 1);
  assert(CountEntries(root / "work") == (with_intro ? 2u : 1u));
  queue.shutdown();
}

}  // namespace

int main() {
  if (!FfmpegUsable()) {
    std::cout << "img2reel_unit_ffmpeg_integration: skipped (ffmpeg with libx264 not found)\n";
    return kSkip;
  }

  ProduceAndCheck(ProfileKind::Baseline, false);
  ProduceAndCheck(ProfileKind::Compressed, false);
  ProduceAndCheck(ProfileKind::Compressed, true);

  std::cout << "img2reel_unit_ffmpeg_integration: pass\n";
  return 0;
}
