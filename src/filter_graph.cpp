/**
 * @file filter_graph.cpp
 * @brief Filter pipeline and codec profile implementation
 */

#include "img2reel/filter_graph.hpp"

#include <utility>

#include <fmt/core.h>

#include "img2reel/config.hpp"

namespace img2reel {

// **---- Filter stages ----**

namespace {

std::string backslash_escape(const std::string &value, const char *special) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    for (const char *p = special; *p; ++p) {
      if (c == *p) {
        out += '\\';
        break;
      }
    }
    out += c;
  }
  return out;
}

} // anonymous namespace

std::string escape_filter_value(const std::string &value) {
  /// Option level first, then the filtergraph level that -vf strips first
  return backslash_escape(backslash_escape(value, "\\':"), "\\'[],;");
}

std::string FilterStage::to_string() const {
  std::string out = name;
  char sep = '=';
  for (const auto &opt : options) {
    out += sep;
    out += opt.first;
    out += '=';
    out += escape_filter_value(opt.second);
    sep = ':';
  }
  return out;
}

FilterGraph &FilterGraph::add(FilterStage stage) {
  stages_.push_back(std::move(stage));
  return *this;
}

std::string FilterGraph::to_string() const {
  std::string out;
  for (const auto &stage : stages_) {
    if (!out.empty())
      out += ',';
    out += stage.to_string();
  }
  return out;
}

FilterGraph FilterGraph::fit_and_pad(const MediaParams &media,
                                     const std::string &background) {
  const std::string w = std::to_string(media.width);
  const std::string h = std::to_string(media.height);

  FilterGraph graph;
  graph.add({"scale", {{"w", w}, {"h", h},
                       {"force_original_aspect_ratio", "decrease"}}});
  graph.add({"pad", {{"w", w}, {"h", h},
                     {"x", "(ow-iw)/2"}, {"y", "(oh-ih)/2"},
                     {"color", background}}});
  graph.add({"fps", {{"fps", std::to_string(media.fps)}}});
  graph.add({"setsar", {{"r", "1"}}});
  return graph;
}

// **---- Codec profile ----**

bool parse_profile_kind(const std::string &name, ProfileKind &out) {
  if (name == "baseline") {
    out = ProfileKind::Baseline;
    return true;
  }
  if (name == "compressed") {
    out = ProfileKind::Compressed;
    return true;
  }
  return false;
}

const char *to_string(ProfileKind kind) {
  return kind == ProfileKind::Baseline ? "baseline" : "compressed";
}

CodecProfile CodecProfile::from_config() {
  CodecProfile profile;
  /// Config::validate() has already rejected unknown names
  parse_profile_kind(Config::encode_profile(), profile.kind);
  profile.codec = Config::video_codec();
  profile.crf = Config::video_crf();
  profile.preset = Config::video_preset();
  profile.maxrate_kbps = Config::video_maxrate_kbps();
  profile.bufsize_kbps = Config::video_bufsize_kbps();
  profile.keyint = Config::video_keyint();
  profile.audio_kbps = Config::audio_bitrate_kbps();
  profile.background = Config::background_color();
  return profile;
}

std::string CodecProfile::codec_tag() const {
  /// hvc1 (not hev1) so QuickTime and Safari play HEVC in MP4
  if (codec == "libx265")
    return "hvc1";
  return "avc1";
}

bool is_known_preset(const std::string &preset) {
  static const char *const PRESETS[] = {
      "ultrafast", "superfast", "veryfast", "faster", "fast",
      "medium",    "slow",      "slower",   "veryslow", "placebo"};
  for (const char *p : PRESETS) {
    if (preset == p)
      return true;
  }
  return false;
}

} // namespace img2reel
