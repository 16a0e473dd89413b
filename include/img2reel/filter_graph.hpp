/**
 * @file filter_graph.hpp
 * @brief Typed video filter pipeline and codec profile
 *
 * @details The fit-and-pad pipeline is held as an ordered list of named
 *          stages with key/value options, and is only flattened to FFmpeg's
 *          filter syntax at the very end, with every value escaped:
 *
 *          1. scale  - fit inside WxH keeping aspect ratio ("decrease")
 *
 *          2. pad    - center on exactly WxH with a solid background
 *
 *          3. fps    - resample to the target frame rate
 *
 *          4. setsar - square pixels, so every clip built with the same
 *                      parameters has identical stream parameters
 */

#ifndef IMG2REEL_FILTER_GRAPH_HPP
#define IMG2REEL_FILTER_GRAPH_HPP

#include <string>
#include <utility>
#include <vector>

#include "types.hpp"

namespace img2reel {

/**
 * @struct FilterStage
 * @brief One named filter with ordered options.
 */
struct FilterStage {
  std::string name;
  std::vector<std::pair<std::string, std::string>> options;

  /// "name=key=value:key=value"
  std::string to_string() const;
};

/**
 * @class FilterGraph
 * @brief Linear chain of filter stages.
 */
class FilterGraph {
public:
  FilterGraph &add(FilterStage stage);

  const std::vector<FilterStage> &stages() const { return stages_; }
  bool empty() const { return stages_.empty(); }

  /// Stages joined with ','
  std::string to_string() const;

  /**
   * @brief Build the scale -> pad -> fps -> setsar chain.
   * @param media Target dimensions and frame rate
   * @param background Pad color (FFmpeg color name or 0xRRGGBB)
   */
  static FilterGraph fit_and_pad(const MediaParams &media,
                                 const std::string &background);

private:
  std::vector<FilterStage> stages_;
};

/**
 * @brief Escape a filter option value for use inside a -vf graph.
 * @note Two levels: the option parser's (\ ' :) inside the filtergraph
 *       parser's (\ ' [ ] , ;).
 */
std::string escape_filter_value(const std::string &value);

// **---- Codec profile ----**

/**
 * @brief Encoder profile families.
 */
enum class ProfileKind {
  Baseline,  //< libx264 defaults, stereo 128k AAC
  Compressed //< CRF + preset + VBV cap + fixed GOP, mono AAC
};

/// Parse "baseline" / "compressed"
bool parse_profile_kind(const std::string &name, ProfileKind &out);

/// Name of a profile kind
const char *to_string(ProfileKind kind);

/**
 * @struct CodecProfile
 * @brief Configuration-time encoder parameters.
 */
struct CodecProfile {
  ProfileKind kind = ProfileKind::Compressed;
  std::string codec = "libx264";
  int crf = 26;
  std::string preset = "slow";
  int maxrate_kbps = 2500;
  int bufsize_kbps = 5000;
  int keyint = 240;
  int audio_kbps = 64;
  std::string background = "black";

  /// Build from the process configuration
  static CodecProfile from_config();

  /// MP4 sample entry tag for the codec ("avc1", "hvc1")
  std::string codec_tag() const;
};

/// True for the x264/x265 preset names
bool is_known_preset(const std::string &preset);

} // namespace img2reel

#endif // IMG2REEL_FILTER_GRAPH_HPP
