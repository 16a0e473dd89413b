#include <cassert>
#include <iostream>
#include <string>

#include "img2reel/filter_graph.hpp"

namespace {

using img2reel::CodecProfile;
using img2reel::FilterGraph;
using img2reel::FilterStage;
using img2reel::MediaParams;
using img2reel::ProfileKind;

void TestFitAndPadStageOrder() {
  MediaParams media;
  media.width  = 720;
  media.height = 1280;
  media.fps    = 24;

  FilterGraph graph = FilterGraph::fit_and_pad(media, "black");
  assert(graph.stages().size() == 4);
  assert(graph.stages()[0].name == "scale");
  assert(graph.stages()[1].name == "pad");
  assert(graph.stages()[2].name == "fps");
  assert(graph.stages()[3].name == "setsar");

  assert(graph.to_string() ==
         "scale=w=720:h=1280:force_original_aspect_ratio=decrease,"
         "pad=w=720:h=1280:x=(ow-iw)/2:y=(oh-ih)/2:color=black,"
         "fps=fps=24,"
         "setsar=r=1");
}

void TestValuesAreEscaped() {
  // red:1,x -> option level red\:1,x -> graph level red\\:1\,x
  assert(img2reel::escape_filter_value("red:1,x") == "red\\\\:1\\,x");
  assert(img2reel::escape_filter_value("a'b[c]") == "a\\\\\\'b\\[c\\]");
  assert(img2reel::escape_filter_value("a\\b") == "a\\\\\\\\b");
  assert(img2reel::escape_filter_value("0x112233") == "0x112233");

  // A hostile background color stays inside its option.
  MediaParams media;
  FilterGraph graph = FilterGraph::fit_and_pad(media, "black,drawtext=text=x");
  std::string text  = graph.to_string();
  assert(text.find("color=black\\,drawtext=text=x") != std::string::npos);

  // A colon must survive both unescaping passes to stay in the value.
  FilterGraph colon = FilterGraph::fit_and_pad(media, "black:x=0");
  assert(colon.to_string().find("color=black\\\\:x=0,fps") != std::string::npos);
}

void TestEmptyStageRendersName() {
  FilterStage stage{"null", {}};
  assert(stage.to_string() == "null");

  FilterGraph graph;
  assert(graph.empty());
  graph.add(stage).add({"hflip", {}});
  assert(graph.to_string() == "null,hflip");
}

void TestProfileNames() {
  ProfileKind kind = ProfileKind::Baseline;
  assert(img2reel::parse_profile_kind("compressed", kind));
  assert(kind == ProfileKind::Compressed);
  assert(img2reel::parse_profile_kind("baseline", kind));
  assert(kind == ProfileKind::Baseline);
  assert(!img2reel::parse_profile_kind("Compressed", kind));
  assert(std::string(img2reel::to_string(ProfileKind::Compressed)) == "compressed");
}

void TestCodecTagAndPresets() {
  CodecProfile profile;
  assert(profile.codec_tag() == "avc1");
  profile.codec = "libx265";
  assert(profile.codec_tag() == "hvc1");

  assert(img2reel::is_known_preset("slow"));
  assert(img2reel::is_known_preset("veryfast"));
  assert(!img2reel::is_known_preset("turbo"));
  assert(!img2reel::is_known_preset(""));
}

}  // namespace

int main() {
  TestFitAndPadStageOrder();
  TestValuesAreEscaped();
  TestEmptyStageRendersName();
  TestProfileNames();
  TestCodecTagAndPresets();

  std::cout << "img2reel_unit_filter_graph: pass\n";
  return 0;
}
