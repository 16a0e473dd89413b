#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "img2reel/system.hpp"
#include "img2reel/types.hpp"

namespace {

bool IsLowerHex(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

void TestUuidV4Format() {
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    std::string id;
    assert(img2reel::generate_uuid_v4(id));
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    for (size_t j = 0; j < id.size(); ++j) {
      if (j == 8 || j == 13 || j == 18 || j == 23) continue;
      assert(IsLowerHex(id[j]));
    }
    seen.insert(id);
  }
  assert(seen.size() == 64);
}

void TestTokens() {
  std::string a;
  std::string b;
  assert(img2reel::generate_token(4, a));
  assert(img2reel::generate_token(4, b));
  assert(a.size() == 8);
  assert(a != b);
}

void TestRedactPaths() {
  std::string msg = "/tmp/work/img2reel-src-1.png: Invalid data found; see /srv/videos/x.mp4";
  std::string out = img2reel::redact_paths(msg, {"/tmp/work", "/srv/videos/", ""});
  assert(out == "img2reel-src-1.png: Invalid data found; see x.mp4");
  assert(img2reel::redact_paths("no paths here", {"/tmp"}) == "no paths here");
}

void TestParseCpuset() {
  std::vector<int> cpus = img2reel::parse_cpuset_string("0,2,4-6\n");
  assert((cpus == std::vector<int>{0, 2, 4, 5, 6}));
  assert(img2reel::parse_cpuset_string("").empty());
}

void TestErrorStatusMapping() {
  using img2reel::ErrorKind;
  assert(img2reel::http_status_for(ErrorKind::ClientInput) == 400);
  assert(img2reel::http_status_for(ErrorKind::Validation) == 400);
  assert(img2reel::http_status_for(ErrorKind::TooLarge) == 413);
  assert(img2reel::http_status_for(ErrorKind::Upstream) == 502);
  assert(img2reel::http_status_for(ErrorKind::Encode) == 500);
  assert(img2reel::http_status_for(ErrorKind::Internal) == 500);
}

void TestFormatDuration() {
  assert(img2reel::format_duration_us(340000) == "340ms");
  assert(img2reel::format_duration_us(1250000) == "1.25s");
  assert(img2reel::calculate_encode_workers() >= 1);
}

}  // namespace

int main() {
  TestUuidV4Format();
  TestTokens();
  TestRedactPaths();
  TestParseCpuset();
  TestErrorStatusMapping();
  TestFormatDuration();

  std::cout << "img2reel_unit_system: pass\n";
  return 0;
}
