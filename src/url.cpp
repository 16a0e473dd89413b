/**
 * @file url.cpp
 * @brief URL parsing implementation
 */

#include "img2reel/url.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <fmt/core.h>

namespace img2reel {

namespace {

const std::regex &url_pattern() {
  /// scheme :// host [: port] [path] [? query] [# fragment]
  static const std::regex re(
      R"(^([A-Za-z][A-Za-z0-9+.-]*)://(\[[0-9A-Fa-f:.]+\]|[^/?#:@\[\]]+)(?::([0-9]{1,5}))?([^?#]*)(?:\?([^#]*))?(?:#.*)?$)");
  return re;
}

int default_port(const std::string &scheme) {
  return scheme == "https" ? 443 : 80;
}

/// Drop the last path segment: "/a/b/c.png" -> "/a/b/"
std::string directory_of(const std::string &path) {
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? "/" : path.substr(0, slash + 1);
}

/// True when location starts with "scheme:" (RFC 3986 scheme syntax)
bool has_scheme(const std::string &location) {
  if (location.empty() || !std::isalpha(static_cast<unsigned char>(location[0])))
    return false;
  for (size_t i = 1; i < location.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(location[i]);
    if (c == ':')
      return true;
    if (!std::isalnum(c) && c != '+' && c != '.' && c != '-')
      return false;
  }
  return false;
}

} // anonymous namespace

std::string Url::origin() const {
  if (port == default_port(scheme)) {
    return fmt::format("{}://{}", scheme, host);
  }
  return fmt::format("{}://{}:{}", scheme, host, port);
}

std::string Url::target() const {
  return query.empty() ? path : path + "?" + query;
}

std::string Url::to_string() const { return origin() + target(); }

bool parse_url(const std::string &text, Url &url) {
  std::smatch m;
  if (!std::regex_match(text, m, url_pattern())) {
    return false;
  }

  std::string scheme = m[1].str();
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (scheme != "http" && scheme != "https") {
    return false;
  }

  int port = default_port(scheme);
  if (m[3].matched) {
    port = std::stoi(m[3].str());
    if (port <= 0 || port > 65535) {
      return false;
    }
  }

  url.scheme = scheme;
  url.host = m[2].str();
  url.port = port;
  url.path = m[4].str().empty() ? "/" : m[4].str();
  url.query = m[5].matched ? m[5].str() : "";
  return true;
}

bool resolve_location(const Url &base, const std::string &location, Url &out) {
  if (location.empty()) {
    return false;
  }

  /// Absolute URL
  if (has_scheme(location)) {
    return parse_url(location, out);
  }

  /// Scheme-relative: //host/path
  if (location.compare(0, 2, "//") == 0) {
    return parse_url(base.scheme + ":" + location, out);
  }

  std::string prefix = base.origin();

  /// Absolute path
  if (location[0] == '/') {
    return parse_url(prefix + location, out);
  }

  /// Query-only reference
  if (location[0] == '?') {
    return parse_url(prefix + base.path + location, out);
  }

  /// Relative path
  return parse_url(prefix + directory_of(base.path) + location, out);
}

} // namespace img2reel
