/**
 * @file url.hpp
 * @brief Minimal absolute URL parsing and redirect resolution
 *
 * @details Only http and https are accepted. The fetch client needs the
 *          origin ("https://host:port") and the request target
 *          ("/path?query") separately, and resolves Location headers
 *          against the URL that produced them.
 */

#ifndef IMG2REEL_URL_HPP
#define IMG2REEL_URL_HPP

#include <string>

namespace img2reel {

/**
 * @struct Url
 * @brief Components of an absolute http(s) URL.
 */
struct Url {
  std::string scheme; //< "http" or "https", lowercase
  std::string host;   //< Host name or bracketed IPv6 literal
  int port = 0;       //< Explicit or scheme default
  std::string path;   //< Path component, always starts with '/'
  std::string query;  //< Query without '?', may be empty

  /// "scheme://host:port"
  std::string origin() const;

  /// "path?query"
  std::string target() const;

  /// Full URL without fragment
  std::string to_string() const;
};

/**
 * @brief Parse an absolute http(s) URL.
 * @param text URL text
 * @param url Output: parsed components
 * @return false if the text is not an absolute http(s) URL
 */
bool parse_url(const std::string &text, Url &url);

/**
 * @brief Resolve a redirect Location against the URL that returned it.
 * @note Handles absolute, scheme-relative, absolute-path and relative
 *       references.
 * @return false if the resolved URL is not a valid http(s) URL
 */
bool resolve_location(const Url &base, const std::string &location, Url &out);

} // namespace img2reel

#endif // IMG2REEL_URL_HPP
