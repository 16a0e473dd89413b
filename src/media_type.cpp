/**
 * @file media_type.cpp
 * @brief Allow-list policy implementation
 */

#include "img2reel/media_type.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace img2reel {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string trim(const std::string &s) {
  size_t begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos)
    return "";
  size_t end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

ContentTypeClass classify_content_type(const std::string &content_type,
                                       ImageType &type) {
  /// Strip parameters: "image/png; charset=binary" -> "image/png"
  std::string essence = content_type.substr(0, content_type.find(';'));
  essence = to_lower(trim(essence));

  if (essence.empty() || essence == "application/octet-stream" ||
      essence == "binary/octet-stream") {
    return ContentTypeClass::Unrecognized;
  }
  if (essence == "image/jpeg" || essence == "image/jpg" ||
      essence == "image/pjpeg") {
    type = ImageType::Jpeg;
    return ContentTypeClass::Allowed;
  }
  if (essence == "image/png") {
    type = ImageType::Png;
    return ContentTypeClass::Allowed;
  }
  return ContentTypeClass::Disallowed;
}

bool image_type_from_extension(const std::string &path, ImageType &type) {
  size_t slash = path.find_last_of('/');
  size_t dot = path.find_last_of('.');
  if (dot == std::string::npos ||
      (slash != std::string::npos && dot < slash)) {
    return false;
  }

  std::string ext = to_lower(path.substr(dot));
  if (ext == ".jpg" || ext == ".jpeg") {
    type = ImageType::Jpeg;
    return true;
  }
  if (ext == ".png") {
    type = ImageType::Png;
    return true;
  }
  return false;
}

bool resolve_source_type(const std::string &content_type,
                         const std::string &path, ImageType &type, Error &err) {
  switch (classify_content_type(content_type, type)) {
  case ContentTypeClass::Allowed:
    return true;
  case ContentTypeClass::Disallowed:
    err.set(ErrorKind::Validation,
            fmt::format("Only PNG or JPG sources are allowed (got "
                        "content-type=\"{}\")",
                        content_type));
    return false;
  case ContentTypeClass::Unrecognized:
    break;
  }

  if (image_type_from_extension(path, type)) {
    return true;
  }

  err.set(ErrorKind::Validation,
          fmt::format("Only PNG or JPG sources are allowed (got "
                      "content-type=\"{}\" and no .jpg/.jpeg/.png extension)",
                      content_type.empty() ? "unknown" : content_type));
  return false;
}

} // namespace img2reel
