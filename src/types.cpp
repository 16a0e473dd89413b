/**
 * @file types.cpp
 * @brief Names and status mapping for the shared types
 */

#include "img2reel/types.hpp"

namespace img2reel {

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::ClientInput:
    return "client_input";
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::TooLarge:
    return "too_large";
  case ErrorKind::Upstream:
    return "upstream";
  case ErrorKind::Encode:
    return "encode";
  case ErrorKind::Internal:
    return "internal";
  }
  return "unknown";
}

int http_status_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return 200;
  case ErrorKind::ClientInput:
  case ErrorKind::Validation:
    return 400;
  case ErrorKind::TooLarge:
    return 413;
  case ErrorKind::Upstream:
    return 502;
  case ErrorKind::Encode:
  case ErrorKind::Internal:
    return 500;
  }
  return 500;
}

const char *extension_for(ImageType type) {
  return type == ImageType::Png ? ".png" : ".jpg";
}

} // namespace img2reel
