/**
 * @file media_type.hpp
 * @brief Allow-list policy for source images
 *
 * @details A source is accepted when its declared content type is an allowed
 *          image type, or when the content type is absent/generic and the
 *          path extension is an allowed image extension. A content type that
 *          is present and names anything else is rejected regardless of the
 *          extension.
 */

#ifndef IMG2REEL_MEDIA_TYPE_HPP
#define IMG2REEL_MEDIA_TYPE_HPP

#include <string>

#include "types.hpp"

namespace img2reel {

/**
 * @brief How a Content-Type header value classifies.
 */
enum class ContentTypeClass {
  Allowed,      //< image/jpeg, image/jpg, image/pjpeg, image/png
  Disallowed,   //< any other concrete type (text/html, image/gif, ...)
  Unrecognized  //< absent, empty or generic octet-stream
};

/**
 * @brief Classify a Content-Type header value.
 * @param content_type Raw header value, parameters allowed ("; charset=...")
 * @param type Output: image type when the result is Allowed
 */
ContentTypeClass classify_content_type(const std::string &content_type,
                                       ImageType &type);

/**
 * @brief Map a file name or URL path extension to an allowed image type.
 * @note Case-insensitive; only .jpg, .jpeg and .png are accepted.
 * @return true if the extension is allow-listed
 */
bool image_type_from_extension(const std::string &path, ImageType &type);

/**
 * @brief Apply the acceptance policy to a fetched source.
 *
 * @param content_type Declared Content-Type (may be empty)
 * @param path URL path of the source
 * @param type Output: accepted image type
 * @param err Output: Validation error when rejected
 * @return true if the source is accepted
 */
bool resolve_source_type(const std::string &content_type,
                         const std::string &path, ImageType &type, Error &err);

} // namespace img2reel

#endif // IMG2REEL_MEDIA_TYPE_HPP
