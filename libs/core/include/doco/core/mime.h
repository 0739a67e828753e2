#pragma once

#include <kj/common.h>
#include <kj/string.h>

namespace doco::core {

/**
 * @brief Mime type registered for the extension of path, matched case-insensitively.
 *
 * Returns none for paths without an extension or with an unregistered one.
 */
[[nodiscard]] kj::Maybe<kj::StringPtr> mime_type_for_path(kj::StringPtr path);

/**
 * @brief Guess a content type from the leading bytes of a body.
 *
 * Looks at most at the first 512 bytes. Recognizes common image, document, archive and
 * markup signatures; falls back to "text/plain; charset=utf-8" for text-looking content and
 * "application/octet-stream" otherwise.
 */
[[nodiscard]] kj::StringPtr sniff_content_type(kj::ArrayPtr<const kj::byte> content);

} // namespace doco::core
