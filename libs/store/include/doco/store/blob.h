#pragma once

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::store {

/**
 * @brief A binary object addressed by its unique filename.
 */
struct Blob {
  kj::String filename;
  kj::String mime_type;
  kj::Array<kj::byte> content;
  kj::Maybe<kj::Date> modified;

  /**
   * @brief False when the mime type is empty or the store's "unknown" placeholder.
   */
  [[nodiscard]] bool has_mime_type() const {
    return mime_type.size() > 0 && mime_type != "unknown"_kj;
  }

  [[nodiscard]] Blob clone() const {
    return Blob{kj::str(filename), kj::str(mime_type), kj::heapArray(content.asPtr()), modified};
  }
};

} // namespace doco::store
