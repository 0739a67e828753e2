#pragma once

#include "doco/store/blob.h"

#include <kj/async.h>
#include <kj/common.h>
#include <kj/string.h>

namespace doco::store {

/**
 * @brief Read access to stored blobs.
 *
 * Implementations must be usable from the event loop thread; lookups may complete
 * asynchronously. A missing key resolves to none; any other failure rejects.
 */
class BlobStore {
public:
  virtual ~BlobStore() noexcept = default;

  virtual kj::Promise<kj::Maybe<Blob>> find_by_filename(kj::StringPtr filename) = 0;
};

} // namespace doco::store
