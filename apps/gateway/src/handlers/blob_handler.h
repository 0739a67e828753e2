#pragma once

#include "middleware.h"
#include "request_context.h"

#include "doco/store/blob_store.h"

#include <kj/async.h>
#include <kj/time.h>

namespace doco::gateway {

/**
 * Blob download handler.
 *
 * Handles endpoint:
 * - GET /api/blobs/{blob_id} - the blob whose filename is blob_id, as an attachment
 *
 * Unknown blobs and store failures answer 400 with the error envelope. Content is served
 * with range and conditional request support.
 */
class BlobHandler {
public:
  BlobHandler(store::BlobStore& store, const kj::Clock& clock);

  kj::Promise<void> handleGetBlob(RequestContext& ctx);

  Handler handler();

private:
  store::BlobStore& store_;
  const kj::Clock& clock_;
};

} // namespace doco::gateway
