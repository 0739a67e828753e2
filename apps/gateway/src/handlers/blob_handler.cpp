#include "handlers/blob_handler.h"

#include "api_result.h"
#include "content/serve_content.h"
#include "error_response.h"

#include "doco/core/error.h"

#include <kj/debug.h>

namespace doco::gateway {

BlobHandler::BlobHandler(store::BlobStore& store, const kj::Clock& clock)
    : store_(store), clock_(clock) {}

Handler BlobHandler::handler() {
  return [this](RequestContext& ctx) { return handleGetBlob(ctx); };
}

kj::Promise<void> BlobHandler::handleGetBlob(RequestContext& ctx) {
  auto key = kj::str(KJ_REQUIRE_NONNULL(ctx.param("blob_id"), "route has no blob_id"));

  kj::Maybe<store::Blob> found;
  kj::Maybe<kj::Exception> failure;
  try {
    found = co_await store_.find_by_filename(key);
  } catch (const kj::Exception& e) {
    failure = kj::cp(e);
  }

  KJ_IF_SOME(e, failure) {
    ErrorResponse error(kj::mv(e));
    KJ_LOG(WARNING, "blob lookup failed", ctx.requestId, key, error.err());
    co_await send_error(ctx, 400, error);
    co_return;
  }

  KJ_IF_SOME(blob, found) {
    kj::HttpHeaders headers(ctx.headerTable);
    if (blob.has_mime_type()) {
      headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, blob.mime_type);
    }
    headers.addPtr("Content-Disposition", kj::str("attachment;filename=", blob.filename));

    kj::Date modified = clock_.now();
    KJ_IF_SOME(m, blob.modified) {
      modified = m;
    }
    co_await serve_content(ctx, kj::mv(headers), blob.filename, modified, blob.content);
  } else {
    ErrorResponse error(
        core::NotFoundException(kj::str("blob not found: ", key)).toKjException());
    co_await send_error(ctx, 400, error);
  }
}

} // namespace doco::gateway
