#pragma once

#include "response_writer.h"

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/string.h>

namespace doco::gateway {

class Session;

/**
 * Per-request context containing request data, values set by middleware,
 * and response helpers.
 *
 * This context is created by the GatewayServer and passed through middleware
 * to handlers.
 */
struct RequestContext {
  // Request data
  kj::HttpMethod method;
  kj::StringPtr url;
  kj::StringPtr path; // decoded, without query string
  kj::StringPtr queryString;
  const kj::HttpHeaders& headers; // const reference - handlers shouldn't modify
  kj::AsyncInputStream& body;     // reference - lifetime managed by GatewayServer

  // Response object (for sending responses)
  ResponseWriter& response;

  // Header table reference (needed for creating response headers)
  const kj::HttpHeaderTable& headerTable;

  // Extracted path parameters (e.g., {blob_id} from /api/blobs/{blob_id})
  kj::HashMap<kj::String, kj::String> path_params;

  // Client info: TCP peer, replaced by the real-IP middleware
  kj::String clientIP;

  // Populated by RequestIdMiddleware
  kj::String requestId;

  // Populated by SessionMiddleware
  kj::Maybe<Session&> session;

  // Response helpers
  kj::Promise<void> sendJson(kj::uint status, kj::String body);
  kj::Promise<void> sendText(kj::uint status, kj::StringPtr contentType, kj::String body);

  // Utilities
  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;
  kj::Maybe<kj::StringPtr> param(kj::StringPtr name) const;
};

} // namespace doco::gateway
