#pragma once

#include "error_response.h"
#include "middleware.h"
#include "request_context.h"

#include <kj/async.h>
#include <kj/function.h>

namespace doco::gateway {

/**
 * What a JSON handler produced: a status plus either a JSON body or an error.
 */
struct ApiResult {
  kj::uint status = 200;
  kj::Maybe<kj::String> body;
  kj::Maybe<kj::Exception> error;
  kj::Maybe<kj::String> message;

  static ApiResult json(kj::uint status, kj::String body);
  static ApiResult failure(kj::uint status, kj::Exception error,
                           kj::Maybe<kj::StringPtr> message = kj::none);
};

using ApiHandler = kj::Function<kj::Promise<ApiResult>(RequestContext&)>;

/**
 * Adapt a JSON handler to a plain Handler.
 *
 * Bodies go out as application/json with the result status; errors become the error
 * envelope. A result with neither becomes the "no response" envelope.
 */
Handler with_error(ApiHandler handler);

/**
 * Send the error envelope with the given status.
 */
kj::Promise<void> send_error(RequestContext& ctx, kj::uint status, const ErrorResponse& error);

} // namespace doco::gateway
