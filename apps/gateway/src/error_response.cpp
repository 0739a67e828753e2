#include "error_response.h"

#include "doco/core/error.h"
#include "doco/core/json.h"

namespace doco::gateway {

ErrorResponse::ErrorResponse(kj::Exception error, kj::Maybe<kj::StringPtr> message)
    : inner_(kj::mv(error)), err_(kj::str(core::describe(inner_))),
      message_(kj::str(message.orDefault(err_))) {}

kj::String ErrorResponse::to_json() const {
  return core::JsonBuilder::object().put("err", err_).put("message", message_).build();
}

} // namespace doco::gateway
