#include "handlers/check_handler.h"

#include "doco/core/json.h"

namespace doco::gateway {

Handler check_handler() {
  return with_error([](RequestContext&) -> kj::Promise<ApiResult> {
    return ApiResult::json(200, core::JsonBuilder::object().build());
  });
}

} // namespace doco::gateway
