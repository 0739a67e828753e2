#pragma once

#include "api_result.h"

namespace doco::gateway {

/**
 * GET /api/check: liveness check answering `{}`.
 */
Handler check_handler();

} // namespace doco::gateway
