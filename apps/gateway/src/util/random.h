#pragma once

#include <kj/array.h>
#include <kj/string.h>

namespace doco::gateway {

/**
 * Cryptographically secure random bytes from OpenSSL.
 *
 * @throws kj::Exception if the OpenSSL generator fails
 */
kj::Array<kj::byte> random_bytes(size_t count);

/**
 * URL-safe base64 (no padding) of `count` random bytes.
 */
kj::String random_token(size_t count);

} // namespace doco::gateway
