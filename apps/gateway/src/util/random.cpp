#include "util/random.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <openssl/err.h>
#include <openssl/rand.h>

namespace doco::gateway {

kj::Array<kj::byte> random_bytes(size_t count) {
  auto bytes = kj::heapArray<kj::byte>(count);
  if (count > 0 && RAND_bytes(bytes.begin(), static_cast<int>(count)) != 1) {
    KJ_FAIL_REQUIRE("RAND_bytes failed", ERR_get_error());
  }
  return bytes;
}

kj::String random_token(size_t count) {
  return kj::encodeBase64Url(random_bytes(count));
}

} // namespace doco::gateway
