#include "middleware/request_id_middleware.h"

#include "util/random.h"

#include <cstring>
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>

namespace doco::gateway {

namespace {

kj::String make_prefix() {
  char host[256] = {};
  if (gethostname(host, sizeof(host) - 1) != 0 || host[0] == '\0') {
    host[0] = '\0';
    strncpy(host, "localhost", sizeof(host) - 1);
  }

  kj::Vector<char> random;
  for (char c : random_token(12)) {
    if (c != '-' && c != '_' && random.size() < 10) {
      random.add(c);
    }
  }
  return kj::str(kj::StringPtr(host), "/", kj::heapString(random.asPtr()));
}

} // namespace

RequestIdMiddleware::RequestIdMiddleware() : prefix_(make_prefix()) {}

RequestIdMiddleware::RequestIdMiddleware(kj::String prefix) : prefix_(kj::mv(prefix)) {}

kj::String RequestIdMiddleware::next_id() {
  uint64_t id = ++counter_;
  auto digits = kj::str(id);
  kj::Vector<char> padded;
  for (size_t i = digits.size(); i < 6; ++i) {
    padded.add('0');
  }
  padded.addAll(digits);
  return kj::str(prefix_, "-", kj::heapString(padded.asPtr()));
}

kj::Promise<void> RequestIdMiddleware::process(RequestContext& ctx,
                                               kj::Function<kj::Promise<void>()> next) {
  KJ_IF_SOME(incoming, ctx.getHeader("X-Request-Id")) {
    ctx.requestId = kj::str(incoming);
  } else {
    ctx.requestId = next_id();
  }

  ctx.response.on_send([&ctx](kj::uint, kj::HttpHeaders& headers) {
    headers.addPtrPtr("X-Request-Id"_kj, ctx.requestId);
  });
  return next();
}

} // namespace doco::gateway
