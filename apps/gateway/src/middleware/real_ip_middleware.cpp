#include "middleware/real_ip_middleware.h"

#include "doco/core/http_util.h"

namespace doco::gateway {

namespace {

kj::String trimmed(kj::ArrayPtr<const char> value) {
  size_t begin = 0;
  size_t end = value.size();
  while (begin < end && value[begin] == ' ') {
    ++begin;
  }
  while (end > begin && value[end - 1] == ' ') {
    --end;
  }
  return kj::heapString(value.slice(begin, end));
}

} // namespace

kj::Maybe<kj::String> real_ip(const kj::HttpHeaders& headers) {
  KJ_IF_SOME(realIp, core::find_header(headers, "X-Real-IP")) {
    auto ip = trimmed(realIp);
    if (ip.size() > 0) {
      return kj::mv(ip);
    }
  }
  KJ_IF_SOME(forwarded, core::find_header(headers, "X-Forwarded-For")) {
    size_t end = forwarded.size();
    KJ_IF_SOME(comma, forwarded.findFirst(',')) {
      end = comma;
    }
    auto ip = trimmed(forwarded.slice(0, end));
    if (ip.size() > 0) {
      return kj::mv(ip);
    }
  }
  return kj::none;
}

kj::Promise<void> RealIpMiddleware::process(RequestContext& ctx,
                                            kj::Function<kj::Promise<void>()> next) {
  KJ_IF_SOME(ip, real_ip(ctx.headers)) {
    ctx.clientIP = kj::mv(ip);
  }
  return next();
}

} // namespace doco::gateway
