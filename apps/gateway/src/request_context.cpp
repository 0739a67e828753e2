#include "request_context.h"

#include "doco/core/http_util.h"

namespace doco::gateway {

kj::Promise<void> RequestContext::sendJson(kj::uint status, kj::String body) {
  return sendText(status, "application/json"_kj, kj::mv(body));
}

kj::Promise<void> RequestContext::sendText(kj::uint status, kj::StringPtr contentType,
                                           kj::String body) {
  kj::HttpHeaders responseHeaders(headerTable);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, contentType);

  auto stream = response.send(status, core::status_text(status), responseHeaders, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

kj::Maybe<kj::StringPtr> RequestContext::getHeader(kj::StringPtr name) const {
  return core::find_header(headers, name);
}

kj::Maybe<kj::StringPtr> RequestContext::param(kj::StringPtr name) const {
  KJ_IF_SOME(value, path_params.find(name)) {
    return value.asPtr();
  }
  return kj::none;
}

} // namespace doco::gateway
