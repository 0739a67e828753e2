#include "doco/proxy/reverse_proxy.h"

#include "doco/core/http_util.h"

#include <kj/debug.h>

namespace doco::proxy {

namespace {

constexpr size_t kPumpBufferSize = 8192;

} // namespace

ProxyHeaderIds::ProxyHeaderIds(kj::HttpHeaderTable::Builder& builder)
    : xForwardedFor(builder.add("X-Forwarded-For")), xRealIp(builder.add("X-Real-IP")),
      xForwardedProto(builder.add("X-Forwarded-Proto")),
      xForwardedHost(builder.add("X-Forwarded-Host")) {}

kj::Promise<uint64_t> pump_with_idle_timeout(kj::Timer& timer, kj::AsyncInputStream& in,
                                             kj::AsyncOutputStream& out, kj::Duration idle) {
  auto buffer = kj::heapArray<kj::byte>(kPumpBufferSize);
  uint64_t total = 0;
  for (;;) {
    size_t n = co_await timer.timeoutAfter(idle, in.tryRead(buffer.begin(), 1, buffer.size()));
    if (n == 0) {
      break;
    }
    co_await out.write(buffer.first(n));
    total += n;
  }
  co_return total;
}

ReverseProxy::ReverseProxy(kj::Timer& timer, const kj::HttpHeaderTable& headerTable,
                           const ProxyHeaderIds& ids, kj::Own<kj::NetworkAddress> upstream,
                           const RoutingRuleSet& rules)
    : timer_(timer), headerTable_(headerTable), ids_(ids), upstream_(kj::mv(upstream)),
      rules_(rules), client_(kj::newHttpClient(timer, headerTable, *upstream_)) {}

kj::HttpHeaders ReverseProxy::forwarded_headers(kj::StringPtr clientIp,
                                                const kj::HttpHeaders& headers) const {
  auto result = headers.clone();

  if (clientIp.size() > 0) {
    KJ_IF_SOME(existing, headers.get(ids_.xForwardedFor)) {
      result.set(ids_.xForwardedFor, kj::str(existing, ", ", clientIp));
    } else {
      result.set(ids_.xForwardedFor, kj::str(clientIp));
    }
    result.set(ids_.xRealIp, kj::str(clientIp));
  }
  result.set(ids_.xForwardedProto, kj::str(rules_.tls ? "https" : "http"));
  KJ_IF_SOME(host, headers.get(kj::HttpHeaderId::HOST)) {
    result.set(ids_.xForwardedHost, kj::str(host));
  }
  return result;
}

kj::Promise<void> ReverseProxy::forward(kj::StringPtr clientIp, kj::HttpMethod method,
                                        kj::StringPtr url, const kj::HttpHeaders& headers,
                                        kj::AsyncInputStream& requestBody,
                                        kj::HttpService::Response& response) {
  auto upstreamHeaders = forwarded_headers(clientIp, headers);
  if (rules_.websocket && headers.isWebSocket()) {
    return forward_websocket(url, kj::mv(upstreamHeaders), response);
  }
  return forward_http(method, url, kj::mv(upstreamHeaders), requestBody, response);
}

kj::Promise<void> ReverseProxy::forward_http(kj::HttpMethod method, kj::StringPtr url,
                                             kj::HttpHeaders upstreamHeaders,
                                             kj::AsyncInputStream& requestBody,
                                             kj::HttpService::Response& response) {
  auto inner = client_->request(method, url, upstreamHeaders, requestBody.tryGetLength());

  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(2);

  // Upload failures surface on the response side as an upstream error.
  promises.add(pump_with_idle_timeout(timer_, requestBody, *inner.body, rules_.idle_timeout)
                   .ignoreResult()
                   .attach(kj::mv(inner.body))
                   .catch_([url](kj::Exception&& e) {
                     KJ_LOG(WARNING, "request body upload failed", url, e.getDescription());
                   })
                   .eagerlyEvaluate(nullptr));

  promises.add(
      timer_.timeoutAfter(rules_.idle_timeout, kj::mv(inner.response))
          .then(
              [this, &response](kj::HttpClient::Response&& upstream) -> kj::Promise<void> {
                auto out = response.send(upstream.statusCode, upstream.statusText,
                                         *upstream.headers, upstream.body->tryGetLength());
                auto pump = pump_with_idle_timeout(timer_, *upstream.body, *out,
                                                   rules_.idle_timeout);
                return pump.ignoreResult().attach(kj::mv(out), kj::mv(upstream.body));
              },
              [this, &response](kj::Exception&& e) -> kj::Promise<void> {
                return send_gateway_error(e, response);
              }));

  return kj::joinPromises(promises.finish()).attach(kj::mv(upstreamHeaders));
}

kj::Promise<void> ReverseProxy::forward_websocket(kj::StringPtr url,
                                                  kj::HttpHeaders upstreamHeaders,
                                                  kj::HttpService::Response& response) {
  auto upgrade = client_->openWebSocket(url, upstreamHeaders);
  return timer_.timeoutAfter(rules_.idle_timeout, kj::mv(upgrade))
      .then(
          [this, url, &response](kj::HttpClient::WebSocketResponse&& upstream) {
            return relay_upgrade(url, kj::mv(upstream), response);
          },
          [this, &response](kj::Exception&& e) -> kj::Promise<void> {
            return send_gateway_error(e, response);
          })
      .attach(kj::mv(upstreamHeaders));
}

kj::Promise<void> ReverseProxy::relay_upgrade(kj::StringPtr url,
                                              kj::HttpClient::WebSocketResponse upstream,
                                              kj::HttpService::Response& response) {
  if (upstream.webSocketOrBody.is<kj::Own<kj::AsyncInputStream>>()) {
    // Upstream refused the upgrade; pass its answer through.
    auto& body = upstream.webSocketOrBody.get<kj::Own<kj::AsyncInputStream>>();
    auto out = response.send(upstream.statusCode, upstream.statusText, *upstream.headers,
                             body->tryGetLength());
    co_await pump_with_idle_timeout(timer_, *body, *out, rules_.idle_timeout);
    co_return;
  }

  auto& upstreamSocket = *upstream.webSocketOrBody.get<kj::Own<kj::WebSocket>>();
  auto clientSocket = response.acceptWebSocket(*upstream.headers);
  KJ_LOG(INFO, "websocket relay opened", url);

  auto promises = kj::heapArrayBuilder<kj::Promise<void>>(2);
  promises.add(relay(*clientSocket, upstreamSocket));
  promises.add(relay(upstreamSocket, *clientSocket));
  co_await kj::joinPromises(promises.finish());

  KJ_LOG(INFO, "websocket relay closed", url, "received", clientSocket->receivedByteCount(),
         "sent", clientSocket->sentByteCount());
}

kj::Promise<void> ReverseProxy::relay(kj::WebSocket& from, kj::WebSocket& to) {
  kj::Maybe<kj::Exception> failure;
  try {
    for (;;) {
      auto message = co_await timer_.timeoutAfter(rules_.idle_timeout, from.receive());
      if (message.is<kj::String>()) {
        co_await to.send(message.get<kj::String>().asArray());
      } else if (message.is<kj::Array<kj::byte>>()) {
        co_await to.send(message.get<kj::Array<kj::byte>>().asPtr());
      } else {
        auto& close = message.get<kj::WebSocket::Close>();
        co_await to.close(close.code, close.reason);
        break;
      }
    }
  } catch (const kj::Exception& e) {
    failure = e;
  }

  KJ_IF_SOME(e, failure) {
    // Unblock the opposite direction, which is waiting on a receive.
    from.abort();
    to.abort();
    kj::throwFatalException(kj::mv(e));
  }
}

kj::Promise<void> ReverseProxy::send_gateway_error(const kj::Exception& error,
                                                   kj::HttpService::Response& response) {
  kj::uint status = error.getType() == kj::Exception::Type::OVERLOADED ? 504 : 502;
  KJ_LOG(WARNING, "upstream request failed", status, error.getDescription());

  auto text = core::status_text(status);
  auto body = kj::str(status, " ", text, "\n");
  kj::HttpHeaders headers(headerTable_);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "text/plain; charset=utf-8"_kj);
  auto stream = response.send(status, text, headers, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

} // namespace doco::proxy
