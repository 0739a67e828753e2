#pragma once

#include "doco/proxy/routing_rules.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::proxy {

/**
 * @brief Header ids registered for transparent forwarding.
 */
struct ProxyHeaderIds {
  kj::HttpHeaderId xForwardedFor;
  kj::HttpHeaderId xRealIp;
  kj::HttpHeaderId xForwardedProto;
  kj::HttpHeaderId xForwardedHost;

  explicit ProxyHeaderIds(kj::HttpHeaderTable::Builder& builder);
};

/**
 * @brief Forwards requests to a single upstream address.
 *
 * The request target and headers are passed through unchanged apart from the X-Forwarded-*
 * family. WebSocket upgrades are relayed message by message. Every upstream read is bounded
 * by the rule set's idle timeout.
 */
class ReverseProxy final {
public:
  /**
   * @param upstream Resolved upstream address; connections are opened per request as needed
   * @param rules Must outlive the proxy
   */
  ReverseProxy(kj::Timer& timer, const kj::HttpHeaderTable& headerTable, const ProxyHeaderIds& ids,
               kj::Own<kj::NetworkAddress> upstream, const RoutingRuleSet& rules);

  KJ_DISALLOW_COPY_AND_MOVE(ReverseProxy);

  kj::Promise<void> forward(kj::StringPtr clientIp, kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            kj::HttpService::Response& response);

  /**
   * @brief Copy of headers with the forwarding headers added for clientIp.
   *
   * X-Forwarded-For is appended to, X-Real-IP and X-Forwarded-Proto are replaced and
   * X-Forwarded-Host carries the original Host. Host itself is preserved.
   */
  [[nodiscard]] kj::HttpHeaders forwarded_headers(kj::StringPtr clientIp,
                                                  const kj::HttpHeaders& headers) const;

private:
  kj::Timer& timer_;
  const kj::HttpHeaderTable& headerTable_;
  const ProxyHeaderIds& ids_;
  kj::Own<kj::NetworkAddress> upstream_;
  const RoutingRuleSet& rules_;
  kj::Own<kj::HttpClient> client_;

  kj::Promise<void> forward_http(kj::HttpMethod method, kj::StringPtr url,
                                 kj::HttpHeaders upstreamHeaders, kj::AsyncInputStream& requestBody,
                                 kj::HttpService::Response& response);

  kj::Promise<void> forward_websocket(kj::StringPtr url, kj::HttpHeaders upstreamHeaders,
                                      kj::HttpService::Response& response);

  kj::Promise<void> relay_upgrade(kj::StringPtr url, kj::HttpClient::WebSocketResponse upstream,
                                  kj::HttpService::Response& response);

  kj::Promise<void> relay(kj::WebSocket& from, kj::WebSocket& to);

  kj::Promise<void> send_gateway_error(const kj::Exception& error,
                                       kj::HttpService::Response& response);
};

/**
 * @brief Copy in to out, failing with an OVERLOADED exception when a single read waits longer
 * than idle. Returns the number of bytes copied.
 */
kj::Promise<uint64_t> pump_with_idle_timeout(kj::Timer& timer, kj::AsyncInputStream& in,
                                             kj::AsyncOutputStream& out, kj::Duration idle);

} // namespace doco::proxy
