#pragma once

#include "doco/core/logger.h"
#include "doco/core/shutdown_signal.h"
#include "doco/proxy/reverse_proxy.h"
#include "doco/proxy/routing_rules.h"
#include "doco/proxy/static_file_server.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/time.h>

namespace doco::proxy {

/**
 * @brief The load balancer: one HTTP listener applying a RoutingRuleSet.
 *
 * Requests under the API prefix go to the upstream through ReverseProxy; everything else is
 * served from the static root with SPA fallback.
 *
 * @code
 * ProxyServer proxy(timer, network, make_routing_rules(":8080", ":8081", "./web/dist"), logger);
 * co_await proxy.run(shutdown);
 * @endcode
 */
class ProxyServer final {
public:
  ProxyServer(kj::Timer& timer, kj::Network& network, RoutingRuleSet rules,
              core::Logger& logger, kj::Duration grace = 5 * kj::SECONDS);
  ~ProxyServer() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(ProxyServer);

  /**
   * @brief Resolve the upstream and bind the listen address. Bind failures reject.
   */
  kj::Promise<void> listen();

  /**
   * @brief Serve until the listener fails or signal is cancelled, then drain for at most the
   * grace period. Calls listen() first if it has not been called.
   */
  kj::Promise<void> run(core::ShutdownSignal& signal);

  /**
   * @brief Bound port. Only valid after listen().
   */
  [[nodiscard]] kj::uint port() const;

  [[nodiscard]] const RoutingRuleSet& rules() const {
    return rules_;
  }

  /**
   * @brief Dispatch one request. Exposed for the per-connection service.
   */
  kj::Promise<void> handle(kj::StringPtr clientIp, kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                           kj::HttpService::Response& response);

private:
  class ConnectionService;

  kj::Timer& timer_;
  kj::Network& network_;
  RoutingRuleSet rules_;
  core::Logger& logger_;
  kj::Duration grace_;

  kj::HttpHeaderTable::Builder headerTableBuilder_;
  ProxyHeaderIds ids_;
  kj::Own<kj::HttpHeaderTable> headerTable_;

  kj::Maybe<kj::Own<kj::ConnectionReceiver>> listener_;
  kj::Maybe<kj::Own<ReverseProxy>> proxy_;
  kj::Maybe<kj::Own<StaticFileServer>> static_;
  kj::Maybe<kj::Own<kj::HttpServer>> server_;
};

} // namespace doco::proxy
