#include "doco/proxy/proxy_server.h"

#include "doco/core/http_util.h"

#include <kj/debug.h>

namespace doco::proxy {

// Remembers the peer of one accepted connection so forwarding can report it upstream.
class ProxyServer::ConnectionService final : public kj::HttpService {
public:
  ConnectionService(ProxyServer& server, kj::String clientIp)
      : server_(server), clientIp_(kj::mv(clientIp)) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override {
    return server_.handle(clientIp_, method, url, headers, requestBody, response);
  }

private:
  ProxyServer& server_;
  kj::String clientIp_;
};

ProxyServer::ProxyServer(kj::Timer& timer, kj::Network& network, RoutingRuleSet rules,
                         core::Logger& logger, kj::Duration grace)
    : timer_(timer), network_(network), rules_(kj::mv(rules)), logger_(logger), grace_(grace),
      ids_(headerTableBuilder_), headerTable_(headerTableBuilder_.build()) {}

ProxyServer::~ProxyServer() noexcept = default;

kj::Promise<void> ProxyServer::listen() {
  KJ_REQUIRE(listener_ == kj::none, "load balancer already listening");

  auto upstream = co_await network_.parseAddress(core::dial_address(rules_.upstream_address));
  auto address = co_await network_.parseAddress(core::listen_address(rules_.listen_address));
  auto listener = address->listen();

  proxy_ = kj::heap<ReverseProxy>(timer_, *headerTable_, ids_, kj::mv(upstream), rules_);
  static_ = kj::heap<StaticFileServer>(
      *headerTable_, StaticFileServer::Config{kj::str(rules_.static_root), true, 3600,
                                              64 * 1024 * 1024});
  server_ = kj::heap<kj::HttpServer>(
      timer_, *headerTable_, [this](kj::AsyncIoStream& connection) -> kj::Own<kj::HttpService> {
        return kj::heap<ConnectionService>(*this, core::peer_ip(connection));
      });

  KJ_LOG(INFO, "load balancer listening", rules_.listen_address, listener->getPort());
  listener_ = kj::mv(listener);
}

kj::uint ProxyServer::port() const {
  KJ_IF_SOME(listener, listener_) {
    return listener->getPort();
  }
  KJ_FAIL_REQUIRE("load balancer is not listening");
}

kj::Promise<void> ProxyServer::handle(kj::StringPtr clientIp, kj::HttpMethod method,
                                      kj::StringPtr url, const kj::HttpHeaders& headers,
                                      kj::AsyncInputStream& requestBody,
                                      kj::HttpService::Response& response) {
  auto target = core::split_request_target(url);

  if (rules_.is_api_path(target.path)) {
    KJ_IF_SOME(proxy, proxy_) {
      return proxy->forward(clientIp, method, url, headers, requestBody, response);
    }
  } else {
    KJ_IF_SOME(files, static_) {
      bool fallback = rules_.rewrites_to_index(target.path);
      return files->serve_file(method, target.path, headers, response, fallback)
          .attach(kj::mv(target));
    }
  }
  KJ_FAIL_REQUIRE("load balancer is not listening");
}

kj::Promise<void> ProxyServer::run(core::ShutdownSignal& signal) {
  if (listener_ == kj::none) {
    co_await listen();
  }

  auto& listener = *KJ_ASSERT_NONNULL(listener_);
  auto& server = *KJ_ASSERT_NONNULL(server_);

  logger_.info("start load balancer", {{"lb-addr", rules_.listen_address},
                                       {"svc-addr", rules_.upstream_address},
                                       {"web", rules_.static_root}});
  if (logger_.enabled(core::LogLevel::Debug)) {
    auto caddyfile = render_caddyfile(rules_);
    logger_.debug("routing configuration", {{"caddyfile", caddyfile}});
  }

  co_await server.listenHttp(listener).exclusiveJoin(signal.when_cancelled());

  logger_.info("load balancer draining");
  bool drained = co_await server.drain()
                     .then([]() { return true; })
                     .exclusiveJoin(timer_.afterDelay(grace_).then([]() { return false; }));
  if (!drained) {
    logger_.warn("drain grace period elapsed, closing remaining connections");
  }
  logger_.info("load balancer stopped");
}

} // namespace doco::proxy
