#include "gateway_server.h"

#include "doco/core/http_util.h"

#include <kj/debug.h>
#include <kj/memory.h>
#include <kj/string.h>

namespace doco::gateway {

class GatewayServer::ConnectionService final : public kj::HttpService {
public:
  ConnectionService(GatewayServer& server, kj::String clientIp)
      : server_(server), clientIp_(kj::mv(clientIp)) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override {
    return server_.handle(clientIp_, method, url, headers, requestBody, response);
  }

private:
  GatewayServer& server_;
  kj::String clientIp_;
};

GatewayServer::GatewayServer(const kj::HttpHeaderTable& headerTable, Router& router)
    : headerTable_(headerTable), router_(router),
      dispatch_([this](RequestContext& ctx) { return router_.dispatch(ctx); }) {}

void GatewayServer::use(kj::Own<Middleware> middleware) {
  chain_.add(middleware.get());
  middleware_.add(kj::mv(middleware));
}

kj::Own<kj::HttpService> GatewayServer::connection(kj::AsyncIoStream& stream) {
  return kj::heap<ConnectionService>(*this, core::peer_ip(stream));
}

kj::Promise<void> GatewayServer::request(kj::HttpMethod method, kj::StringPtr url,
                                         const kj::HttpHeaders& headers,
                                         kj::AsyncInputStream& requestBody, Response& response) {
  return handle(""_kj, method, url, headers, requestBody, response);
}

kj::Promise<void> GatewayServer::handle(kj::StringPtr clientIp, kj::HttpMethod method,
                                        kj::StringPtr url, const kj::HttpHeaders& headers,
                                        kj::AsyncInputStream& requestBody, Response& response) {
  // Extract path and query string from URL
  auto target = core::split_request_target(url);

  // Log incoming request (debug level)
  KJ_LOG(DBG, "Incoming request", "method", Router::get_method_name(method), "path", target.path,
         "query", target.query);

  auto writer = kj::heap<ResponseWriter>(response);
  auto ctx = kj::heap<RequestContext>(RequestContext{
      .method = method,
      .url = url,
      .path = target.path,
      .queryString = target.query,
      .headers = headers,
      .body = requestBody,
      .response = *writer,
      .headerTable = headerTable_,
      .path_params = {},
      .clientIP = kj::str(clientIp), // Replaced by RealIpMiddleware when proxied
      .requestId = kj::str(),        // Populated by RequestIdMiddleware
      .session = kj::none,
  });

  auto promise = run_chain(chain_.asPtr(), *ctx, dispatch_);
  return promise.attach(kj::mv(ctx), kj::mv(writer), kj::mv(target));
}

} // namespace doco::gateway
