#pragma once

#include "middleware.h"
#include "router.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/vector.h>

namespace doco::gateway {

/**
 * @brief HTTP gateway server that dispatches requests through the Router.
 *
 * GatewayServer implements kj::HttpService and handles incoming HTTP requests
 * by running them through the global middleware chain and then the Router.
 *
 * Request flow:
 * 1. Parse URL to extract path and query string
 * 2. Create RequestContext and ResponseWriter for the request
 * 3. Run the global middleware in registration order
 * 4. Router::dispatch() runs the group middleware and the handler, or answers 404/405
 */
class GatewayServer final : public kj::HttpService {
public:
  /**
   * @brief Construct a GatewayServer with a Router reference.
   *
   * @param headerTable The HTTP header table for response headers
   * @param router The router to dispatch requests to (must outlive this server)
   */
  GatewayServer(const kj::HttpHeaderTable& headerTable, Router& router);

  /**
   * @brief Append a middleware to the global chain.
   */
  void use(kj::Own<Middleware> middleware);

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override;

  /**
   * @brief Handle one request from clientIp, the TCP peer of its connection.
   */
  kj::Promise<void> handle(kj::StringPtr clientIp, kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                           Response& response);

  /**
   * @brief Service for one accepted connection, for use as a kj::HttpServer factory.
   */
  kj::Own<kj::HttpService> connection(kj::AsyncIoStream& stream);

private:
  class ConnectionService;

  const kj::HttpHeaderTable& headerTable_;
  Router& router_;
  kj::Vector<kj::Own<Middleware>> middleware_;
  kj::Vector<Middleware*> chain_;
  Handler dispatch_;
};

} // namespace doco::gateway
