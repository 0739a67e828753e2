#include "api_server.h"

#include "handlers/check_handler.h"
#include "middleware/cors_middleware.h"
#include "middleware/real_ip_middleware.h"
#include "middleware/recoverer_middleware.h"
#include "middleware/request_id_middleware.h"
#include "middleware/request_logger_middleware.h"
#include "middleware/session_middleware.h"

#include "doco/core/http_util.h"

#include <kj/debug.h>

namespace doco::gateway {

ApiServer::ApiServer(kj::Timer& timer, kj::Network& network, const kj::Clock& clock,
                     store::BlobStore& blobs, SessionManager& sessions,
                     core::MetricsRegistry& metrics, core::Logger& logger, Options options)
    : timer_(timer), network_(network), logger_(logger), options_(kj::mv(options)),
      headerTable_(kj::heap<kj::HttpHeaderTable>()), blobs_(blobs, clock), metrics_(metrics),
      gateway_(*headerTable_, router_) {
  gateway_.use(kj::heap<SessionMiddleware>(sessions));
  gateway_.use(kj::heap<CorsMiddleware>(CorsMiddleware::default_config()));
  gateway_.use(kj::heap<RequestIdMiddleware>());
  gateway_.use(kj::heap<RealIpMiddleware>());
  gateway_.use(kj::heap<RequestLoggerMiddleware>(logger, metrics));
  gateway_.use(kj::heap<RecovererMiddleware>(logger));

  register_routes();
}

ApiServer::~ApiServer() noexcept = default;

void ApiServer::register_routes() {
  auto& api = router_.group("/api");

  // Authenticated routes
  auto& secured = api.group("");
  secured.use(kj::heap<RequireSessionMiddleware>(options_.requireAuth));
  secured.add_route(kj::HttpMethod::GET, "/blobs/{blob_id}", blobs_.handler());

  // Public routes
  auto& open = api.group("");
  open.add_route(kj::HttpMethod::GET, "/metrics", metrics_.handler());
  open.add_route(kj::HttpMethod::GET, "/check", check_handler());

  KJ_LOG(INFO, "API routes registered", router_.route_count());
}

kj::Promise<void> ApiServer::listen() {
  KJ_REQUIRE(listener_ == kj::none, "api already listening");

  auto address = co_await network_.parseAddress(core::listen_address(options_.address));
  auto listener = address->listen();

  server_ = kj::heap<kj::HttpServer>(
      timer_, *headerTable_, [this](kj::AsyncIoStream& connection) -> kj::Own<kj::HttpService> {
        return gateway_.connection(connection);
      });

  KJ_LOG(INFO, "api listening", options_.address, listener->getPort());
  listener_ = kj::mv(listener);
}

kj::uint ApiServer::port() const {
  KJ_IF_SOME(listener, listener_) {
    return listener->getPort();
  }
  KJ_FAIL_REQUIRE("api is not listening");
}

kj::Promise<void> ApiServer::run(core::ShutdownSignal& signal) {
  if (listener_ == kj::none) {
    co_await listen();
  }

  auto& listener = *KJ_ASSERT_NONNULL(listener_);
  auto& server = *KJ_ASSERT_NONNULL(server_);

  logger_.info("start api", {{"svc-addr", options_.address}});

  co_await server.listenHttp(listener).exclusiveJoin(signal.when_cancelled());

  logger_.info("api draining");
  bool drained = co_await server.drain()
                     .then([]() { return true; })
                     .exclusiveJoin(timer_.afterDelay(options_.grace).then([]() { return false; }));
  if (!drained) {
    logger_.warn("drain grace period elapsed, closing remaining connections");
  }
  logger_.info("api stopped");
}

} // namespace doco::gateway
