#pragma once

#include "gateway_server.h"
#include "handlers/blob_handler.h"
#include "handlers/metrics_handler.h"
#include "router.h"
#include "session/session_manager.h"

#include "doco/core/logger.h"
#include "doco/core/metrics.h"
#include "doco/core/shutdown_signal.h"
#include "doco/store/blob_store.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/time.h>

namespace doco::gateway {

/**
 * @brief The API service: the gateway with doco's middleware and routes on one listener.
 *
 * Global middleware, in order: session load-and-save, CORS, request id, real IP, request
 * logger, recoverer. Routes live under /api:
 * - GET /api/blobs/{blob_id} (behind the session gate)
 * - GET /api/metrics
 * - GET /api/check
 */
class ApiServer final {
public:
  struct Options {
    kj::String address = kj::str(":8081");
    bool requireAuth = false;
    kj::Duration grace = 5 * kj::SECONDS;
  };

  ApiServer(kj::Timer& timer, kj::Network& network, const kj::Clock& clock,
            store::BlobStore& blobs, SessionManager& sessions, core::MetricsRegistry& metrics,
            core::Logger& logger, Options options);
  ~ApiServer() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(ApiServer);

  /**
   * @brief Bind the listen address. Bind failures reject.
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

  [[nodiscard]] GatewayServer& gateway() {
    return gateway_;
  }

  [[nodiscard]] const kj::HttpHeaderTable& header_table() const {
    return *headerTable_;
  }

private:
  kj::Timer& timer_;
  kj::Network& network_;
  core::Logger& logger_;
  Options options_;

  kj::Own<kj::HttpHeaderTable> headerTable_;
  BlobHandler blobs_;
  MetricsHandler metrics_;
  Router router_;
  GatewayServer gateway_;

  kj::Maybe<kj::Own<kj::ConnectionReceiver>> listener_;
  kj::Maybe<kj::Own<kj::HttpServer>> server_;

  void register_routes();
};

} // namespace doco::gateway
