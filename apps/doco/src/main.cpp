/**
 * @file main.cpp
 * @brief Entry point for doco
 *
 * Runs three actors in one ServiceGroup on a single KJ event loop:
 * 1. "api": the API gateway (sessions, CORS, blobs, metrics)
 * 2. "load balancer": the reverse proxy in front of the API and the web bundle
 * 3. "signals": resolves on SIGINT or SIGTERM
 *
 * The first actor to stop, cleanly or not, shuts the others down. The process exits 0
 * after a clean shutdown and 1 when any actor failed.
 */

#include "api_server.h"
#include "doco_config.h"
#include "session/memory_session_store.h"
#include "session/session_manager.h"

#include "doco/core/logger.h"
#include "doco/core/metrics.h"
#include "doco/core/service_group.h"
#include "doco/core/shutdown_signal.h"
#include "doco/proxy/proxy_server.h"
#include "doco/proxy/routing_rules.h"
#include "doco/store/directory_blob_store.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/time.h>

namespace doco {

namespace {

const kj::StringPtr kVersion = "0.0.1"_kj;

kj::Own<store::DirectoryBlobStore> open_blob_store(kj::StringPtr blobDir) {
  auto fs = kj::newDiskFilesystem();
  auto path = fs->getCurrentPath().evalNative(blobDir);
  auto dir = fs->getRoot().openSubdir(
      kj::mv(path), kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
  return kj::heap<store::DirectoryBlobStore>(kj::mv(dir));
}

kj::Promise<void> wait_for_signal(kj::UnixEventPort& port, core::Logger& logger) {
  auto info = co_await port.onSignal(SIGINT).exclusiveJoin(port.onSignal(SIGTERM));
  logger.info("signal received", {{"signal", kj::str(info.si_signo)}});
}

/**
 * @brief Wire the services together and run them until one stops.
 */
int run(const DocoConfig& config) {
  auto serverLogger = core::make_console_logger("server", kVersion, config.debug);
  auto lbLogger = core::make_console_logger("lb", kVersion, config.debug);

  auto io = kj::setupAsyncIo();
  auto& clock = kj::systemPreciseCalendarClock();

  auto blobs = open_blob_store(config.blob_dir);
  MemorySessionStore sessionStore(clock);
  SessionManager::Config sessionConfig;
  sessionConfig.lifetime = config.session_lifetime();
  SessionManager sessions(sessionStore, clock, kj::mv(sessionConfig));
  core::MetricsRegistry metrics;

  gateway::ApiServer api(io.provider->getTimer(), io.provider->getNetwork(), clock, *blobs,
                         sessions, metrics, *serverLogger,
                         gateway::ApiServer::Options{
                             .address = kj::str(config.server_addr),
                             .requireAuth = config.require_auth,
                             .grace = config.shutdown_grace(),
                         });

  auto rules = proxy::make_routing_rules(config.load_balancer_addr, config.server_addr,
                                         config.root_path);
  lbLogger->debug("proxy configuration", {{"caddyfile", proxy::render_caddyfile(rules)}});
  proxy::ProxyServer loadBalancer(io.provider->getTimer(), io.provider->getNetwork(),
                                  kj::mv(rules), *lbLogger, config.shutdown_grace());

  core::ShutdownSignal shutdown;
  core::ServiceGroup group;
  auto interrupt = [&]() {
    return [&](const kj::Exception& reason) { shutdown.cancel(reason.getDescription()); };
  };

  group.add("api", [&]() { return api.run(shutdown); }, interrupt());
  group.add("load balancer", [&]() { return loadBalancer.run(shutdown); }, interrupt());
  group.add(
      "signals",
      [&]() {
        return wait_for_signal(io.unixEventPort, *serverLogger)
            .exclusiveJoin(shutdown.when_cancelled());
      },
      interrupt());

  try {
    group.run().wait(io.waitScope);
  } catch (const kj::Exception& e) {
    serverLogger->critical("doco stopped with an error", {{"err", e.getDescription()}});
    return 1;
  }

  serverLogger->info("doco stopped");
  return 0;
}

} // namespace

} // namespace doco

int main(int argc, char** argv) {
  using namespace doco;

  bool showConfig = false;
  for (int i = 1; i < argc; ++i) {
    kj::StringPtr arg = argv[i];
    if (arg == "--config" || arg == "-config") {
      showConfig = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << DocoConfig::usage().cStr();
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg.cStr() << "\n" << DocoConfig::usage().cStr();
      return 2;
    }
  }

  try {
    auto config = DocoConfig::load_from_env();
    if (showConfig) {
      std::cout << config.describe().cStr();
      return 0;
    }
    config.validate();

    // Signals must be captured before the event loop starts so onSignal() can observe them.
    kj::UnixEventPort::captureSignal(SIGINT);
    kj::UnixEventPort::captureSignal(SIGTERM);

    std::cout << "Booting up doco system..." << std::endl;
    return run(config);
  } catch (const kj::Exception& e) {
    std::cerr << "doco: " << e.getDescription().cStr() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "doco: " << e.what() << std::endl;
    return 1;
  }
}
