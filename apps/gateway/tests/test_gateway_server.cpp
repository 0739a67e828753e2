#include "api_server.h"
#include "gateway_server.h"
#include "router.h"
#include "session/memory_session_store.h"
#include "session/session_manager.h"
#include "test_common.h"

#include "doco/core/http_util.h"
#include "doco/core/logger.h"
#include "doco/core/metrics.h"
#include "doco/core/shutdown_signal.h"
#include "doco/store/memory_blob_store.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/test.h>

namespace doco::gateway {
namespace {

using test::FakeClock;

struct Fetched {
  kj::uint status;
  kj::String body;
  kj::Vector<kj::String> headerLines;

  kj::Maybe<kj::StringPtr> header(kj::StringPtr name) const {
    auto prefix = kj::str(name, ": ");
    for (auto& line : headerLines) {
      if (line.startsWith(prefix)) {
        return line.slice(prefix.size());
      }
    }
    return kj::none;
  }
};

struct Outgoing {
  kj::HttpMethod method = kj::HttpMethod::GET;
  kj::StringPtr url;
  kj::StringPtr origin = "";
  kj::StringPtr cookie = "";
  kj::StringPtr requestMethod = "";
};

Fetched fetch(kj::AsyncIoContext& io, kj::uint port, const Outgoing& out) {
  kj::HttpHeaderTable table;
  auto address = io.provider->getNetwork().parseAddress("127.0.0.1", port).wait(io.waitScope);
  auto client = kj::newHttpClient(io.provider->getTimer(), table, *address);

  kj::HttpHeaders headers(table);
  headers.setPtr(kj::HttpHeaderId::HOST, "doco.test");
  if (out.origin.size() > 0) {
    headers.addPtrPtr("Origin", out.origin);
  }
  if (out.cookie.size() > 0) {
    headers.addPtrPtr("Cookie", out.cookie);
  }
  if (out.requestMethod.size() > 0) {
    headers.addPtrPtr("Access-Control-Request-Method", out.requestMethod);
  }

  auto request = client->request(out.method, out.url, headers, uint64_t(0));
  request.body = nullptr;
  auto response = request.response.wait(io.waitScope);
  Fetched result{response.statusCode, response.body->readAllText().wait(io.waitScope), {}};
  response.headers->forEach([&](kj::StringPtr name, kj::StringPtr value) {
    result.headerLines.add(kj::str(name, ": ", value));
  });
  return result;
}

// ApiServer on an ephemeral loopback port with in-memory stores.
struct ApiFixture {
  kj::Vector<kj::String> lines;
  kj::Own<core::Logger> logger = test::make_capture_logger(lines);
  FakeClock clock;
  store::MemoryBlobStore blobs;
  MemorySessionStore sessionStore{clock};
  SessionManager sessions{sessionStore, clock};
  core::MetricsRegistry metrics;
  ApiServer api;
  core::ShutdownSignal shutdown;
  kj::Promise<void> running = nullptr;

  ApiFixture(kj::AsyncIoContext& io, bool requireAuth = false)
      : api(io.provider->getTimer(), io.provider->getNetwork(), clock, blobs, sessions, metrics,
            *logger,
            ApiServer::Options{.address = kj::str("127.0.0.1:0"),
                               .requireAuth = requireAuth,
                               .grace = 100 * kj::MILLISECONDS}) {
    blobs.put(store::Blob{kj::str("hello.txt"), kj::str("text/plain"),
                          kj::heapArray("hello world"_kj.asBytes()), kj::none});
    api.listen().wait(io.waitScope);
    running = api.run(shutdown).eagerlyEvaluate(nullptr);
  }

  void stop(kj::WaitScope& waitScope) {
    shutdown.cancel("test finished");
    running.wait(waitScope);
  }
};

// ============================================================================
// GatewayServer dispatch
// ============================================================================

KJ_TEST("GatewayServer: splits the request target and runs middleware before the router") {
  test::TestContext tc;
  Router router;
  kj::Vector<kj::String> seen;
  router.add_route(kj::HttpMethod::GET, "/api/echo", [&](RequestContext& ctx) {
    seen.add(kj::str(ctx.path, "|", ctx.queryString, "|", ctx.clientIP));
    kj::HttpHeaders headers(ctx.headerTable);
    ctx.response.send(204, "No Content", headers, uint64_t(0));
    return kj::Promise<void>(kj::READY_NOW);
  });

  class Tagging final : public Middleware {
  public:
    explicit Tagging(kj::Vector<kj::String>& seen) : seen_(seen) {}
    kj::Promise<void> process(RequestContext& ctx,
                              kj::Function<kj::Promise<void>()> next) override {
      seen_.add(kj::str("middleware ", ctx.path));
      return next();
    }

  private:
    kj::Vector<kj::String>& seen_;
  };

  GatewayServer server(tc.headerTable, router);
  server.use(kj::heap<Tagging>(seen));

  test::MockResponse response(tc.headerTable);
  kj::HttpHeaders headers(tc.headerTable);
  test::MockInputStream body;
  server.handle("10.1.2.3", kj::HttpMethod::GET, "/api/echo?x=1", headers, body, response)
      .wait(tc.waitScope);

  KJ_EXPECT(response.statusCode == 204);
  KJ_ASSERT(seen.size() == 2);
  KJ_EXPECT(seen[0] == "middleware /api/echo");
  KJ_EXPECT(seen[1] == "/api/echo|x=1|10.1.2.3");
}

KJ_TEST("GatewayServer: unknown route without middleware answers 404") {
  test::TestContext tc;
  Router router;
  GatewayServer server(tc.headerTable, router);

  test::MockResponse response(tc.headerTable);
  kj::HttpHeaders headers(tc.headerTable);
  test::MockInputStream body;
  server.request(kj::HttpMethod::GET, "/missing", headers, body, response).wait(tc.waitScope);

  KJ_EXPECT(response.statusCode == 404);
  KJ_EXPECT(response.bodyText() ==
            R"({"err":"route not found: /missing","message":"route not found: /missing"})");
}

// ============================================================================
// ApiServer over loopback
// ============================================================================

KJ_TEST("ApiServer: check answers an empty object with a request id") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io);

  auto result = fetch(io, fixture.api.port(), {.url = "/api/check"});
  KJ_EXPECT(result.status == 200);
  KJ_EXPECT(result.body == "{}");
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.header("Content-Type")) == "application/json");
  KJ_EXPECT(KJ_ASSERT_NONNULL(result.header("X-Request-Id")).endsWith("-000001"));
  KJ_EXPECT(result.header("Set-Cookie") == kj::none);

  fixture.stop(io.waitScope);
  KJ_EXPECT(test::any_line_contains(fixture.lines, "\"path\":\"/api/check\""));
  KJ_EXPECT(test::any_line_contains(fixture.lines, "start api"));
  KJ_EXPECT(test::any_line_contains(fixture.lines, "api stopped"));
}

KJ_TEST("ApiServer: blob download with range support") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io);

  auto full = fetch(io, fixture.api.port(), {.url = "/api/blobs/hello.txt"});
  KJ_EXPECT(full.status == 200);
  KJ_EXPECT(full.body == "hello world");
  KJ_EXPECT(KJ_ASSERT_NONNULL(full.header("Content-Disposition")) ==
            "attachment;filename=hello.txt");

  auto missing = fetch(io, fixture.api.port(), {.url = "/api/blobs/absent"});
  KJ_EXPECT(missing.status == 400);
  KJ_EXPECT(missing.body ==
            R"({"err":"blob not found: absent","message":"blob not found: absent"})");

  fixture.stop(io.waitScope);
}

KJ_TEST("ApiServer: router errors keep the JSON envelope") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io);

  auto notFound = fetch(io, fixture.api.port(), {.url = "/api/unknown"});
  KJ_EXPECT(notFound.status == 404);
  KJ_EXPECT(notFound.body.startsWith(R"({"err":"route not found: /api/unknown")"));

  auto notAllowed =
      fetch(io, fixture.api.port(), {.method = kj::HttpMethod::DELETE, .url = "/api/check"});
  KJ_EXPECT(notAllowed.status == 405);
  KJ_EXPECT(KJ_ASSERT_NONNULL(notAllowed.header("Allow")) == "GET");

  fixture.stop(io.waitScope);
}

KJ_TEST("ApiServer: CORS preflight is answered before routing") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io);

  auto preflight = fetch(io, fixture.api.port(),
                         {.method = kj::HttpMethod::OPTIONS,
                          .url = "/api/blobs/hello.txt",
                          .origin = "https://app.example.com",
                          .requestMethod = "GET"});
  KJ_EXPECT(preflight.status == 200);
  KJ_EXPECT(KJ_ASSERT_NONNULL(preflight.header("Access-Control-Allow-Origin")) ==
            "https://app.example.com");
  KJ_EXPECT(KJ_ASSERT_NONNULL(preflight.header("Access-Control-Max-Age")) == "300");

  auto actual = fetch(io, fixture.api.port(),
                      {.url = "/api/check", .origin = "https://app.example.com"});
  KJ_EXPECT(actual.status == 200);
  KJ_EXPECT(KJ_ASSERT_NONNULL(actual.header("Access-Control-Allow-Credentials")) == "true");

  fixture.stop(io.waitScope);
}

KJ_TEST("ApiServer: session gate protects blobs when enabled") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io, true);

  auto denied = fetch(io, fixture.api.port(), {.url = "/api/blobs/hello.txt"});
  KJ_EXPECT(denied.status == 401);
  KJ_EXPECT(denied.body == R"({"err":"unauthorized","message":"authentication required"})");

  // Open routes stay reachable.
  KJ_EXPECT(fetch(io, fixture.api.port(), {.url = "/api/check"}).status == 200);

  // A stored session carrying a user id passes the gate.
  Session session(kj::str(), fixture.clock.now() + 1 * kj::HOURS);
  session.put("user_id", "42");
  fixture.sessionStore.commit("known-token", session.encode(), session.expiry());

  auto allowed = fetch(io, fixture.api.port(),
                       {.url = "/api/blobs/hello.txt", .cookie = "session=known-token"});
  KJ_EXPECT(allowed.status == 200);
  KJ_EXPECT(allowed.body == "hello world");
  KJ_EXPECT(allowed.header("Set-Cookie") == kj::none);

  fixture.stop(io.waitScope);
}

KJ_TEST("ApiServer: metrics count served requests") {
  auto io = kj::setupAsyncIo();
  ApiFixture fixture(io);

  fetch(io, fixture.api.port(), {.url = "/api/check"});
  auto scrape = fetch(io, fixture.api.port(), {.url = "/api/metrics"});
  KJ_EXPECT(scrape.status == 200);
  KJ_EXPECT(scrape.body.find("doco_http_requests_total 1") != kj::none, scrape.body);

  fixture.stop(io.waitScope);
}

KJ_TEST("ApiServer: bind failure rejects listen") {
  auto io = kj::setupAsyncIo();
  ApiFixture first(io);
  auto port = first.api.port();

  auto lines = kj::Vector<kj::String>();
  auto logger = test::make_capture_logger(lines);
  FakeClock clock;
  store::MemoryBlobStore blobs;
  MemorySessionStore sessionStore(clock);
  SessionManager sessions(sessionStore, clock);
  core::MetricsRegistry metrics;
  ApiServer second(io.provider->getTimer(), io.provider->getNetwork(), clock, blobs, sessions,
                   metrics, *logger,
                   ApiServer::Options{.address = kj::str("127.0.0.1:", port)});

  auto result = kj::runCatchingExceptions([&]() { second.listen().wait(io.waitScope); });
  KJ_EXPECT(result != kj::none);

  first.stop(io.waitScope);
}

} // namespace
} // namespace doco::gateway
