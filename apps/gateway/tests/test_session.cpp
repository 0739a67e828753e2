#include "middleware/session_middleware.h"
#include "session/memory_session_store.h"
#include "session/session.h"
#include "session/session_manager.h"
#include "test_common.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/test.h>

namespace doco::gateway {
namespace {

using test::FakeClock;
using test::RequestFixture;
using test::TestContext;

KJ_TEST("find_cookie: picks the named cookie") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_cookie("a=1; session=tok; b=2", "session")) == "tok");
  KJ_EXPECT(KJ_ASSERT_NONNULL(find_cookie("session=tok ", "session")) == "tok");
  KJ_EXPECT(find_cookie("sessionx=1; xsession=2", "session") == kj::none);
  KJ_EXPECT(find_cookie("", "session") == kj::none);
}

KJ_TEST("Session: put, remove and destroy track status") {
  Session session(kj::str(), kj::UNIX_EPOCH);
  KJ_EXPECT(session.status() == SessionStatus::Unmodified);

  session.put("user_id", "42");
  KJ_EXPECT(session.status() == SessionStatus::Modified);
  KJ_EXPECT(KJ_ASSERT_NONNULL(session.get("user_id")) == "42");

  session.put("user_id", "43");
  KJ_EXPECT(session.size() == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(session.get("user_id")) == "43");

  session.remove("user_id");
  KJ_EXPECT(!session.exists("user_id"));

  session.put("theme", "dark");
  session.destroy();
  KJ_EXPECT(session.status() == SessionStatus::Destroyed);
  KJ_EXPECT(session.size() == 0);
}

KJ_TEST("Session: encoded data restores values and deadline") {
  Session session(kj::str("tok"), kj::UNIX_EPOCH + 1700086400 * kj::SECONDS);
  session.put("user_id", "42");

  auto restored = Session::decode("tok", session.encode());
  KJ_EXPECT(restored->token() == "tok");
  KJ_EXPECT(restored->expiry() == kj::UNIX_EPOCH + 1700086400 * kj::SECONDS);
  KJ_EXPECT(KJ_ASSERT_NONNULL(restored->get("user_id")) == "42");
  KJ_EXPECT(restored->status() == SessionStatus::Unmodified);

  KJ_EXPECT_THROW_MESSAGE("no deadline", Session::decode("tok", "{\"values\":{}}"));
}

KJ_TEST("MemorySessionStore: expired entries are not returned") {
  FakeClock clock;
  MemorySessionStore store(clock);

  store.commit("a", "{}", clock.time + 10 * kj::SECONDS);
  store.commit("b", "{}", clock.time + 100 * kj::SECONDS);
  KJ_EXPECT(store.find("a") != kj::none);

  clock.time = clock.time + 50 * kj::SECONDS;
  KJ_EXPECT(store.find("a") == kj::none);
  KJ_EXPECT(store.find("b") != kj::none);

  clock.time = clock.time + 100 * kj::SECONDS;
  KJ_EXPECT(store.cleanup() == 1);
  KJ_EXPECT(store.size() == 0);

  store.commit("c", "{}", clock.time + 10 * kj::SECONDS);
  store.remove("c");
  KJ_EXPECT(store.find("c") == kj::none);
}

KJ_TEST("MemorySessionStore: commit sweeps expired entries once per interval") {
  FakeClock clock;
  MemorySessionStore store(clock, 60 * kj::SECONDS);

  store.commit("a", "{}", clock.time + 10 * kj::SECONDS);
  store.commit("b", "{}", clock.time + 10 * kj::SECONDS);

  // Expired, but the interval has not elapsed yet
  clock.time = clock.time + 30 * kj::SECONDS;
  store.commit("c", "{}", clock.time + 100 * kj::SECONDS);
  KJ_EXPECT(store.size() == 3);

  clock.time = clock.time + 40 * kj::SECONDS;
  store.commit("d", "{}", clock.time + 100 * kj::SECONDS);
  KJ_EXPECT(store.size() == 2);
  KJ_EXPECT(store.find("c") != kj::none);
  KJ_EXPECT(store.find("d") != kj::none);
}

KJ_TEST("SessionManager: commit issues a token and a cookie") {
  kj::HttpHeaderTable table;
  FakeClock clock;
  MemorySessionStore store(clock);
  SessionManager manager(store, clock);

  auto session = manager.load(kj::none);
  KJ_EXPECT(session->token().size() == 0);
  KJ_EXPECT(session->expiry() == clock.time + 24 * kj::HOURS);

  // Unmodified sessions are not persisted
  kj::HttpHeaders untouched(table);
  manager.commit(*session, untouched);
  KJ_EXPECT(core::find_header(untouched, "Set-Cookie") == kj::none);
  KJ_EXPECT(store.size() == 0);

  session->put("user_id", "42");
  kj::HttpHeaders headers(table);
  manager.commit(*session, headers);

  KJ_EXPECT(session->token().size() == 43);
  KJ_EXPECT(store.size() == 1);
  auto cookie = KJ_ASSERT_NONNULL(core::find_header(headers, "Set-Cookie"));
  KJ_EXPECT(cookie ==
            kj::str("session=", session->token(),
                    "; Path=/; Expires=Wed, 15 Nov 2023 22:13:21 GMT; Max-Age=86401; HttpOnly;"
                    " SameSite=Lax"),
            cookie);
  KJ_EXPECT(KJ_ASSERT_NONNULL(core::find_header(headers, "Vary")) == "Cookie");
  KJ_EXPECT(KJ_ASSERT_NONNULL(core::find_header(headers, "Cache-Control")) ==
            "no-cache=\"Set-Cookie\"");

  // The next request carrying the cookie sees the same data
  auto header = kj::str("other=1; session=", session->token());
  auto loaded = manager.load(header.asPtr());
  KJ_EXPECT(loaded->token() == session->token());
  KJ_EXPECT(KJ_ASSERT_NONNULL(loaded->get("user_id")) == "42");
}

KJ_TEST("SessionManager: unknown or expired cookie starts a fresh session") {
  FakeClock clock;
  MemorySessionStore store(clock);
  SessionManager manager(store, clock);

  KJ_EXPECT(manager.load("session=missing"_kj)->token().size() == 0);

  store.commit("stale", "not json", clock.time + 10 * kj::SECONDS);
  KJ_EXPECT(manager.load("session=stale"_kj)->token().size() == 0);
}

KJ_TEST("SessionManager: destroy removes the session and expires the cookie") {
  kj::HttpHeaderTable table;
  FakeClock clock;
  MemorySessionStore store(clock);
  SessionManager manager(store, clock);

  auto session = manager.load(kj::none);
  session->put("user_id", "42");
  kj::HttpHeaders first(table);
  manager.commit(*session, first);
  KJ_EXPECT(store.size() == 1);

  auto header = kj::str("session=", session->token());
  auto loaded = manager.load(header.asPtr());
  loaded->destroy();
  kj::HttpHeaders headers(table);
  manager.commit(*loaded, headers);

  KJ_EXPECT(store.size() == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(core::find_header(headers, "Set-Cookie")) ==
            "session=; Path=/; Expires=Thu, 01 Jan 1970 00:00:01 GMT; Max-Age=0; HttpOnly;"
            " SameSite=Lax");
}

KJ_TEST("SessionMiddleware: modified session is committed when the response starts") {
  TestContext tc;
  FakeClock clock;
  MemorySessionStore store(clock);
  SessionManager manager(store, clock);
  SessionMiddleware middleware(manager);

  RequestFixture fx(tc.headerTable, kj::HttpMethod::GET, "/api/check");
  middleware
      .process(fx.ctx,
               [&]() {
                 auto& session = KJ_ASSERT_NONNULL(fx.ctx.session);
                 session.put("user_id", "7");
                 return fx.ctx.sendJson(200, kj::str("{}"));
               })
      .wait(tc.waitScope);

  KJ_EXPECT(store.size() == 1);
  auto cookie = KJ_ASSERT_NONNULL(fx.response.header("Set-Cookie"));
  KJ_EXPECT(cookie.startsWith("session="));
  KJ_EXPECT(KJ_ASSERT_NONNULL(fx.response.header("Vary")) == "Cookie");
}

KJ_TEST("RequireSessionMiddleware: gate rejects sessions without user_id") {
  TestContext tc;
  FakeClock clock;
  MemorySessionStore store(clock);
  SessionManager manager(store, clock);
  RequireSessionMiddleware gate(true);

  auto anonymous = manager.load(kj::none);
  RequestFixture fx(tc.headerTable, kj::HttpMethod::GET, "/api/blobs/a.txt");
  fx.ctx.session = *anonymous;
  bool reached = false;
  gate.process(fx.ctx,
               [&]() {
                 reached = true;
                 return fx.ctx.sendJson(200, kj::str("{}"));
               })
      .wait(tc.waitScope);

  KJ_EXPECT(!reached);
  KJ_EXPECT(fx.response.statusCode == 401);
  KJ_EXPECT(fx.response.bodyText() ==
            R"({"err":"unauthorized","message":"authentication required"})");

  auto user = manager.load(kj::none);
  user->put("user_id", "1");
  RequestFixture ok(tc.headerTable, kj::HttpMethod::GET, "/api/blobs/a.txt");
  ok.ctx.session = *user;
  gate.process(ok.ctx, [&]() { return ok.ctx.sendJson(200, kj::str("{}")); })
      .wait(tc.waitScope);
  KJ_EXPECT(ok.response.statusCode == 200);
}

KJ_TEST("RequireSessionMiddleware: disabled gate lets everyone through") {
  TestContext tc;
  RequireSessionMiddleware gate(false);
  RequestFixture fx(tc.headerTable, kj::HttpMethod::GET, "/api/blobs/a.txt");
  gate.process(fx.ctx, [&]() { return fx.ctx.sendJson(200, kj::str("{}")); })
      .wait(tc.waitScope);
  KJ_EXPECT(fx.response.statusCode == 200);
}

} // namespace
} // namespace doco::gateway
