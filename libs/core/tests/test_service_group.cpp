#include "doco/core/service_group.h"
#include "doco/core/shutdown_signal.h"

#include <gtest/gtest.h>
#include <kj/async.h>
#include <kj/debug.h>
#include <kj/vector.h>

using namespace doco::core;

namespace {

// Actor whose run promise settles when its interrupt fires (or when the test fulfills it).
struct TestActor {
  kj::Own<kj::PromiseFulfiller<void>> fulfiller;
  kj::Maybe<kj::Promise<void>> promise;
  int interrupts = 0;
  kj::String last_reason;
  bool resolve_on_interrupt = true;

  TestActor() {
    auto paf = kj::newPromiseAndFulfiller<void>();
    fulfiller = kj::mv(paf.fulfiller);
    promise = kj::mv(paf.promise);
  }

  void add_to(ServiceGroup& group, kj::StringPtr name) {
    group.add(
        name,
        [this]() -> kj::Promise<void> {
          KJ_IF_SOME(p, promise) {
            auto result = kj::mv(p);
            promise = kj::none;
            return result;
          }
          KJ_FAIL_REQUIRE("actor started twice");
        },
        [this](const kj::Exception& reason) {
          ++interrupts;
          last_reason = kj::str(reason.getDescription());
          if (resolve_on_interrupt) {
            fulfiller->fulfill();
          }
        });
  }
};

class ServiceGroupTest : public ::testing::Test {
protected:
  kj::EventLoop loop;
  kj::WaitScope wait_scope{loop};
};

TEST_F(ServiceGroupTest, EmptyGroupResolvesImmediately) {
  ServiceGroup group;
  EXPECT_EQ(group.size(), 0u);
  group.run().wait(wait_scope);
  EXPECT_TRUE(group.first_exited() == kj::none);
}

TEST_F(ServiceGroupTest, CleanExitInterruptsEverySiblingOnce) {
  ServiceGroup group;
  TestActor a, b, c;
  a.add_to(group, "a");
  b.add_to(group, "b");
  c.add_to(group, "c");

  auto done = group.run();
  wait_scope.poll();
  EXPECT_FALSE(done.poll(wait_scope));

  b.fulfiller->fulfill();
  done.wait(wait_scope);

  EXPECT_EQ(a.interrupts, 1);
  EXPECT_EQ(b.interrupts, 0);
  EXPECT_EQ(c.interrupts, 1);
  EXPECT_STREQ(a.last_reason.cStr(), "service 'b' exited");
  KJ_IF_SOME(name, group.first_exited()) {
    EXPECT_STREQ(name.cStr(), "b");
  } else {
    ADD_FAILURE() << "first exited actor not recorded";
  }
}

TEST_F(ServiceGroupTest, FailurePropagatesToSiblingsAndResult) {
  ServiceGroup group;
  TestActor a, b;
  a.add_to(group, "api");
  b.add_to(group, "proxy");

  auto done = group.run();
  wait_scope.poll();
  a.fulfiller->reject(KJ_EXCEPTION(FAILED, "address in use"));

  auto result = kj::runCatchingExceptions([&]() { done.wait(wait_scope); });
  KJ_IF_SOME(e, result) {
    EXPECT_TRUE(e.getDescription().find("address in use"_kj) != kj::none);
  } else {
    ADD_FAILURE() << "group should report the failure";
  }
  EXPECT_EQ(b.interrupts, 1);
  EXPECT_TRUE(b.last_reason.find("address in use"_kj) != kj::none);
}

TEST_F(ServiceGroupTest, LaterErrorReportedWhenFirstExitWasClean) {
  ServiceGroup group;
  TestActor a, b;
  b.resolve_on_interrupt = false;
  a.add_to(group, "signals");
  b.add_to(group, "api");

  auto done = group.run();
  wait_scope.poll();
  a.fulfiller->fulfill();
  wait_scope.poll();
  EXPECT_EQ(b.interrupts, 1);
  EXPECT_FALSE(done.poll(wait_scope));

  b.fulfiller->reject(KJ_EXCEPTION(FAILED, "drain failed"));
  auto result = kj::runCatchingExceptions([&]() { done.wait(wait_scope); });
  KJ_IF_SOME(e, result) {
    EXPECT_TRUE(e.getDescription().find("drain failed"_kj) != kj::none);
  } else {
    ADD_FAILURE() << "group should report the later failure";
  }
}

TEST_F(ServiceGroupTest, WaitsForAllActorsBeforeReturning) {
  ServiceGroup group;
  TestActor a, b, c;
  b.resolve_on_interrupt = false;
  c.resolve_on_interrupt = false;
  a.add_to(group, "a");
  b.add_to(group, "b");
  c.add_to(group, "c");

  auto done = group.run();
  wait_scope.poll();
  a.fulfiller->fulfill();
  EXPECT_FALSE(done.poll(wait_scope));

  b.fulfiller->fulfill();
  EXPECT_FALSE(done.poll(wait_scope));

  c.fulfiller->fulfill();
  EXPECT_TRUE(done.poll(wait_scope));
  done.wait(wait_scope);

  EXPECT_EQ(b.interrupts, 1);
  EXPECT_EQ(c.interrupts, 1);
}

TEST_F(ServiceGroupTest, SimultaneousExitsInterruptOnlyOnce) {
  ServiceGroup group;
  TestActor a, b;
  a.add_to(group, "a");
  b.add_to(group, "b");

  auto done = group.run();
  wait_scope.poll();
  a.fulfiller->fulfill();
  b.fulfiller->reject(KJ_EXCEPTION(FAILED, "late failure"));
  auto result = kj::runCatchingExceptions([&]() { done.wait(wait_scope); });

  // Whichever exit is observed first, only the other actor is interrupted and b's error wins.
  EXPECT_EQ(a.interrupts + b.interrupts, 1);
  KJ_IF_SOME(e, result) {
    EXPECT_TRUE(e.getDescription().find("late failure"_kj) != kj::none);
  } else {
    ADD_FAILURE() << "group should report the failure";
  }
}

TEST_F(ServiceGroupTest, SynchronousThrowIsTreatedAsActorFailure) {
  ServiceGroup group;
  TestActor sibling;
  group.add(
      "broken", []() -> kj::Promise<void> { KJ_FAIL_REQUIRE("cannot bind"); },
      [](const kj::Exception&) {});
  sibling.add_to(group, "proxy");

  auto result = kj::runCatchingExceptions([&]() { group.run().wait(wait_scope); });
  EXPECT_TRUE(result != kj::none);
  EXPECT_EQ(sibling.interrupts, 1);
}

TEST_F(ServiceGroupTest, AddAfterRunIsRejected) {
  ServiceGroup group;
  TestActor a;
  a.add_to(group, "a");
  auto done = group.run();

  auto result = kj::runCatchingExceptions([&]() {
    group.add("late", []() -> kj::Promise<void> { return kj::READY_NOW; },
              [](const kj::Exception&) {});
  });
  EXPECT_TRUE(result != kj::none);

  a.fulfiller->fulfill();
  done.wait(wait_scope);
}

TEST_F(ServiceGroupTest, ShutdownSignalDrivesServices) {
  ShutdownSignal shutdown;
  ServiceGroup group;
  int stopped = 0;

  for (auto name : {"api"_kj, "proxy"_kj}) {
    group.add(
        name,
        [&]() { return shutdown.when_cancelled().then([&]() { ++stopped; }); },
        [&](const kj::Exception& reason) { shutdown.cancel(reason.getDescription()); });
  }
  auto trigger = kj::newPromiseAndFulfiller<void>();
  group.add(
      "signals", [&]() { return kj::mv(trigger.promise); },
      [&](const kj::Exception& reason) { shutdown.cancel(reason.getDescription()); });

  auto done = group.run();
  wait_scope.poll();
  EXPECT_FALSE(shutdown.is_cancelled());

  trigger.fulfiller->fulfill();
  done.wait(wait_scope);

  EXPECT_EQ(stopped, 2);
  EXPECT_TRUE(shutdown.is_cancelled());
  KJ_IF_SOME(reason, shutdown.reason()) {
    EXPECT_STREQ(reason.cStr(), "service 'signals' exited");
  } else {
    ADD_FAILURE() << "shutdown reason missing";
  }
}

TEST_F(ServiceGroupTest, ShutdownSignalKeepsFirstReason) {
  ShutdownSignal shutdown;
  auto first = shutdown.when_cancelled();
  shutdown.cancel("first");
  shutdown.cancel("second");
  auto late = shutdown.when_cancelled();

  first.wait(wait_scope);
  late.wait(wait_scope);
  KJ_IF_SOME(reason, shutdown.reason()) {
    EXPECT_STREQ(reason.cStr(), "first");
  } else {
    ADD_FAILURE() << "shutdown reason missing";
  }
}

} // namespace
