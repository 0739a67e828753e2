#include "doco_config.h"

#include <gtest/gtest.h>
#include <kj/debug.h>
#include <kj/map.h>

using namespace doco;

namespace {

class DocoConfigTest : public ::testing::Test {
protected:
  kj::HashMap<kj::String, kj::String> env;

  void set(kj::StringPtr name, kj::StringPtr value) {
    env.upsert(kj::str(name), kj::str(value));
  }

  DocoConfig load() {
    DocoConfig::EnvLookup lookup = [this](kj::StringPtr name) -> kj::Maybe<kj::StringPtr> {
      KJ_IF_SOME(value, env.find(name)) {
        return value.asPtr();
      }
      return kj::none;
    };
    return DocoConfig::load(lookup);
  }

  // Description of the exception thrown by fn, or empty if it did not throw.
  template <typename Func> kj::String failure(Func&& fn) {
    KJ_IF_SOME(e, kj::runCatchingExceptions(kj::fwd<Func>(fn))) {
      return kj::str(e.getDescription());
    }
    return kj::str();
  }
};

TEST_F(DocoConfigTest, DefaultsWhenNothingIsSet) {
  auto config = load();
  EXPECT_STREQ(config.server_addr.cStr(), ":8081");
  EXPECT_STREQ(config.load_balancer_addr.cStr(), ":8080");
  EXPECT_STREQ(config.root_path.cStr(), "./web/dist");
  EXPECT_STREQ(config.blob_dir.cStr(), "./blobs");
  EXPECT_FALSE(config.require_auth);
  EXPECT_FALSE(config.debug);
  EXPECT_EQ(config.session_lifetime(), 86400 * kj::SECONDS);
  EXPECT_EQ(config.shutdown_grace(), 5 * kj::SECONDS);
  EXPECT_STREQ(failure([&]() { config.validate(); }).cStr(), "");
}

TEST_F(DocoConfigTest, EnvironmentOverridesDefaults) {
  set("DOCO_SERVERADDR", "127.0.0.1:9001");
  set("DOCO_LOADBALANCERADDR", ":9000");
  set("DOCO_ROOTPATH", "/srv/web");
  set("DOCO_BLOBDIR", "/var/lib/doco/blobs");
  set("DOCO_REQUIREAUTH", "true");
  set("DOCO_SESSIONLIFETIME", "600");
  set("DOCO_SHUTDOWNGRACE", "2");
  set("DOCO_DEBUG", "1");

  auto config = load();
  EXPECT_STREQ(config.server_addr.cStr(), "127.0.0.1:9001");
  EXPECT_STREQ(config.load_balancer_addr.cStr(), ":9000");
  EXPECT_STREQ(config.root_path.cStr(), "/srv/web");
  EXPECT_STREQ(config.blob_dir.cStr(), "/var/lib/doco/blobs");
  EXPECT_TRUE(config.require_auth);
  EXPECT_TRUE(config.debug);
  EXPECT_EQ(config.session_lifetime(), 600 * kj::SECONDS);
  EXPECT_EQ(config.shutdown_grace(), 2 * kj::SECONDS);
}

TEST_F(DocoConfigTest, BooleanSpellings) {
  for (auto value : {"1"_kj, "t"_kj, "TRUE"_kj, "True"_kj}) {
    set("DOCO_REQUIREAUTH", value);
    EXPECT_TRUE(load().require_auth) << value.cStr();
  }
  for (auto value : {"0"_kj, "f"_kj, "FALSE"_kj, "false"_kj}) {
    set("DOCO_REQUIREAUTH", value);
    EXPECT_FALSE(load().require_auth) << value.cStr();
  }
}

TEST_F(DocoConfigTest, MalformedValuesAreRejected) {
  set("DOCO_DEBUG", "yes please");
  auto error = failure([&]() { load(); });
  EXPECT_TRUE(error.find("invalid boolean for DOCO_DEBUG"_kj) != kj::none) << error.cStr();

  env.clear();
  set("DOCO_SESSIONLIFETIME", "1d");
  error = failure([&]() { load(); });
  EXPECT_TRUE(error.find("invalid integer for DOCO_SESSIONLIFETIME"_kj) != kj::none) << error.cStr();
}

TEST_F(DocoConfigTest, ValidateRejectsUnusableSettings) {
  {
    auto config = load();
    config.server_addr = kj::str();
    EXPECT_TRUE(failure([&]() { config.validate(); }).find("DOCO_SERVERADDR"_kj) != kj::none);
  }
  {
    auto config = load();
    config.load_balancer_addr = kj::str(config.server_addr);
    EXPECT_TRUE(failure([&]() { config.validate(); }).find("share an address"_kj) != kj::none);
  }
  {
    auto config = load();
    config.root_path = kj::str();
    EXPECT_TRUE(failure([&]() { config.validate(); }).find("DOCO_ROOTPATH"_kj) != kj::none);
  }
  {
    auto config = load();
    config.session_lifetime_seconds = 0;
    EXPECT_TRUE(failure([&]() { config.validate(); }).find("DOCO_SESSIONLIFETIME"_kj) != kj::none);
  }
  {
    auto config = load();
    config.shutdown_grace_seconds = -1;
    EXPECT_TRUE(failure([&]() { config.validate(); }).find("DOCO_SHUTDOWNGRACE"_kj) != kj::none);
  }
}

TEST_F(DocoConfigTest, DescribeListsEveryVariableWithItsValue) {
  set("DOCO_SERVERADDR", ":7001");
  auto text = load().describe();

  for (auto key : {"DOCO_SERVERADDR"_kj, "DOCO_LOADBALANCERADDR"_kj, "DOCO_ROOTPATH"_kj,
                   "DOCO_BLOBDIR"_kj, "DOCO_REQUIREAUTH"_kj, "DOCO_SESSIONLIFETIME"_kj,
                   "DOCO_SHUTDOWNGRACE"_kj, "DOCO_DEBUG"_kj}) {
    EXPECT_TRUE(text.find(key) != kj::none) << key.cStr();
  }
  EXPECT_TRUE(text.find(":7001"_kj) != kj::none);
  EXPECT_TRUE(text.startsWith("KEY"));
}

TEST_F(DocoConfigTest, UsageMentionsFlags) {
  auto usage = DocoConfig::usage();
  EXPECT_TRUE(usage.find("--config"_kj) != kj::none);
  EXPECT_TRUE(usage.find("--help"_kj) != kj::none);
}

} // namespace
