#include "doco/proxy/routing_rules.h"

#include <gtest/gtest.h>
#include <kj/exception.h>

using namespace doco::proxy;

namespace {

constexpr const char kExpectedCaddyfile[] = ":8080 {\n"
                                            "\ttls off\n"
                                            "    proxy /api/ localhost:8081 {\n"
                                            "\t\ttransparent\n"
                                            "\t\twebsocket\n"
                                            "\t\ttimeout 10m\n"
                                            "    }\n"
                                            "    root ./web/dist\n"
                                            "    rewrite {\n"
                                            "        if {path} not_match ^/api\n"
                                            "        to {path} /\n"
                                            "    }\n"
                                            "}\n";

} // namespace

TEST(RoutingRules, BuildsFixedPolicy) {
  auto rules = make_routing_rules(":8080", ":8081", "./web/dist");
  EXPECT_STREQ(rules.listen_address.cStr(), ":8080");
  EXPECT_STREQ(rules.upstream_address.cStr(), ":8081");
  EXPECT_STREQ(rules.static_root.cStr(), "./web/dist");
  EXPECT_STREQ(rules.api_prefix.cStr(), "/api/");
  EXPECT_TRUE(rules.websocket);
  EXPECT_TRUE(rules.transparent);
  EXPECT_FALSE(rules.tls);
  EXPECT_TRUE(rules.idle_timeout == 10 * kj::MINUTES);
}

TEST(RoutingRules, RejectsEmptyValues) {
  EXPECT_TRUE(kj::runCatchingExceptions([]() { (void)make_routing_rules("", ":8081", "web"); }) !=
              kj::none);
  EXPECT_TRUE(kj::runCatchingExceptions([]() { (void)make_routing_rules(":8080", "", "web"); }) !=
              kj::none);
  KJ_IF_SOME(e,
             kj::runCatchingExceptions([]() { (void)make_routing_rules(":8080", ":8081", ""); })) {
    EXPECT_TRUE(e.getDescription().contains("static root must not be empty"_kj));
  } else {
    ADD_FAILURE() << "empty root should be rejected";
  }
}

TEST(RoutingRules, ApiPrefixMatching) {
  auto rules = make_routing_rules(":8080", ":8081", "./web/dist");
  EXPECT_TRUE(rules.is_api_path("/api/metrics"));
  EXPECT_TRUE(rules.is_api_path("/api/blobs/report.pdf"));
  EXPECT_FALSE(rules.is_api_path("/api"));
  EXPECT_FALSE(rules.is_api_path("/apifoo"));
  EXPECT_FALSE(rules.is_api_path("/app/page"));
  EXPECT_FALSE(rules.is_api_path("/"));
}

TEST(RoutingRules, IndexRewriteSkipsApiLikePaths) {
  auto rules = make_routing_rules(":8080", ":8081", "./web/dist");
  EXPECT_TRUE(rules.rewrites_to_index("/app/page"));
  EXPECT_TRUE(rules.rewrites_to_index("/"));
  EXPECT_FALSE(rules.rewrites_to_index("/api"));
  EXPECT_FALSE(rules.rewrites_to_index("/apifoo"));
  EXPECT_FALSE(rules.rewrites_to_index("/api/missing"));
}

TEST(RoutingRules, RendersCaddyfile) {
  auto rules = make_routing_rules(":8080", ":8081", "./web/dist");
  auto text = render_caddyfile(rules);
  EXPECT_STREQ(text.cStr(), kExpectedCaddyfile);
}

TEST(RoutingRules, RenderingIsDeterministic) {
  auto first = render_caddyfile(make_routing_rules("127.0.0.1:9000", ":9001", "/srv/www"));
  auto second = render_caddyfile(make_routing_rules("127.0.0.1:9000", ":9001", "/srv/www"));
  EXPECT_TRUE(first == second);
  EXPECT_TRUE(first.startsWith("127.0.0.1:9000 {\n"));
  EXPECT_TRUE(first.contains("proxy /api/ localhost:9001 {"_kj));
}

TEST(RoutingRules, TemplateIsExposed) {
  EXPECT_TRUE(caddyfile_template().startsWith("{{ .caddyAddr}} {\n\ttls off\n"));
}
