#pragma once

#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::proxy {

/**
 * @brief Routing configuration for the load balancer.
 *
 * Only the three addresses vary; the policy fields are fixed. Paths under api_prefix are
 * forwarded to the upstream, everything else is served from static_root with SPA fallback.
 */
struct RoutingRuleSet {
  kj::String listen_address;
  kj::String upstream_address;
  kj::String static_root;

  kj::StringPtr api_prefix = "/api/"_kj;
  bool websocket = true;
  bool transparent = true;
  kj::Duration idle_timeout = 10 * kj::MINUTES;
  bool tls = false;

  [[nodiscard]] bool is_api_path(kj::StringPtr path) const {
    return path.startsWith(api_prefix);
  }

  /**
   * @brief Whether a missing static asset at path is rewritten to "/".
   *
   * Anything starting with "/api" (including "/api" itself and "/apifoo") is left alone.
   */
  [[nodiscard]] bool rewrites_to_index(kj::StringPtr path) const {
    return !path.startsWith("/api");
  }
};

/**
 * @brief Build the rule set for one proxy run.
 *
 * Addresses may be ":port" (all interfaces) or "host:port".
 * @throws kj::Exception (ValidationException) if any argument is empty
 */
[[nodiscard]] RoutingRuleSet make_routing_rules(kj::StringPtr listen_address,
                                                kj::StringPtr upstream_address,
                                                kj::StringPtr static_root);

/**
 * @brief The Caddyfile template the rule set corresponds to.
 */
[[nodiscard]] kj::StringPtr caddyfile_template();

/**
 * @brief Render the rule set as Caddyfile text. Deterministic for equal inputs.
 */
[[nodiscard]] kj::String render_caddyfile(const RoutingRuleSet& rules);

} // namespace doco::proxy
