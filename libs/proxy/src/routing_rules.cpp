#include "doco/proxy/routing_rules.h"

#include "doco/core/error.h"
#include "doco/proxy/config_template.h"

namespace doco::proxy {

namespace {

constexpr const char kCaddyfileTemplate[] = R"({{ .caddyAddr}} {
	tls off
    proxy /api/ localhost{{ .apiAddr }} {
		transparent
		websocket
		timeout 10m
    }
    root {{ .rootPath }}
    rewrite {
        if {path} not_match ^/api
        to {path} /
    }
}
)";

void require_non_empty(kj::StringPtr value, kj::StringPtr what) {
  if (value.size() == 0) {
    core::ValidationException(kj::str(what, " must not be empty")).throwException();
  }
}

} // namespace

RoutingRuleSet make_routing_rules(kj::StringPtr listen_address, kj::StringPtr upstream_address,
                                  kj::StringPtr static_root) {
  require_non_empty(listen_address, "load balancer address");
  require_non_empty(upstream_address, "api address");
  require_non_empty(static_root, "static root");

  RoutingRuleSet rules;
  rules.listen_address = kj::str(listen_address);
  rules.upstream_address = kj::str(upstream_address);
  rules.static_root = kj::str(static_root);
  return rules;
}

kj::StringPtr caddyfile_template() {
  return kCaddyfileTemplate;
}

kj::String render_caddyfile(const RoutingRuleSet& rules) {
  TemplateValues values;
  values.insert(kj::str("caddyAddr"), kj::str(rules.listen_address));
  values.insert(kj::str("apiAddr"), kj::str(rules.upstream_address));
  values.insert(kj::str("rootPath"), kj::str(rules.static_root));
  return render_template(kCaddyfileTemplate, values);
}

} // namespace doco::proxy
