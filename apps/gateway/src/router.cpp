#include "router.h"

#include "api_result.h"
#include "doco/core/error.h"

#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>

namespace doco::gateway {

// ============================================================================
// Router::Group
// ============================================================================

Router::Group::Group(Router& router, kj::Maybe<Group&> parent, kj::String prefix)
    : router_(router), parent_(parent), prefix_(kj::mv(prefix)) {}

Router::Group& Router::Group::use(kj::Own<Middleware> middleware) {
  middleware_.add(kj::mv(middleware));
  return *this;
}

Router::Group& Router::Group::group(kj::StringPtr prefix) {
  auto child = kj::heap<Group>(router_, *this, kj::str(prefix_, prefix));
  auto& ref = *child;
  router_.groups_.add(kj::mv(child));
  return ref;
}

void Router::Group::add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler) {
  router_.add_route(method, kj::str(prefix_, pattern), kj::mv(handler), *this);
}

void Router::Group::collect_middleware(kj::Vector<Middleware*>& out) {
  KJ_IF_SOME(parent, parent_) {
    parent.collect_middleware(out);
  }
  for (auto& middleware : middleware_) {
    out.add(middleware.get());
  }
}

// ============================================================================
// Router
// ============================================================================

Router::Group& Router::group(kj::StringPtr prefix) {
  KJ_REQUIRE(prefix.size() == 0 || prefix.startsWith("/"), "Group prefix must start with '/'",
             prefix);
  auto group = kj::heap<Group>(*this, kj::none, kj::str(prefix));
  auto& ref = *group;
  groups_.add(kj::mv(group));
  return ref;
}

void Router::add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler) {
  add_route(method, pattern, kj::mv(handler), kj::none);
}

void Router::add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler,
                       kj::Maybe<Group&> group) {
  // Validate pattern format
  KJ_REQUIRE(pattern.startsWith("/"), "Pattern must start with '/'", pattern);
  KJ_REQUIRE(!pattern.endsWith("/"_kj) || pattern == "/"_kj,
             "Pattern must not end with '/' (except for root)", pattern);

  auto route = kj::heap<Route>();
  route->method = method;
  route->pattern = kj::str(pattern);
  route->segments = parse_pattern(pattern);
  route->handler = kj::mv(handler);
  route->group = group;

  routes_.add(kj::mv(route));
}

kj::Maybe<Router::RouteMatch> Router::match(kj::HttpMethod method, kj::StringPtr path) {
  kj::String normalized_path = normalize_path(path);

  for (auto& route : routes_) {
    if (route->method != method) {
      continue;
    }

    kj::HashMap<kj::String, kj::String> path_params;
    if (match_pattern(route->segments, normalized_path, path_params)) {
      kj::Vector<Middleware*> middleware;
      KJ_IF_SOME(group, route->group) {
        group.collect_middleware(middleware);
      }
      return RouteMatch{route->handler, middleware.releaseAsArray(), kj::mv(path_params)};
    }
  }

  return kj::none;
}

bool Router::has_path(kj::StringPtr path) const {
  kj::String normalized_path = normalize_path(path);

  for (const auto& route : routes_) {
    kj::HashMap<kj::String, kj::String> dummy_params;
    if (route->pattern == normalized_path ||
        match_pattern(route->segments, normalized_path, dummy_params)) {
      return true;
    }
  }

  return false;
}

kj::Vector<kj::String> Router::get_methods_for_path(kj::StringPtr path) const {
  kj::Vector<kj::String> methods;
  kj::String normalized_path = normalize_path(path);

  for (const auto& route : routes_) {
    kj::HashMap<kj::String, kj::String> dummy_params;
    if (route->pattern == normalized_path ||
        match_pattern(route->segments, normalized_path, dummy_params)) {
      auto name = get_method_name(route->method);
      bool found = false;
      for (const auto& existing_method : methods) {
        if (existing_method == name) {
          found = true;
          break;
        }
      }
      if (!found) {
        methods.add(kj::mv(name));
      }
    }
  }

  return methods;
}

kj::Promise<void> Router::dispatch(RequestContext& ctx) {
  KJ_IF_SOME(route, match(ctx.method, ctx.path)) {
    ctx.path_params = kj::mv(route.path_params);
    auto middleware = kj::mv(route.middleware);
    auto promise = run_chain(middleware, ctx, route.handler);
    return promise.attach(kj::mv(middleware));
  }

  if (has_path(ctx.path)) {
    // Path exists but method not allowed - return 405
    kj::String allowHeader = build_allow_header(get_methods_for_path(ctx.path));
    ctx.response.on_send([allowHeader = kj::mv(allowHeader)](kj::uint, kj::HttpHeaders& headers) {
      headers.addPtr("Allow"_kj, kj::str(allowHeader));
    });

    ErrorResponse error(core::ValidationException(kj::str("method not allowed: ",
                                                          get_method_name(ctx.method), " ",
                                                          ctx.path))
                            .toKjException());
    return send_error(ctx, 405, error);
  }

  ErrorResponse error(
      core::NotFoundException(kj::str("route not found: ", ctx.path)).toKjException());
  return send_error(ctx, 404, error);
}

kj::Vector<Router::Route::Segment> Router::parse_pattern(kj::StringPtr pattern) {
  kj::Vector<Route::Segment> segments;

  // Skip leading slash
  kj::ArrayPtr<const char> remaining = pattern.slice(1).asArray();

  while (remaining.size() > 0) {
    size_t slash_pos = 0;
    while (slash_pos < remaining.size() && remaining[slash_pos] != '/') {
      ++slash_pos;
    }
    auto segment_str = remaining.first(slash_pos);
    remaining = slash_pos < remaining.size() ? remaining.slice(slash_pos + 1, remaining.size())
                                             : kj::ArrayPtr<const char>();

    Route::Segment segment;
    // Check if this is a parameter: {param_name}
    if (segment_str.size() >= 2 && segment_str[0] == '{' &&
        segment_str[segment_str.size() - 1] == '}') {
      kj::String param_name = kj::heapString(segment_str.slice(1, segment_str.size() - 1));
      KJ_REQUIRE(param_name.size() > 0, "Parameter name cannot be empty");

      segment.is_param = true;
      segment.value = kj::mv(param_name);
    } else {
      segment.is_param = false;
      segment.value = kj::heapString(segment_str);
    }

    segments.add(kj::mv(segment));
  }

  return segments;
}

bool Router::match_pattern(const kj::Vector<Route::Segment>& pattern_segments, kj::StringPtr path,
                           kj::HashMap<kj::String, kj::String>& path_params) const {
  // Skip leading slash from path
  kj::ArrayPtr<const char> remaining = path.slice(1).asArray();

  size_t segment_index = 0;
  while (remaining.size() > 0 && segment_index < pattern_segments.size()) {
    size_t slash_pos = 0;
    while (slash_pos < remaining.size() && remaining[slash_pos] != '/') {
      ++slash_pos;
    }
    auto path_segment = remaining.first(slash_pos);
    remaining = slash_pos < remaining.size() ? remaining.slice(slash_pos + 1, remaining.size())
                                             : kj::ArrayPtr<const char>();

    const auto& pattern_segment = pattern_segments[segment_index++];
    if (pattern_segment.is_param) {
      if (path_segment.size() == 0) {
        return false;
      }
      path_params.upsert(kj::str(pattern_segment.value), kj::heapString(path_segment));
    } else if (path_segment != pattern_segment.value.asArray()) {
      return false;
    }
  }

  // Check if all pattern segments were matched and no extra path segments remain
  return segment_index == pattern_segments.size() && remaining.size() == 0;
}

kj::String Router::normalize_path(kj::StringPtr path) {
  if (path.size() == 0) {
    return kj::str("/");
  }

  // Ensure path starts with /
  if (!path.startsWith("/")) {
    return kj::str("/", path);
  }

  // Remove trailing slash (except for root)
  if (path.size() > 1 && path.endsWith("/"_kj)) {
    return kj::heapString(path.slice(0, path.size() - 1));
  }

  return kj::str(path);
}

kj::String Router::build_allow_header(const kj::Vector<kj::String>& methods) {
  return kj::strArray(methods, ", ");
}

kj::String Router::get_method_name(kj::HttpMethod method) {
  return kj::str(method);
}

} // namespace doco::gateway
