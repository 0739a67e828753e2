#pragma once

#include "middleware.h"
#include "request_context.h"

#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace doco::gateway {

/**
 * HTTP request router with pattern matching, parameter extraction and route groups.
 *
 * Features:
 * - HTTP method-based routing
 * - Path pattern matching with parameters (e.g., `/api/blobs/{blob_id}`)
 * - Groups sharing a path prefix and their own middleware
 * - 404 (Not Found) and 405 (Method Not Allowed) error envelopes
 *
 * Usage:
 * ```cpp
 * Router router;
 * auto& api = router.group("/api");
 * auto& secured = api.group("");
 * secured.use(kj::heap<RequireSessionMiddleware>(true));
 * secured.add_route(kj::HttpMethod::GET, "/blobs/{blob_id}", blobs.handler());
 * ```
 */
class Router {
public:
  /**
   * RouteMatch represents the result of a route lookup.
   * Contains the handler, the middleware of its groups and any extracted path parameters.
   */
  struct RouteMatch {
    Handler& handler;
    kj::Array<Middleware*> middleware;
    kj::HashMap<kj::String, kj::String> path_params;
  };

  /**
   * A set of routes sharing a prefix and middleware. Nested groups inherit both.
   */
  class Group {
  public:
    Group(Router& router, kj::Maybe<Group&> parent, kj::String prefix);
    KJ_DISALLOW_COPY_AND_MOVE(Group);

    /**
     * Add middleware that runs, after the parent group's, for routes of this group.
     */
    Group& use(kj::Own<Middleware> middleware);

    /**
     * Create a nested group. An empty prefix gives a group with the same prefix.
     */
    Group& group(kj::StringPtr prefix);

    void add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler);

  private:
    friend class Router;

    Router& router_;
    kj::Maybe<Group&> parent_;
    kj::String prefix_;
    kj::Vector<kj::Own<Middleware>> middleware_;

    void collect_middleware(kj::Vector<Middleware*>& out);
  };

  /**
   * Adds a route outside any group.
   *
   * @param method The HTTP method to match (GET, POST, PUT, DELETE, etc.)
   * @param pattern The URL pattern, optionally containing parameters in braces (e.g.,
   * "/api/blobs/{blob_id}")
   * @param handler The handler function to call when the route matches
   *
   * @throws kj::Exception if the pattern is invalid
   */
  void add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler);

  /**
   * Create a top-level group for prefix.
   */
  Group& group(kj::StringPtr prefix);

  /**
   * Matches a request against registered routes.
   *
   * @param method The HTTP method of the request
   * @param path The URL path of the request
   * @return A RouteMatch if a matching route is found
   */
  kj::Maybe<RouteMatch> match(kj::HttpMethod method, kj::StringPtr path);

  /**
   * Checks if any route exists for the given path with any HTTP method.
   * Used to determine if 405 (Method Not Allowed) should be returned.
   */
  bool has_path(kj::StringPtr path) const;

  /**
   * Gets all HTTP methods registered for a given path.
   * Used for constructing the Allow header in 405 responses.
   */
  kj::Vector<kj::String> get_methods_for_path(kj::StringPtr path) const;

  /**
   * Route ctx.path: run the matched route's group middleware and handler, or answer with
   * the 404/405 envelope.
   */
  kj::Promise<void> dispatch(RequestContext& ctx);

  size_t route_count() const {
    return routes_.size();
  }

  /**
   * Converts an HTTP method enum to its string representation.
   */
  static kj::String get_method_name(kj::HttpMethod method);

private:
  struct Route {
    kj::HttpMethod method;
    kj::String pattern;
    Handler handler;
    kj::Maybe<Group&> group;

    // Pre-parsed pattern segments and parameter names
    struct Segment {
      kj::String value; // Either a literal segment or parameter name
      bool is_param;    // True if this segment is a parameter (e.g., {id})
    };
    kj::Vector<Segment> segments;
  };

  kj::Vector<kj::Own<Route>> routes_;
  kj::Vector<kj::Own<Group>> groups_;

  void add_route(kj::HttpMethod method, kj::StringPtr pattern, Handler handler,
                 kj::Maybe<Group&> group);

  kj::Vector<Route::Segment> parse_pattern(kj::StringPtr pattern);

  bool match_pattern(const kj::Vector<Route::Segment>& pattern_segments, kj::StringPtr path,
                     kj::HashMap<kj::String, kj::String>& path_params) const;

  /**
   * Normalizes a path by ensuring it starts with / and has no trailing slash (except root).
   */
  static kj::String normalize_path(kj::StringPtr);

  static kj::String build_allow_header(const kj::Vector<kj::String>& methods);
};

} // namespace doco::gateway
