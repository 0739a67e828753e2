#include "middleware/cors_middleware.h"

#include "doco/core/http_util.h"

#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/string.h>

namespace doco::gateway {

namespace {

// Splits a comma-separated header value into trimmed, non-empty entries.
kj::Vector<kj::String> split_list(kj::StringPtr value) {
  kj::Vector<kj::String> result;
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t end = value.size();
    KJ_IF_SOME(comma, value.slice(pos).findFirst(',')) {
      end = pos + comma;
    }
    size_t begin = pos;
    size_t stop = end;
    while (begin < stop && (value[begin] == ' ' || value[begin] == '\t')) {
      ++begin;
    }
    while (stop > begin && (value[stop - 1] == ' ' || value[stop - 1] == '\t')) {
      --stop;
    }
    if (stop > begin) {
      result.add(kj::heapString(value.slice(begin, stop)));
    }
    pos = end + 1;
  }
  return result;
}

bool contains_ignore_case(const kj::Vector<kj::String>& list, kj::StringPtr value) {
  for (auto& entry : list) {
    if (core::equals_ignore_case(entry, value)) {
      return true;
    }
  }
  return false;
}

} // namespace

CorsMiddleware::Config CorsMiddleware::default_config() {
  Config config;
  config.allowedOrigins.add(kj::str("*"));
  for (auto method : {"GET", "POST", "PUT", "DELETE", "OPTIONS"}) {
    config.allowedMethods.add(kj::str(method));
  }
  for (auto header : {"Accept", "Authorization", "Content-Type", "X-CSRF-Token"}) {
    config.allowedHeaders.add(kj::str(header));
  }
  config.exposedHeaders.add(kj::str("Link"));
  config.allowCredentials = true;
  config.maxAge = 300;
  return config;
}

CorsMiddleware::CorsMiddleware(Config&& config) : config_(kj::mv(config)) {
  for (auto& origin : config_.allowedOrigins) {
    if (origin == "*"_kj) {
      allowAllOrigins_ = true;
    }
  }
  methodsValue_ = kj::strArray(config_.allowedMethods, ", ");
  headersValue_ = kj::strArray(config_.allowedHeaders, ", ");
  exposedValue_ = kj::strArray(config_.exposedHeaders, ", ");
}

CorsMiddleware::~CorsMiddleware() noexcept = default;

bool CorsMiddleware::is_origin_allowed(kj::StringPtr origin) const {
  if (allowAllOrigins_) {
    return true;
  }
  for (auto& allowed : config_.allowedOrigins) {
    if (allowed.startsWith("*."_kj)) {
      // Wildcard subdomain (*.example.com) allows exactly one extra label
      kj::StringPtr domain = allowed.slice(1);
      if (origin.endsWith(domain) && origin.size() > domain.size()) {
        bool singleLabel = true;
        for (size_t i = 0; i < origin.size() - domain.size(); ++i) {
          if (origin[i] == '.') {
            singleLabel = false;
          }
        }
        if (singleLabel) {
          return true;
        }
      }
    } else if (core::equals_ignore_case(allowed, origin)) {
      return true;
    }
  }
  return false;
}

bool CorsMiddleware::is_method_allowed(kj::StringPtr method) const {
  // OPTIONS is always allowed for preflight
  if (method == "OPTIONS"_kj) {
    return true;
  }
  return contains_ignore_case(config_.allowedMethods, method);
}

bool CorsMiddleware::are_headers_allowed(kj::StringPtr requested) const {
  for (auto& header : split_list(requested)) {
    if (core::equals_ignore_case(header, "Origin")) {
      continue;
    }
    if (!contains_ignore_case(config_.allowedHeaders, header)) {
      return false;
    }
  }
  return true;
}

kj::String CorsMiddleware::allow_origin_value(kj::StringPtr origin) const {
  // Browsers reject "*" on credentialed requests, so echo the origin instead
  if (allowAllOrigins_ && !config_.allowCredentials) {
    return kj::str("*");
  }
  return kj::str(origin);
}

kj::Promise<void> CorsMiddleware::process(RequestContext& ctx,
                                          kj::Function<kj::Promise<void>()> next) {
  if (ctx.method == kj::HttpMethod::OPTIONS &&
      ctx.getHeader("Access-Control-Request-Method") != kj::none) {
    return handle_preflight(ctx, ctx.getHeader("Origin").orDefault(""_kj));
  }

  kj::String origin = kj::str(ctx.getHeader("Origin").orDefault(""_kj));
  bool allowed = origin.size() > 0 && is_origin_allowed(origin) &&
                 is_method_allowed(kj::str(ctx.method));
  if (origin.size() > 0 && !allowed) {
    KJ_LOG(DBG, "CORS: actual request rejected", origin, ctx.method);
  }

  ctx.response.on_send([this, allowed, origin = kj::mv(origin)](kj::uint,
                                                                kj::HttpHeaders& headers) {
    headers.addPtrPtr("Vary"_kj, "Origin"_kj);
    if (!allowed) {
      return;
    }
    headers.addPtr("Access-Control-Allow-Origin"_kj, allow_origin_value(origin));
    if (config_.allowCredentials) {
      headers.addPtrPtr("Access-Control-Allow-Credentials"_kj, "true"_kj);
    }
    if (exposedValue_.size() > 0) {
      headers.addPtrPtr("Access-Control-Expose-Headers"_kj, exposedValue_);
    }
  });

  return next();
}

kj::Promise<void> CorsMiddleware::handle_preflight(RequestContext& ctx, kj::StringPtr origin) {
  kj::HttpHeaders responseHeaders(ctx.headerTable);
  responseHeaders.addPtrPtr("Vary"_kj, "Origin"_kj);
  responseHeaders.addPtrPtr("Vary"_kj, "Access-Control-Request-Method"_kj);
  responseHeaders.addPtrPtr("Vary"_kj, "Access-Control-Request-Headers"_kj);

  auto requestedMethod = ctx.getHeader("Access-Control-Request-Method").orDefault(""_kj);
  auto requestedHeaders = ctx.getHeader("Access-Control-Request-Headers").orDefault(""_kj);

  kj::String allowOrigin;
  kj::String maxAge;
  if (origin.size() == 0) {
    KJ_LOG(DBG, "CORS: preflight aborted, empty origin");
  } else if (!is_origin_allowed(origin)) {
    KJ_LOG(DBG, "CORS: preflight aborted, origin not allowed", origin);
  } else if (!is_method_allowed(requestedMethod)) {
    KJ_LOG(DBG, "CORS: preflight aborted, method not allowed", requestedMethod);
  } else if (!are_headers_allowed(requestedHeaders)) {
    KJ_LOG(DBG, "CORS: preflight aborted, headers not allowed", requestedHeaders);
  } else {
    allowOrigin = allow_origin_value(origin);
    responseHeaders.addPtrPtr("Access-Control-Allow-Origin"_kj, allowOrigin);
    responseHeaders.addPtrPtr("Access-Control-Allow-Methods"_kj, methodsValue_);
    if (headersValue_.size() > 0) {
      responseHeaders.addPtrPtr("Access-Control-Allow-Headers"_kj, headersValue_);
    }
    if (config_.allowCredentials) {
      responseHeaders.addPtrPtr("Access-Control-Allow-Credentials"_kj, "true"_kj);
    }
    if (config_.maxAge > 0) {
      maxAge = kj::str(config_.maxAge);
      responseHeaders.addPtrPtr("Access-Control-Max-Age"_kj, maxAge);
    }
  }

  // Preflight is answered here and never reaches the router
  auto stream = ctx.response.send(200, "OK"_kj, responseHeaders, uint64_t(0));
  return kj::READY_NOW;
}

} // namespace doco::gateway
