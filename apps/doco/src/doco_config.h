#pragma once

#include <kj/common.h>
#include <kj/function.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco {

/**
 * @brief doco configuration loaded from DOCO_* environment variables
 *
 * Every setting has a default suitable for local development. Unset variables keep their
 * default; set but malformed values throw ConfigException.
 */
struct DocoConfig {
  using EnvLookup = kj::Function<kj::Maybe<kj::StringPtr>(kj::StringPtr)>;

  // Listeners
  kj::String server_addr = kj::str(":8081");
  kj::String load_balancer_addr = kj::str(":8080");

  // Content
  kj::String root_path = kj::str("./web/dist");
  kj::String blob_dir = kj::str("./blobs");

  // Sessions
  bool require_auth = false;
  int64_t session_lifetime_seconds = 86400;

  // Lifecycle
  int64_t shutdown_grace_seconds = 5;
  bool debug = false;

  /**
   * @brief Load configuration from the process environment
   */
  static DocoConfig load_from_env();

  /**
   * @brief Load configuration through an arbitrary variable lookup
   */
  static DocoConfig load(EnvLookup& lookup);

  /**
   * @brief Reject configurations the services cannot start with
   *
   * @throws kj::Exception (from ConfigException) on empty addresses or root, non-positive
   * durations, or identical server and load balancer addresses
   */
  void validate() const;

  kj::Duration session_lifetime() const {
    return session_lifetime_seconds * kj::SECONDS;
  }
  kj::Duration shutdown_grace() const {
    return shutdown_grace_seconds * kj::SECONDS;
  }

  /**
   * @brief Table of every variable with its type, default and current value
   */
  kj::String describe() const;

  static kj::StringPtr usage();
};

} // namespace doco
