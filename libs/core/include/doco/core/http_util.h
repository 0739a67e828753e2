#pragma once

#include <kj/async-io.h>
#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::core {

[[nodiscard]] bool equals_ignore_case(kj::StringPtr a, kj::StringPtr b);

/**
 * @brief Header lookup by name, case-insensitive. With repeated headers the first wins.
 */
[[nodiscard]] kj::Maybe<kj::StringPtr> find_header(const kj::HttpHeaders& headers,
                                                   kj::StringPtr name);

/**
 * @brief Format as an RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
 */
[[nodiscard]] kj::String format_http_date(kj::Date date);

/**
 * @brief Parse an HTTP date in any of the three RFC 7231 layouts: IMF-fixdate, RFC 850
 * ("Sunday, 06-Nov-94 08:49:37 GMT") or asctime ("Sun Nov  6 08:49:37 1994"). Returns none
 * for anything else.
 */
[[nodiscard]] kj::Maybe<kj::Date> parse_http_date(kj::StringPtr text);

[[nodiscard]] int64_t unix_seconds(kj::Date date);

[[nodiscard]] kj::StringPtr status_text(kj::uint status);

/**
 * @brief Request target split into its decoded path and raw query.
 *
 * Absolute-form targets ("http://host/path") are reduced to their path. An empty path
 * becomes "/". Percent-escapes in the path are decoded; invalid escapes are kept as-is.
 */
struct RequestTarget {
  kj::String path;
  kj::String query;
};

[[nodiscard]] RequestTarget split_request_target(kj::StringPtr url);

/**
 * @brief Numeric IP of the remote end of a connection, or "" when the stream is not a socket.
 */
[[nodiscard]] kj::String peer_ip(kj::AsyncIoStream& stream);

/**
 * @brief Turn a configured listen address into one kj::Network::parseAddress accepts.
 *
 * ":8080" (all interfaces) becomes "*:8080"; anything else is returned unchanged.
 */
[[nodiscard]] kj::String listen_address(kj::StringPtr address);

/**
 * @brief Turn a configured address into one a client can connect to.
 *
 * ":8081" becomes "localhost:8081"; anything else is returned unchanged.
 */
[[nodiscard]] kj::String dial_address(kj::StringPtr address);

} // namespace doco::core
