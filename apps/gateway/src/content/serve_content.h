#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace doco::gateway {

/**
 * One satisfiable byte range of a representation.
 */
struct HttpRange {
  uint64_t start;
  uint64_t length;

  kj::String content_range(uint64_t size) const;
};

struct RangeParseResult {
  kj::Vector<HttpRange> ranges;
  // Set when the header is malformed or no range overlaps the content
  kj::Maybe<kj::StringPtr> error;
  bool no_overlap = false;
};

/**
 * Parse a `Range: bytes=...` header against a representation of `size` bytes.
 *
 * Ranges starting past the end are dropped; when that leaves nothing the result carries
 * the "failed to overlap" error. Ends past the content are clamped.
 */
RangeParseResult parse_range(kj::StringPtr header, uint64_t size);

/**
 * Body of a `multipart/byteranges` response, one part per range.
 */
kj::Array<kj::byte> build_multipart_byteranges(kj::StringPtr boundary, kj::StringPtr contentType,
                                               kj::ArrayPtr<const HttpRange> ranges,
                                               kj::ArrayPtr<const kj::byte> content);

/**
 * Answer ctx with content, honoring conditional and range requests.
 *
 * `headers` holds what the caller already decided (Content-Type, Content-Disposition).
 * Without a Content-Type, one is chosen from the extension of name, else sniffed from the
 * first 512 bytes. Handles If-Unmodified-Since (412), If-Modified-Since (304), If-Range,
 * single and multiple ranges (206) and unsatisfiable ranges (416). HEAD gets headers only.
 *
 * content must stay valid until the returned promise resolves.
 */
kj::Promise<void> serve_content(RequestContext& ctx, kj::HttpHeaders headers, kj::StringPtr name,
                                kj::Date modified, kj::ArrayPtr<const kj::byte> content);

} // namespace doco::gateway
