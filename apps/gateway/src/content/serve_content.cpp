#include "content/serve_content.h"

#include "util/random.h"

#include "doco/core/http_util.h"
#include "doco/core/mime.h"

#include <cstring>
#include <kj/debug.h>
#include <kj/encoding.h>

namespace doco::gateway {

namespace {

constexpr size_t kSniffLength = 512;

enum class Condition { None, True, False };

bool is_space(char c) {
  return c == ' ' || c == '\t';
}

kj::ArrayPtr<const char> trim(kj::ArrayPtr<const char> text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && is_space(text[begin])) {
    ++begin;
  }
  while (end > begin && is_space(text[end - 1])) {
    --end;
  }
  return text.slice(begin, end);
}

kj::Maybe<uint64_t> parse_uint(kj::ArrayPtr<const char> text) {
  if (text.size() == 0) {
    return kj::none;
  }
  const uint64_t max = kj::maxValue;
  uint64_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return kj::none;
    }
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (value > (max - digit) / 10) {
      return kj::none;
    }
    value = value * 10 + digit;
  }
  return value;
}

Condition check_if_unmodified_since(const RequestContext& ctx, kj::Date modified) {
  KJ_IF_SOME(value, core::find_header(ctx.headers, "If-Unmodified-Since")) {
    KJ_IF_SOME(since, core::parse_http_date(value)) {
      return core::unix_seconds(modified) <= core::unix_seconds(since) ? Condition::True
                                                                      : Condition::False;
    }
  }
  return Condition::None;
}

Condition check_if_modified_since(const RequestContext& ctx, kj::Date modified) {
  if (ctx.method != kj::HttpMethod::GET && ctx.method != kj::HttpMethod::HEAD) {
    return Condition::None;
  }
  if (core::find_header(ctx.headers, "If-None-Match") != kj::none) {
    return Condition::None;
  }
  KJ_IF_SOME(value, core::find_header(ctx.headers, "If-Modified-Since")) {
    KJ_IF_SOME(since, core::parse_http_date(value)) {
      return core::unix_seconds(modified) <= core::unix_seconds(since) ? Condition::False
                                                                      : Condition::True;
    }
  }
  return Condition::None;
}

// Only the date form can match: no entity tags are issued.
bool if_range_allows(const RequestContext& ctx, kj::Date modified) {
  KJ_IF_SOME(value, core::find_header(ctx.headers, "If-Range")) {
    KJ_IF_SOME(date, core::parse_http_date(value)) {
      return core::unix_seconds(modified) == core::unix_seconds(date);
    }
    return false;
  }
  return true;
}

kj::Promise<void> send_bytes(RequestContext& ctx, kj::uint status, const kj::HttpHeaders& headers,
                             kj::ArrayPtr<const kj::byte> body) {
  auto stream = ctx.response.send(status, core::status_text(status), headers, body.size());
  if (ctx.method == kj::HttpMethod::HEAD || body.size() == 0) {
    return kj::READY_NOW;
  }
  auto promise = stream->write(body);
  return promise.attach(kj::mv(stream));
}

kj::Promise<void> send_range_error(RequestContext& ctx, kj::StringPtr message, uint64_t size,
                                   bool noOverlap) {
  kj::HttpHeaders headers(ctx.headerTable);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "text/plain; charset=utf-8");
  if (noOverlap) {
    headers.addPtr("Content-Range", kj::str("bytes */", size));
  }
  auto body = kj::str(message, "\n");
  auto bytes = body.asBytes();
  return send_bytes(ctx, 416, headers, bytes).attach(kj::mv(body), kj::mv(headers));
}

} // namespace

kj::String HttpRange::content_range(uint64_t size) const {
  return kj::str("bytes ", start, "-", start + length - 1, "/", size);
}

RangeParseResult parse_range(kj::StringPtr header, uint64_t size) {
  RangeParseResult result;
  const kj::StringPtr kPrefix = "bytes="_kj;
  if (!header.startsWith(kPrefix)) {
    result.error = "invalid range"_kj;
    return result;
  }

  auto specs = header.slice(kPrefix.size()).asArray();
  size_t pos = 0;
  while (pos <= specs.size()) {
    size_t end = pos;
    while (end < specs.size() && specs[end] != ',') {
      ++end;
    }
    auto spec = trim(specs.slice(pos, end));
    pos = end + 1;
    if (spec.size() == 0) {
      continue;
    }

    size_t dash = 0;
    while (dash < spec.size() && spec[dash] != '-') {
      ++dash;
    }
    if (dash == spec.size()) {
      result.error = "invalid range"_kj;
      return result;
    }
    auto startText = trim(spec.first(dash));
    auto endText = trim(spec.slice(dash + 1, spec.size()));

    HttpRange range{0, 0};
    if (startText.size() == 0) {
      // Suffix form: the last N bytes
      KJ_IF_SOME(suffix, parse_uint(endText)) {
        uint64_t n = suffix > size ? size : suffix;
        range.start = size - n;
        range.length = n;
      } else {
        result.error = "invalid range"_kj;
        return result;
      }
    } else {
      KJ_IF_SOME(first, parse_uint(startText)) {
        if (first >= size) {
          result.no_overlap = true;
          continue;
        }
        range.start = first;
        if (endText.size() == 0) {
          range.length = size - first;
        } else {
          KJ_IF_SOME(last, parse_uint(endText)) {
            if (first > last) {
              result.error = "invalid range"_kj;
              return result;
            }
            uint64_t lastByte = last >= size ? size - 1 : last;
            range.length = lastByte - first + 1;
          } else {
            result.error = "invalid range"_kj;
            return result;
          }
        }
      } else {
        result.error = "invalid range"_kj;
        return result;
      }
    }
    result.ranges.add(range);
  }

  if (result.no_overlap && result.ranges.size() == 0) {
    result.error = "invalid range: failed to overlap"_kj;
  }
  return result;
}

kj::Array<kj::byte> build_multipart_byteranges(kj::StringPtr boundary, kj::StringPtr contentType,
                                               kj::ArrayPtr<const HttpRange> ranges,
                                               kj::ArrayPtr<const kj::byte> content) {
  uint64_t size = content.size();
  kj::Vector<kj::String> partHeaders(ranges.size());
  size_t total = 0;
  for (size_t i = 0; i < ranges.size(); ++i) {
    auto& r = ranges[i];
    partHeaders.add(kj::str(i == 0 ? "" : "\r\n", "--", boundary, "\r\n",
                            "Content-Range: ", r.content_range(size), "\r\n",
                            "Content-Type: ", contentType, "\r\n\r\n"));
    total += partHeaders.back().size() + r.length;
  }
  auto closing = kj::str("\r\n--", boundary, "--\r\n");
  total += closing.size();

  auto body = kj::heapArray<kj::byte>(total);
  size_t offset = 0;
  auto append = [&](kj::ArrayPtr<const kj::byte> piece) {
    memcpy(body.begin() + offset, piece.begin(), piece.size());
    offset += piece.size();
  };
  for (size_t i = 0; i < ranges.size(); ++i) {
    append(partHeaders[i].asBytes());
    append(content.slice(ranges[i].start, ranges[i].start + ranges[i].length));
  }
  append(closing.asBytes());
  KJ_ASSERT(offset == total);
  return body;
}

kj::Promise<void> serve_content(RequestContext& ctx, kj::HttpHeaders headers, kj::StringPtr name,
                                kj::Date modified, kj::ArrayPtr<const kj::byte> content) {
  auto lastModified = core::format_http_date(modified);
  uint64_t size = content.size();

  if (check_if_unmodified_since(ctx, modified) == Condition::False) {
    kj::HttpHeaders failed(ctx.headerTable);
    return send_bytes(ctx, 412, failed, nullptr).attach(kj::mv(failed));
  }
  if (check_if_modified_since(ctx, modified) == Condition::False) {
    kj::HttpHeaders notModified(ctx.headerTable);
    notModified.addPtr("Last-Modified", kj::mv(lastModified));
    return send_bytes(ctx, 304, notModified, nullptr).attach(kj::mv(notModified));
  }

  kj::StringPtr contentType;
  KJ_IF_SOME(type, headers.get(kj::HttpHeaderId::CONTENT_TYPE)) {
    contentType = type;
  } else {
    KJ_IF_SOME(type, core::mime_type_for_path(name)) {
      contentType = type;
    } else {
      contentType = core::sniff_content_type(content.first(kj::min(content.size(), kSniffLength)));
    }
    headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, contentType);
  }
  headers.addPtrPtr("Accept-Ranges", "bytes");
  headers.addPtr("Last-Modified", kj::mv(lastModified));

  kj::Maybe<kj::StringPtr> rangeHeader = core::find_header(ctx.headers, "Range");
  if (!if_range_allows(ctx, modified)) {
    rangeHeader = kj::none;
  }

  KJ_IF_SOME(rangeValue, rangeHeader) {
    auto parsed = parse_range(rangeValue, size);
    KJ_IF_SOME(error, parsed.error) {
      return send_range_error(ctx, error, size, parsed.no_overlap);
    }

    uint64_t requested = 0;
    for (auto& r : parsed.ranges) {
      requested += r.length;
    }
    // Asking for more than the whole content is served as the whole content
    if (requested <= size) {
      if (parsed.ranges.size() == 1) {
        auto& r = parsed.ranges[0];
        headers.addPtr("Content-Range", r.content_range(size));
        auto body = content.slice(r.start, r.start + r.length);
        return send_bytes(ctx, 206, headers, body).attach(kj::mv(headers));
      }
      if (parsed.ranges.size() > 1) {
        auto boundary = kj::encodeHex(random_bytes(15));
        auto body = build_multipart_byteranges(boundary, contentType, parsed.ranges.asPtr(),
                                               content);
        headers.set(kj::HttpHeaderId::CONTENT_TYPE,
                    kj::str("multipart/byteranges; boundary=", boundary));
        auto bytes = body.asPtr();
        return send_bytes(ctx, 206, headers, bytes).attach(kj::mv(headers), kj::mv(body));
      }
    }
  }

  return send_bytes(ctx, 200, headers, content).attach(kj::mv(headers));
}

} // namespace doco::gateway
