#include "doco/core/mime.h"

#include <cstring>
#include <kj/map.h>

namespace doco::core {

namespace {

const kj::HashMap<kj::StringPtr, kj::StringPtr>& mime_type_map() {
  static const kj::HashMap<kj::StringPtr, kj::StringPtr> mime_types = [] {
    kj::HashMap<kj::StringPtr, kj::StringPtr> map;
    map.insert(".html"_kj, "text/html; charset=utf-8"_kj);
    map.insert(".htm"_kj, "text/html; charset=utf-8"_kj);
    map.insert(".css"_kj, "text/css; charset=utf-8"_kj);
    map.insert(".js"_kj, "text/javascript; charset=utf-8"_kj);
    map.insert(".mjs"_kj, "text/javascript; charset=utf-8"_kj);
    map.insert(".map"_kj, "application/json"_kj);
    map.insert(".json"_kj, "application/json"_kj);
    map.insert(".xml"_kj, "text/xml; charset=utf-8"_kj);
    map.insert(".png"_kj, "image/png"_kj);
    map.insert(".jpg"_kj, "image/jpeg"_kj);
    map.insert(".jpeg"_kj, "image/jpeg"_kj);
    map.insert(".gif"_kj, "image/gif"_kj);
    map.insert(".svg"_kj, "image/svg+xml"_kj);
    map.insert(".ico"_kj, "image/x-icon"_kj);
    map.insert(".webp"_kj, "image/webp"_kj);
    map.insert(".avif"_kj, "image/avif"_kj);
    map.insert(".woff"_kj, "font/woff"_kj);
    map.insert(".woff2"_kj, "font/woff2"_kj);
    map.insert(".ttf"_kj, "font/ttf"_kj);
    map.insert(".otf"_kj, "font/otf"_kj);
    map.insert(".wasm"_kj, "application/wasm"_kj);
    map.insert(".pdf"_kj, "application/pdf"_kj);
    map.insert(".zip"_kj, "application/zip"_kj);
    map.insert(".gz"_kj, "application/gzip"_kj);
    map.insert(".tar"_kj, "application/x-tar"_kj);
    map.insert(".txt"_kj, "text/plain; charset=utf-8"_kj);
    map.insert(".md"_kj, "text/markdown; charset=utf-8"_kj);
    map.insert(".csv"_kj, "text/csv; charset=utf-8"_kj);
    map.insert(".mp3"_kj, "audio/mpeg"_kj);
    map.insert(".mp4"_kj, "video/mp4"_kj);
    map.insert(".webm"_kj, "video/webm"_kj);
    return map;
  }();
  return mime_types;
}

kj::String lowercase_extension(kj::StringPtr path) {
  kj::StringPtr name = path;
  KJ_IF_SOME(slash, path.findLast('/')) {
    name = path.slice(slash + 1);
  }
  KJ_IF_SOME(dot, name.findLast('.')) {
    if (dot == 0) {
      // Hidden file such as .gitignore
      return kj::str();
    }
    auto ext = kj::str(name.slice(dot));
    for (char& c : ext) {
      if (c >= 'A' && c <= 'Z') {
        c = static_cast<char>(c - 'A' + 'a');
      }
    }
    return ext;
  }
  return kj::str();
}

bool has_prefix(kj::ArrayPtr<const kj::byte> content, const char* signature, size_t length) {
  return content.size() >= length && std::memcmp(content.begin(), signature, length) == 0;
}

bool is_whitespace(kj::byte b) {
  return b == '\t' || b == '\n' || b == '\x0c' || b == '\r' || b == ' ';
}

// Case-insensitive match of an HTML tag opener followed by a space or '>'.
bool has_html_tag(kj::ArrayPtr<const kj::byte> content, kj::StringPtr tag) {
  if (content.size() < tag.size() + 1) {
    return false;
  }
  for (size_t i = 0; i < tag.size(); ++i) {
    kj::byte b = content[i];
    if (b >= 'A' && b <= 'Z') {
      b = static_cast<kj::byte>(b - 'A' + 'a');
    }
    if (b != static_cast<kj::byte>(tag[i])) {
      return false;
    }
  }
  kj::byte terminator = content[tag.size()];
  return terminator == ' ' || terminator == '>';
}

} // namespace

kj::Maybe<kj::StringPtr> mime_type_for_path(kj::StringPtr path) {
  auto ext = lowercase_extension(path);
  if (ext.size() == 0) {
    return kj::none;
  }
  KJ_IF_SOME(mime, mime_type_map().find(ext)) {
    return mime;
  }
  return kj::none;
}

kj::StringPtr sniff_content_type(kj::ArrayPtr<const kj::byte> content) {
  if (content.size() > 512) {
    content = content.first(512);
  }

  if (has_prefix(content, "\x89PNG\r\n\x1a\n", 8)) {
    return "image/png"_kj;
  }
  if (has_prefix(content, "\xff\xd8\xff", 3)) {
    return "image/jpeg"_kj;
  }
  if (has_prefix(content, "GIF87a", 6) || has_prefix(content, "GIF89a", 6)) {
    return "image/gif"_kj;
  }
  if (content.size() >= 12 && has_prefix(content, "RIFF", 4) &&
      std::memcmp(content.begin() + 8, "WEBP", 4) == 0) {
    return "image/webp"_kj;
  }
  if (has_prefix(content, "BM", 2)) {
    return "image/bmp"_kj;
  }
  if (has_prefix(content, "%PDF-", 5)) {
    return "application/pdf"_kj;
  }
  if (has_prefix(content, "PK\x03\x04", 4)) {
    return "application/zip"_kj;
  }
  if (has_prefix(content, "\x1f\x8b\x08", 3)) {
    return "application/x-gzip"_kj;
  }
  if (has_prefix(content, "\0asm", 4)) {
    return "application/wasm"_kj;
  }

  size_t start = 0;
  while (start < content.size() && is_whitespace(content[start])) {
    ++start;
  }
  auto trimmed = content.slice(start, content.size());
  for (auto tag : {"<!doctype html"_kj, "<html"_kj, "<head"_kj, "<body"_kj, "<script"_kj,
                   "<div"_kj, "<p"_kj, "<!--"_kj}) {
    if (has_html_tag(trimmed, tag)) {
      return "text/html; charset=utf-8"_kj;
    }
  }
  if (has_prefix(trimmed, "<?xml", 5)) {
    return "text/xml; charset=utf-8"_kj;
  }

  for (kj::byte b : content) {
    // Control bytes other than whitespace and ESC indicate binary data.
    if (b < 0x20 && !is_whitespace(b) && b != 0x1b) {
      return "application/octet-stream"_kj;
    }
  }
  return "text/plain; charset=utf-8"_kj;
}

} // namespace doco::core
