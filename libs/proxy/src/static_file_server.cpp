#include "doco/proxy/static_file_server.h"

#include "doco/core/http_util.h"
#include "doco/core/mime.h"

#include <kj/debug.h>

namespace doco::proxy {

namespace {

kj::Maybe<kj::Own<const kj::ReadableDirectory>> open_static_root(kj::Filesystem& fs,
                                                                 kj::StringPtr staticDir) {
  auto path = fs.getCurrentPath().evalNative(staticDir);
  if (!fs.getRoot().exists(path)) {
    KJ_LOG(WARNING, "static directory does not exist", staticDir);
    return kj::none;
  }
  return fs.getRoot().openSubdir(kj::mv(path));
}

// The bundle entry point changes on every deploy, so clients must revalidate it.
bool is_index_document(kj::StringPtr path) {
  return path == "index.html"_kj || path.endsWith("/index.html");
}

kj::String content_type_for(kj::StringPtr path) {
  KJ_IF_SOME(mime, core::mime_type_for_path(path)) {
    return kj::str(mime);
  }
  return kj::str("application/octet-stream");
}

} // namespace

// ============================================================================
// StaticFileServer Implementation
// ============================================================================

StaticFileServer::StaticFileServer(const kj::HttpHeaderTable& headerTable, const Config& config)
    : headerTable_(headerTable),
      config_{kj::heapString(config.staticDir), config.enableCache, config.maxAge,
              config.maxFileSize},
      fs_(kj::newDiskFilesystem()), rootDir_(open_static_root(*fs_, config_.staticDir)) {}

StaticFileServer::StaticFileServer(const kj::HttpHeaderTable& headerTable, const Config& config,
                                   kj::Own<const kj::ReadableDirectory> root)
    : headerTable_(headerTable),
      config_{kj::heapString(config.staticDir), config.enableCache, config.maxAge,
              config.maxFileSize},
      rootDir_(kj::mv(root)) {}

kj::Promise<void> StaticFileServer::serve_file(kj::HttpMethod method, kj::StringPtr path,
                                               const kj::HttpHeaders& headers,
                                               kj::HttpService::Response& response,
                                               bool spaFallback) {
  if (method != kj::HttpMethod::GET && method != kj::HttpMethod::HEAD) {
    return send_error(405, response);
  }

  // Security check: prevent path traversal
  if (!is_safe_path(path)) {
    KJ_LOG(WARNING, "path traversal attempt blocked", path);
    return send_error(403, response);
  }

  kj::StringPtr normalizedPath = path;
  if (normalizedPath.startsWith("/")) {
    normalizedPath = normalizedPath.slice(1);
  }

  if (normalizedPath.size() == 0) {
    KJ_IF_SOME(info, read_file("index.html")) {
      return send_file_response(kj::mv(info), false, method, headers, response);
    }
    return send_error(404, response);
  }

  if (normalizedPath.endsWith("/")) {
    KJ_IF_SOME(info, read_file(kj::str(normalizedPath, "index.html"))) {
      return send_file_response(kj::mv(info), false, method, headers, response);
    }
  } else {
    KJ_IF_SOME(info, read_file(normalizedPath)) {
      bool cacheable = !is_index_document(normalizedPath);
      return send_file_response(kj::mv(info), cacheable, method, headers, response);
    }
  }

  // Not an existing asset: rewrite to "/" so the SPA router can take over.
  if (spaFallback) {
    KJ_IF_SOME(indexInfo, read_file("index.html")) {
      return send_file_response(kj::mv(indexInfo), false, method, headers, response);
    }
  }

  return send_error(404, response);
}

kj::Maybe<StaticFileServer::FileInfo> StaticFileServer::read_file(kj::StringPtr path) {
  const kj::ReadableDirectory* root = nullptr;
  KJ_IF_SOME(dir, rootDir_) {
    root = dir.get();
  } else {
    return kj::none;
  }

  try {
    auto relPath = kj::Path::parse(path);

    KJ_IF_SOME(meta, root->tryLstat(relPath)) {
      if (meta.type == kj::FsNode::Type::DIRECTORY) {
        return kj::none;
      }
    } else {
      return kj::none;
    }

    KJ_IF_SOME(file, root->tryOpenFile(relPath)) {
      auto stat = file->stat();
      KJ_REQUIRE(stat.size <= config_.maxFileSize, "file too large", path, stat.size,
                 config_.maxFileSize);

      auto data = file->readAllBytes();
      auto etag = generate_etag(stat.size, stat.lastModified);
      return FileInfo{kj::mv(data), content_type_for(path), stat.size, kj::mv(etag),
                      stat.lastModified};
    }
    return kj::none;
  } catch (const kj::Exception& e) {
    KJ_LOG(WARNING, "failed to read file", path, e);
    return kj::none;
  }
}

bool StaticFileServer::is_safe_path(kj::StringPtr path) const {
  if (path.findFirst('\0') != kj::none) {
    return false;
  }

  kj::StringPtr remaining = path;
  while (remaining.size() > 0) {
    KJ_IF_SOME(slashPos, remaining.findFirst('/')) {
      auto segment = remaining.slice(0, slashPos);
      if (segment == ".."_kj.asArray()) {
        return false;
      }
      remaining = remaining.slice(slashPos + 1);
    } else {
      if (remaining == ".."_kj) {
        return false;
      }
      break;
    }
  }

  return true;
}

kj::String StaticFileServer::generate_etag(uint64_t size, kj::Date lastModified) const {
  auto timestamp = (lastModified - kj::UNIX_EPOCH) / kj::MILLISECONDS;
  return kj::str("\"", size, "-", timestamp, "\"");
}

kj::Promise<void> StaticFileServer::send_error(kj::uint status,
                                               kj::HttpService::Response& response) {
  auto text = core::status_text(status);
  auto body = kj::str(status, " ", text, "\n");

  kj::HttpHeaders headers(headerTable_);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "text/plain; charset=utf-8"_kj);
  auto stream = response.send(status, text, headers, body.size());
  auto writePromise = stream->write(body.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(body));
}

kj::Promise<void> StaticFileServer::send_file_response(FileInfo info, bool cacheable,
                                                       kj::HttpMethod method,
                                                       const kj::HttpHeaders& requestHeaders,
                                                       kj::HttpService::Response& response) {
  kj::HttpHeaders headers(headerTable_);
  headers.set(kj::HttpHeaderId::CONTENT_TYPE, kj::mv(info.contentType));

  auto lastModified = core::format_http_date(info.lastModified);
  if (config_.enableCache) {
    if (cacheable) {
      headers.addPtr("Cache-Control"_kj, kj::str("public, max-age=", config_.maxAge));
    } else {
      headers.addPtrPtr("Cache-Control"_kj, "no-cache"_kj);
    }
    headers.addPtrPtr("ETag"_kj, info.etag);
    headers.addPtrPtr("Last-Modified"_kj, lastModified);
  }

  bool notModified = false;
  KJ_IF_SOME(ifNoneMatch, core::find_header(requestHeaders, "If-None-Match")) {
    notModified = ifNoneMatch == info.etag || ifNoneMatch == "*"_kj;
  } else {
    KJ_IF_SOME(ifModifiedSince, core::find_header(requestHeaders, "If-Modified-Since")) {
      KJ_IF_SOME(since, core::parse_http_date(ifModifiedSince)) {
        notModified = core::unix_seconds(info.lastModified) <= core::unix_seconds(since);
      }
    }
  }

  if (notModified) {
    headers.unset(kj::HttpHeaderId::CONTENT_TYPE);
    auto stream = response.send(304, "Not Modified"_kj, headers, uint64_t(0));
    return kj::Promise<void>(kj::READY_NOW)
        .attach(kj::mv(stream), kj::mv(info.etag), kj::mv(lastModified));
  }

  auto stream = response.send(200, "OK"_kj, headers, info.size);
  if (method == kj::HttpMethod::HEAD) {
    return kj::Promise<void>(kj::READY_NOW)
        .attach(kj::mv(stream), kj::mv(info.etag), kj::mv(lastModified));
  }
  auto writePromise = stream->write(info.content.asBytes());
  return writePromise.attach(kj::mv(stream), kj::mv(info.content), kj::mv(info.etag),
                             kj::mv(lastModified));
}

} // namespace doco::proxy
