#pragma once

#include <kj/async.h>
#include <kj/compat/http.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/time.h>

namespace doco::proxy {

/**
 * Static file server for the web bundle behind the load balancer.
 *
 * Features:
 * - MIME type detection from the file extension
 * - Security: prevents path traversal attacks
 * - Cache headers: Cache-Control, ETag, Last-Modified, conditional GET (304)
 *   (index.html, including the SPA fallback, is sent with "no-cache")
 * - Directory index: serves index.html for directory requests
 * - SPA routing: a path that names no existing asset is served as "/"
 */
class StaticFileServer {
public:
  /**
   * Configuration for the static file server.
   */
  struct Config {
    kj::String staticDir;                    // Directory containing static files
    bool enableCache = true;                 // Enable cache headers
    uint32_t maxAge = 3600;                  // Cache max-age in seconds (default: 1 hour)
    uint64_t maxFileSize = 64 * 1024 * 1024; // Max file size: 64MB
  };

  /**
   * File information structure.
   */
  struct FileInfo {
    kj::Array<kj::byte> content;
    kj::String contentType;
    uint64_t size;
    kj::String etag;
    kj::Date lastModified;
  };

  /**
   * Construct a static file server rooted at config.staticDir on the local disk.
   *
   * A missing directory is logged and every request then gets 404.
   */
  StaticFileServer(const kj::HttpHeaderTable& headerTable, const Config& config);

  /**
   * Construct a static file server over an already opened directory.
   */
  StaticFileServer(const kj::HttpHeaderTable& headerTable, const Config& config,
                   kj::Own<const kj::ReadableDirectory> root);

  /**
   * Serve a file from the static directory.
   *
   * @param method HTTP method
   * @param path Decoded request path (e.g., "/index.html", "/assets/main.js")
   * @param headers Request headers
   * @param response HTTP response object
   * @param spaFallback Serve index.html when path names no existing file
   * @return Promise that completes when the file is sent or error returned
   */
  kj::Promise<void> serve_file(kj::HttpMethod method, kj::StringPtr path,
                               const kj::HttpHeaders& headers, kj::HttpService::Response& response,
                               bool spaFallback = true);

  kj::StringPtr static_dir() const {
    return config_.staticDir;
  }

private:
  const kj::HttpHeaderTable& headerTable_;
  Config config_;
  kj::Own<kj::Filesystem> fs_;
  kj::Maybe<kj::Own<const kj::ReadableDirectory>> rootDir_;

  kj::Maybe<FileInfo> read_file(kj::StringPtr path);

  bool is_safe_path(kj::StringPtr path) const;

  kj::String generate_etag(uint64_t size, kj::Date lastModified) const;

  kj::Promise<void> send_error(kj::uint status, kj::HttpService::Response& response);

  kj::Promise<void> send_file_response(FileInfo info, bool cacheable, kj::HttpMethod method,
                                       const kj::HttpHeaders& requestHeaders,
                                       kj::HttpService::Response& response);
};

} // namespace doco::proxy
