#pragma once

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/vector.h>

namespace doco::gateway {

/**
 * Response wrapper handed down the middleware chain.
 *
 * Middleware cannot edit a response after the handler sent it, so instead they register
 * hooks that run when the status line is about to go out. The hooks see the status and a
 * mutable copy of the headers. The writer also records what was sent for logging.
 */
class ResponseWriter final : public kj::HttpService::Response {
public:
  using SendHook = kj::Function<void(kj::uint status, kj::HttpHeaders& headers)>;

  explicit ResponseWriter(kj::HttpService::Response& inner);

  /**
   * Register a hook. Hooks run in registration order, once, on the first send().
   */
  void on_send(SendHook hook);

  kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> expectedBodySize = kj::none) override;

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override;

  bool started() const {
    return started_;
  }
  kj::uint status() const {
    return status_;
  }
  uint64_t bytes_written() const {
    return bytesWritten_;
  }

private:
  class CountingStream;

  kj::HttpService::Response& inner_;
  kj::Vector<SendHook> hooks_;
  bool started_ = false;
  kj::uint status_ = 0;
  uint64_t bytesWritten_ = 0;

  kj::HttpHeaders run_hooks(kj::uint status, const kj::HttpHeaders& headers);
};

} // namespace doco::gateway
