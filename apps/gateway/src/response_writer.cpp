#include "response_writer.h"

#include <kj/debug.h>

namespace doco::gateway {

class ResponseWriter::CountingStream final : public kj::AsyncOutputStream {
public:
  CountingStream(kj::Own<kj::AsyncOutputStream> inner, uint64_t& counter)
      : inner_(kj::mv(inner)), counter_(counter) {}

  kj::Promise<void> write(kj::ArrayPtr<const kj::byte> buffer) override {
    counter_ += buffer.size();
    return inner_->write(buffer);
  }

  kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
    for (auto& piece : pieces) {
      counter_ += piece.size();
    }
    return inner_->write(pieces);
  }

  kj::Promise<void> whenWriteDisconnected() override {
    return inner_->whenWriteDisconnected();
  }

private:
  kj::Own<kj::AsyncOutputStream> inner_;
  uint64_t& counter_;
};

ResponseWriter::ResponseWriter(kj::HttpService::Response& inner) : inner_(inner) {}

void ResponseWriter::on_send(SendHook hook) {
  KJ_REQUIRE(!started_, "response already started");
  hooks_.add(kj::mv(hook));
}

kj::HttpHeaders ResponseWriter::run_hooks(kj::uint status, const kj::HttpHeaders& headers) {
  KJ_REQUIRE(!started_, "response already started", status);
  started_ = true;
  status_ = status;

  auto finalHeaders = headers.clone();
  for (auto& hook : hooks_) {
    hook(status, finalHeaders);
  }
  return finalHeaders;
}

kj::Own<kj::AsyncOutputStream> ResponseWriter::send(kj::uint statusCode,
                                                    kj::StringPtr statusText,
                                                    const kj::HttpHeaders& headers,
                                                    kj::Maybe<uint64_t> expectedBodySize) {
  auto finalHeaders = run_hooks(statusCode, headers);
  auto stream = inner_.send(statusCode, statusText, finalHeaders, expectedBodySize);
  return kj::heap<CountingStream>(kj::mv(stream), bytesWritten_).attach(kj::mv(finalHeaders));
}

kj::Own<kj::WebSocket> ResponseWriter::acceptWebSocket(const kj::HttpHeaders& headers) {
  auto finalHeaders = run_hooks(101, headers);
  return inner_.acceptWebSocket(finalHeaders).attach(kj::mv(finalHeaders));
}

} // namespace doco::gateway
