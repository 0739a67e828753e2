#pragma once

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace doco::proxy::test {

/**
 * @brief Test context with async I/O setup
 */
class TestContext {
public:
  TestContext()
      : io_(kj::setupAsyncIo()), headerTableOwn_(kj::heap<kj::HttpHeaderTable>()),
        headerTable_(*headerTableOwn_), waitScope_(io_.waitScope) {}

  kj::AsyncIoContext& io() {
    return io_;
  }
  kj::HttpHeaderTable& headerTable() {
    return headerTable_;
  }
  kj::WaitScope& waitScope() {
    return waitScope_;
  }

private:
  kj::AsyncIoContext io_;
  kj::Own<kj::HttpHeaderTable> headerTableOwn_;
  kj::HttpHeaderTable& headerTable_;
  kj::WaitScope& waitScope_;
};

/**
 * @brief Response that records status, headers and body for assertions.
 */
class MockResponse final : public kj::HttpService::Response {
public:
  kj::uint statusCode = 0;
  kj::String statusText;
  kj::HttpHeaders responseHeaders;
  kj::Vector<char> body;
  kj::Maybe<uint64_t> expectedBodySize;

  explicit MockResponse(const kj::HttpHeaderTable& headerTable) : responseHeaders(headerTable) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint status, kj::StringPtr text,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> bodySize) override {
    statusCode = status;
    statusText = kj::str(text);
    expectedBodySize = bodySize;

    headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
      kj::String ownedValue = kj::str(value);
      responseHeaders.addPtrPtr(name, ownedValue);
      responseHeaders.takeOwnership(kj::mv(ownedValue));
    });

    return kj::heap<MockOutputStream>(*this);
  }

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders&) override {
    KJ_FAIL_REQUIRE("WebSocket not supported in tests");
  }

  kj::String bodyText() const {
    return kj::heapString(body.asPtr());
  }

private:
  class MockOutputStream final : public kj::AsyncOutputStream {
  public:
    explicit MockOutputStream(MockResponse& parent) : parent_(parent) {}

    kj::Promise<void> write(kj::ArrayPtr<const kj::byte> data) override {
      parent_.body.addAll(data.asChars());
      return kj::READY_NOW;
    }

    kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
      for (auto& piece : pieces) {
        parent_.body.addAll(piece.asChars());
      }
      return kj::READY_NOW;
    }

    kj::Promise<void> whenWriteDisconnected() override {
      return kj::NEVER_DONE;
    }

  private:
    MockResponse& parent_;
  };
};

/**
 * @brief Empty request body
 */
class MockInputStream final : public kj::AsyncInputStream {
public:
  kj::Promise<size_t> tryRead(void*, size_t, size_t) override {
    return kj::Promise<size_t>(static_cast<size_t>(0));
  }
};

} // namespace doco::proxy::test
