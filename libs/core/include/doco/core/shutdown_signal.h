#pragma once

#include <kj/async.h>
#include <kj/common.h>
#include <kj/string.h>

namespace doco::core {

/**
 * @brief One-shot cancellation shared by every service of a process.
 *
 * Any number of waiters may call when_cancelled(); all of them resolve once cancel() is
 * called. cancel() is idempotent and the first reason is kept. Must be created and used on
 * the thread that owns the KJ event loop.
 */
class ShutdownSignal final {
public:
  ShutdownSignal();

  KJ_DISALLOW_COPY_AND_MOVE(ShutdownSignal);

  void cancel(kj::StringPtr reason);

  [[nodiscard]] bool is_cancelled() const {
    return reason_ != kj::none;
  }

  [[nodiscard]] kj::Maybe<kj::StringPtr> reason() const;

  [[nodiscard]] kj::Promise<void> when_cancelled();

private:
  explicit ShutdownSignal(kj::PromiseFulfillerPair<void> paf);

  kj::Own<kj::PromiseFulfiller<void>> fulfiller_;
  kj::ForkedPromise<void> forked_;
  kj::Maybe<kj::String> reason_;
};

} // namespace doco::core
