#include "doco/core/shutdown_signal.h"

#include <kj/debug.h>

namespace doco::core {

ShutdownSignal::ShutdownSignal() : ShutdownSignal(kj::newPromiseAndFulfiller<void>()) {}

ShutdownSignal::ShutdownSignal(kj::PromiseFulfillerPair<void> paf)
    : fulfiller_(kj::mv(paf.fulfiller)), forked_(paf.promise.fork()) {}

void ShutdownSignal::cancel(kj::StringPtr reason) {
  if (reason_ != kj::none) {
    return;
  }
  KJ_LOG(INFO, "shutdown requested", reason);
  reason_ = kj::str(reason);
  fulfiller_->fulfill();
}

kj::Maybe<kj::StringPtr> ShutdownSignal::reason() const {
  KJ_IF_SOME(r, reason_) {
    return r.asPtr();
  }
  return kj::none;
}

kj::Promise<void> ShutdownSignal::when_cancelled() {
  return forked_.addBranch();
}

} // namespace doco::core
