#pragma once

#include "session/session_store.h"

#include <kj/map.h>
#include <kj/mutex.h>

namespace doco::gateway {

/**
 * In-process SessionStore. Expired entries are skipped by find() and dropped by cleanup().
 *
 * commit() also runs cleanup() once per cleanup interval, so abandoned sessions do not
 * accumulate.
 */
class MemorySessionStore final : public SessionStore {
public:
  explicit MemorySessionStore(const kj::Clock& clock,
                              kj::Duration cleanupInterval = 1 * kj::MINUTES);

  kj::Maybe<kj::String> find(kj::StringPtr token) override;
  void commit(kj::StringPtr token, kj::StringPtr data, kj::Date expiry) override;
  void remove(kj::StringPtr token) override;

  /**
   * Remove expired entries, returning how many were dropped.
   */
  size_t cleanup();

  size_t size() const;

private:
  struct Entry {
    kj::String data;
    kj::Date expiry;
  };

  struct State {
    kj::HashMap<kj::String, Entry> entries;
    kj::Date nextSweep;
  };

  static size_t sweep(State& state, kj::Date now);

  const kj::Clock& clock_;
  kj::Duration cleanupInterval_;
  kj::MutexGuarded<State> state_;
};

} // namespace doco::gateway
