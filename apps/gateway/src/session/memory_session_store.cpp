#include "session/memory_session_store.h"

namespace doco::gateway {

MemorySessionStore::MemorySessionStore(const kj::Clock& clock, kj::Duration cleanupInterval)
    : clock_(clock), cleanupInterval_(cleanupInterval),
      state_(State{{}, clock.now() + cleanupInterval}) {}

kj::Maybe<kj::String> MemorySessionStore::find(kj::StringPtr token) {
  auto now = clock_.now();
  auto lock = state_.lockExclusive();
  KJ_IF_SOME(entry, lock->entries.find(token)) {
    if (entry.expiry > now) {
      return kj::str(entry.data);
    }
    lock->entries.erase(token);
  }
  return kj::none;
}

void MemorySessionStore::commit(kj::StringPtr token, kj::StringPtr data, kj::Date expiry) {
  auto now = clock_.now();
  auto lock = state_.lockExclusive();
  if (now >= lock->nextSweep) {
    sweep(*lock, now);
    lock->nextSweep = now + cleanupInterval_;
  }
  lock->entries.upsert(kj::str(token), Entry{kj::str(data), expiry},
                       [](Entry& existing, Entry&& replacement) { existing = kj::mv(replacement); });
}

void MemorySessionStore::remove(kj::StringPtr token) {
  auto lock = state_.lockExclusive();
  lock->entries.erase(token);
}

size_t MemorySessionStore::cleanup() {
  auto now = clock_.now();
  auto lock = state_.lockExclusive();
  return sweep(*lock, now);
}

size_t MemorySessionStore::size() const {
  return state_.lockShared()->entries.size();
}

size_t MemorySessionStore::sweep(State& state, kj::Date now) {
  return state.entries.eraseAll(
      [&](const kj::String&, const Entry& entry) { return entry.expiry <= now; });
}

} // namespace doco::gateway
