#include "doco/store/memory_blob_store.h"

namespace doco::store {

kj::Promise<kj::Maybe<Blob>> MemoryBlobStore::find_by_filename(kj::StringPtr filename) {
  auto lock = blobs_.lockShared();
  KJ_IF_SOME(blob, lock->find(filename)) {
    return kj::Maybe<Blob>(blob.clone());
  }
  return kj::Maybe<Blob>(kj::none);
}

void MemoryBlobStore::put(Blob blob) {
  auto lock = blobs_.lockExclusive();
  auto key = kj::str(blob.filename);
  lock->upsert(kj::mv(key), kj::mv(blob), [](Blob& existing, Blob&& replacement) {
    existing = kj::mv(replacement);
  });
}

bool MemoryBlobStore::remove(kj::StringPtr filename) {
  return blobs_.lockExclusive()->erase(filename);
}

size_t MemoryBlobStore::size() const {
  return blobs_.lockShared()->size();
}

} // namespace doco::store
