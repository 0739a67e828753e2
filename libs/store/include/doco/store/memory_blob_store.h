#pragma once

#include "doco/store/blob_store.h"

#include <kj/map.h>
#include <kj/mutex.h>

namespace doco::store {

// In-process store keyed by filename; used by tests and as a seedable fallback.
class MemoryBlobStore final : public BlobStore {
public:
  MemoryBlobStore() = default;
  KJ_DISALLOW_COPY_AND_MOVE(MemoryBlobStore);

  kj::Promise<kj::Maybe<Blob>> find_by_filename(kj::StringPtr filename) override;

  /**
   * @brief Insert or replace the blob stored under blob.filename.
   */
  void put(Blob blob);
  bool remove(kj::StringPtr filename);
  [[nodiscard]] size_t size() const;

private:
  kj::MutexGuarded<kj::HashMap<kj::String, Blob>> blobs_;
};

} // namespace doco::store
