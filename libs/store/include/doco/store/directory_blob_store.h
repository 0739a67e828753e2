#pragma once

#include "doco/store/blob_store.h"

#include <kj/filesystem.h>
#include <kj/memory.h>

namespace doco::store {

/**
 * @brief Serves blobs from regular files directly under a root directory.
 *
 * The filename is the key. Keys that are empty, "." or "..", or contain '/' or '\\' are rejected
 * with a ValidationException. The mime type is derived from the extension ("unknown" when
 * none is registered) and the modification time from the file's mtime.
 */
class DirectoryBlobStore final : public BlobStore {
public:
  /**
   * @brief Open root on the local disk, relative to the working directory.
   * @throws kj::Exception if root does not exist
   */
  explicit DirectoryBlobStore(kj::StringPtr root);

  explicit DirectoryBlobStore(kj::Own<const kj::ReadableDirectory> root);

  kj::Promise<kj::Maybe<Blob>> find_by_filename(kj::StringPtr filename) override;

private:
  kj::Maybe<Blob> read_blob(kj::StringPtr filename);

  kj::Own<kj::Filesystem> fs_;
  kj::Own<const kj::ReadableDirectory> root_;
};

} // namespace doco::store
