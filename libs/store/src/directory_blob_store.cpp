#include "doco/store/directory_blob_store.h"

#include "doco/core/error.h"
#include "doco/core/mime.h"

#include <kj/debug.h>

namespace doco::store {

namespace {

constexpr uint64_t kMaxBlobSize = 256ull * 1024 * 1024;

kj::Own<const kj::ReadableDirectory> open_blob_root(kj::Filesystem& fs, kj::StringPtr root) {
  auto path = fs.getCurrentPath().evalNative(root);
  KJ_REQUIRE(fs.getRoot().exists(path), "blob directory does not exist", root);
  return fs.getRoot().openSubdir(kj::mv(path));
}

void validate_key(kj::StringPtr filename) {
  if (filename.size() == 0) {
    core::ValidationException("blob key is empty").throwException();
  }
  // Keys are single path components; dots inside a name are fine.
  if (filename == "."_kj || filename == ".."_kj || filename.findFirst('/') != kj::none ||
      filename.findFirst('\\') != kj::none) {
    core::ValidationException(kj::str("invalid blob key: ", filename)).throwException();
  }
}

} // namespace

DirectoryBlobStore::DirectoryBlobStore(kj::StringPtr root)
    : fs_(kj::newDiskFilesystem()), root_(open_blob_root(*fs_, root)) {}

DirectoryBlobStore::DirectoryBlobStore(kj::Own<const kj::ReadableDirectory> root)
    : root_(kj::mv(root)) {}

kj::Promise<kj::Maybe<Blob>> DirectoryBlobStore::find_by_filename(kj::StringPtr filename) {
  return kj::evalNow([&]() { return read_blob(filename); });
}

kj::Maybe<Blob> DirectoryBlobStore::read_blob(kj::StringPtr filename) {
  validate_key(filename);

  kj::Path path(filename);
  KJ_IF_SOME(entry, root_->tryLstat(path)) {
    if (entry.type == kj::FsNode::Type::DIRECTORY) {
      return kj::none;
    }
  } else {
    return kj::none;
  }

  KJ_IF_SOME(file, root_->tryOpenFile(path)) {
    auto meta = file->stat();
    KJ_REQUIRE(meta.size <= kMaxBlobSize, "blob too large", filename, meta.size);

    kj::String mime_type;
    KJ_IF_SOME(type, core::mime_type_for_path(filename)) {
      mime_type = kj::str(type);
    } else {
      mime_type = kj::str("unknown");
    }
    return Blob{kj::str(filename), kj::mv(mime_type), file->readAllBytes(), meta.lastModified};
  }
  return kj::none;
}

} // namespace doco::store
