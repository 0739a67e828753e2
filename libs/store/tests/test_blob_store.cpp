#include "doco/store/directory_blob_store.h"
#include "doco/store/memory_blob_store.h"

#include <kj/async.h>
#include <kj/filesystem.h>
#include <kj/string.h>
#include <kj/test.h>
#include <kj/time.h>

using namespace doco::store;

namespace {

Blob make_blob(kj::StringPtr filename, kj::StringPtr mime, kj::StringPtr text) {
  return Blob{kj::str(filename), kj::str(mime), kj::heapArray(text.asBytes()), kj::none};
}

kj::Own<const kj::Directory> make_directory() {
  auto dir = kj::newInMemoryDirectory(kj::nullClock());
  dir->openFile(kj::Path("report.pdf"), kj::WriteMode::CREATE)->writeAll("%PDF-1.7 body"_kj);
  dir->openFile(kj::Path("notes"), kj::WriteMode::CREATE)->writeAll("plain notes"_kj);
  dir->openFile(kj::Path("report..v2.pdf"), kj::WriteMode::CREATE)->writeAll("%PDF-1.7 v2"_kj);
  dir->openSubdir(kj::Path("nested"), kj::WriteMode::CREATE);
  return dir;
}

// ============================================================================
// Blob
// ============================================================================

KJ_TEST("Blob: Unknown mime type counts as absent") {
  KJ_EXPECT(make_blob("a.txt", "text/plain", "x").has_mime_type());
  KJ_EXPECT(!make_blob("a.txt", "unknown", "x").has_mime_type());
  KJ_EXPECT(!make_blob("a.txt", "", "x").has_mime_type());
}

// ============================================================================
// MemoryBlobStore
// ============================================================================

KJ_TEST("MemoryBlobStore: Lookup returns a copy") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  MemoryBlobStore store;
  store.put(make_blob("hello.txt", "text/plain", "hello"));
  KJ_EXPECT(store.size() == 1);

  auto found = store.find_by_filename("hello.txt").wait(waitScope);
  KJ_IF_SOME(blob, found) {
    KJ_EXPECT(blob.filename == "hello.txt");
    KJ_EXPECT(blob.mime_type == "text/plain");
    KJ_EXPECT(kj::str(blob.content.asChars()) == "hello");
  } else {
    KJ_FAIL_EXPECT("blob not found");
  }

  KJ_EXPECT(store.find_by_filename("missing.txt").wait(waitScope) == kj::none);
}

KJ_TEST("MemoryBlobStore: Put replaces and remove deletes") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  MemoryBlobStore store;
  store.put(make_blob("a.bin", "application/octet-stream", "one"));
  store.put(make_blob("a.bin", "application/octet-stream", "two"));
  KJ_EXPECT(store.size() == 1);

  KJ_IF_SOME(blob, store.find_by_filename("a.bin").wait(waitScope)) {
    KJ_EXPECT(kj::str(blob.content.asChars()) == "two");
  } else {
    KJ_FAIL_EXPECT("blob not found");
  }

  KJ_EXPECT(store.remove("a.bin"));
  KJ_EXPECT(!store.remove("a.bin"));
  KJ_EXPECT(store.size() == 0);
}

// ============================================================================
// DirectoryBlobStore
// ============================================================================

KJ_TEST("DirectoryBlobStore: Reads file with mime type and mtime") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  DirectoryBlobStore store(make_directory());
  KJ_IF_SOME(blob, store.find_by_filename("report.pdf").wait(waitScope)) {
    KJ_EXPECT(blob.mime_type == "application/pdf");
    KJ_EXPECT(kj::str(blob.content.asChars()) == "%PDF-1.7 body");
    KJ_EXPECT(blob.modified != kj::none);
  } else {
    KJ_FAIL_EXPECT("report.pdf not found");
  }

  KJ_IF_SOME(blob, store.find_by_filename("notes").wait(waitScope)) {
    KJ_EXPECT(blob.mime_type == "unknown");
    KJ_EXPECT(!blob.has_mime_type());
  } else {
    KJ_FAIL_EXPECT("notes not found");
  }
}

KJ_TEST("DirectoryBlobStore: Missing files and directories are not found") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  DirectoryBlobStore store(make_directory());
  KJ_EXPECT(store.find_by_filename("absent.txt").wait(waitScope) == kj::none);
  KJ_EXPECT(store.find_by_filename("nested").wait(waitScope) == kj::none);
}

KJ_TEST("DirectoryBlobStore: Rejects keys that escape the root") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  DirectoryBlobStore store(make_directory());
  KJ_EXPECT_THROW_MESSAGE("invalid blob key", store.find_by_filename("../etc/passwd").wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("invalid blob key", store.find_by_filename("nested/x").wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("invalid blob key", store.find_by_filename("a\\b").wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("blob key is empty", store.find_by_filename("").wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("invalid blob key", store.find_by_filename(".").wait(waitScope));
  KJ_EXPECT_THROW_MESSAGE("invalid blob key", store.find_by_filename("..").wait(waitScope));
}

KJ_TEST("DirectoryBlobStore: Dots inside a key are allowed") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);

  DirectoryBlobStore store(make_directory());
  KJ_IF_SOME(blob, store.find_by_filename("report..v2.pdf").wait(waitScope)) {
    KJ_EXPECT(blob.mime_type == "application/pdf");
    KJ_EXPECT(kj::str(blob.content.asChars()) == "%PDF-1.7 v2");
  } else {
    KJ_FAIL_EXPECT("report..v2.pdf not found");
  }
  KJ_EXPECT(store.find_by_filename("..hidden").wait(waitScope) == kj::none);
}

} // namespace
