#pragma once

#include <arrow/buffer.h>

#include <filesystem>
#include <memory>
#include <string>

namespace blobstream::storage {

/*
  Write-once blob files using Arrow IO.

  Files are named <prefix>-<uuid>.bin under a shared directory. The
  sender uses prefix "sender", the receiver "server"; unique ids keep
  the namespaces disjoint so no locking is needed.

  Properties:
    - atomic writes (unique tmp + link), a file is never visible half written
    - optional fsync
    - a stored file is never modified again
*/
class BlobStore {
 public:
  // Throws StorageError if root is missing or not a directory.
  BlobStore(std::filesystem::path root, std::string prefix, bool fsync = false);

  // Persist the buffer and return the final path. Throws BlobExistsError
  // if the id is already stored, StorageError on any other failure.
  std::filesystem::path Write(const std::string& blob_id, const arrow::Buffer& buffer) const;

  std::shared_ptr<arrow::Buffer> Read(const std::string& blob_id) const;

  bool Exists(const std::string& blob_id) const;

  std::filesystem::path PathFor(const std::string& blob_id) const;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
  std::string           prefix_;
  bool                  fsync_;
};

} // namespace blobstream::storage
