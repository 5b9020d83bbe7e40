#include "blob_store.hpp"

#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace blobstream::storage {

using namespace blobstream::storage::common;
using blobstream::util::BlobExistsError;
using blobstream::util::StorageError;

BlobStore::BlobStore(std::filesystem::path root, std::string prefix, bool fsync)
    : root_(std::move(root)), prefix_(std::move(prefix)), fsync_(fsync) {

  std::error_code ec;
  if (!std::filesystem::is_directory(root_, ec)) {
    throw StorageError("target directory does not exist or is not a directory: " + root_.string());
  }
}

std::filesystem::path BlobStore::PathFor(const std::string& blob_id) const {
  return BlobPath(root_, prefix_, blob_id);
}

/*
  Atomic write:
      write unique tmp → flush → link to final name → unlink tmp

  Each call writes its own temporary, so concurrent writers never share
  bytes. Linking fails if the final name exists, which makes publishing
  write-once even when two writers race on the same id.

  On any failure the temporary is removed, so an interrupted or failed
  write leaves nothing behind under the final name.
*/
std::filesystem::path BlobStore::Write(const std::string& blob_id, const arrow::Buffer& buffer) const {

  auto final_path = PathFor(blob_id);
  auto tmp_path   = final_path.string() + "." + util::ToString(util::GenerateUUID()) + ".tmp";

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer.data(), buffer.size()));

    if (fsync_)
      Unwrap(out->Flush());

    Unwrap(out->Close());
  } catch (const std::exception& e) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw StorageError("failed to write " + final_path.string() + ": " + e.what());
  }

  std::error_code ec;
  std::filesystem::create_hard_link(tmp_path, final_path, ec);

  std::error_code ignored;
  std::filesystem::remove(tmp_path, ignored);

  if (ec == std::errc::file_exists)
    throw BlobExistsError("blob already stored: " + final_path.string());
  if (ec)
    throw StorageError("failed to publish " + final_path.string() + ": " + ec.message());

  return final_path;
}

/*
  Read entire blob from disk.
*/
std::shared_ptr<arrow::Buffer> BlobStore::Read(const std::string& blob_id) const {
  auto path = PathFor(blob_id);
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

bool BlobStore::Exists(const std::string& blob_id) const {
  std::error_code ec;
  return std::filesystem::exists(PathFor(blob_id), ec);
}

} // namespace blobstream::storage
