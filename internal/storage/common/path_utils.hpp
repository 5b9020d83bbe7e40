#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/util/uuid.hpp"

namespace blobstream::storage::common {

inline void ValidateBlobId(const std::string& blob_id) {
  if (!blobstream::util::IsCanonicalUUID(blob_id)) {
    throw std::invalid_argument("blob id must be a canonical UUID: " + blob_id);
  }
}

// <root>/<prefix>-<id>.bin
inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& prefix, const std::string& blob_id) {
  ValidateBlobId(blob_id);
  return root / (prefix + "-" + blob_id + ".bin");
}

} // namespace blobstream::storage::common
