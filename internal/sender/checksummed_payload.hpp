#pragma once

#include <arrow/buffer.h>

#include <memory>
#include <string>

namespace blobstream::sender {

/*
  What actually goes on the wire for one blob.

  declared_checksum is always the digest of the original bytes. When
  corruption is requested, payload_bytes is a mutated copy made after
  the digest was taken, so the receiver sees a mismatch.
*/
struct ChecksummedPayload {
  std::shared_ptr<const arrow::Buffer> payload_bytes;
  std::string                          declared_checksum;
  bool                                 corrupted = false;
};

// Digest first, then (optionally) corrupt a private copy. `original` is never modified.
ChecksummedPayload PrepareTransfer(const std::shared_ptr<const arrow::Buffer>& original, bool corrupt);

} // namespace blobstream::sender
