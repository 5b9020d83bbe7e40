#include "checksummed_payload.hpp"

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/checksum.hpp"

namespace blobstream::sender {

ChecksummedPayload PrepareTransfer(const std::shared_ptr<const arrow::Buffer>& original, bool corrupt) {
  ChecksummedPayload result;
  result.declared_checksum = blobstream::util::Sha256Hex(original->data(), static_cast<std::size_t>(original->size()));
  result.payload_bytes     = original;

  if (corrupt && original->size() > 0) {
    auto copy = storage::common::MutableCopy(*original);
    copy->mutable_data()[0] += 1;
    result.payload_bytes = std::move(copy);
    result.corrupted     = true;
  }

  return result;
}

} // namespace blobstream::sender
