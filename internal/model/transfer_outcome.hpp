#pragma once

#include <cstdint>
#include <string>

namespace blobstream::model {

enum class TransferStatus {
  kAccepted,       // 200 from the receiver
  kRejected,       // 400, checksum mismatch or malformed upload
  kFailed,         // transport, storage or unexpected status
};

inline const char* ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kAccepted:
      return "accepted";
    case TransferStatus::kRejected:
      return "rejected";
    case TransferStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  Result of one send attempt. Logged and counted, never persisted.

  http_status is 0 when no response was received.
*/
struct TransferOutcome {
  uint64_t       sequence_id = 0;
  std::string    blob_id;
  uint64_t       size_bytes  = 0;
  bool           corrupted   = false;
  TransferStatus status      = TransferStatus::kFailed;
  unsigned       http_status = 0;
  std::string    message;

  bool success() const {
    return status == TransferStatus::kAccepted;
  }
};

} // namespace blobstream::model
