#pragma once

namespace blobstream::transport {

// Hex SHA-256 of the original (pre-corruption) payload.
inline constexpr const char* kChecksumHeader = "X-Blob-Checksum";

// Sender-chosen UUID, reused by the receiver for its file name.
inline constexpr const char* kBlobIdHeader = "X-Blob-Id";

} // namespace blobstream::transport
