#pragma once

#include <stdexcept>
#include <string>

namespace blobstream::util {

/*
  Central error types.

  Workers turn these into failed transfer outcomes; the upload handler
  translates them to HTTP status codes.
*/

// Connection refused / reset / timed out while talking to the receiver.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Local filesystem failure while persisting a blob.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A blob with this id is already stored; stored files are never replaced.
class BlobExistsError : public StorageError {
 public:
  explicit BlobExistsError(const std::string& msg) : StorageError(msg) {
  }
};

// Malformed upload (missing or bad headers).
class InvalidRequest : public std::runtime_error {
 public:
  explicit InvalidRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Random payload generation failed; the sender cannot continue.
class GenerationError : public std::runtime_error {
 public:
  explicit GenerationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace blobstream::util
