#pragma once

#include <memory>
#include <string>

#include "internal/runtime/http_session.hpp"

namespace blobstream::storage {
class BlobStore;
}

namespace blobstream::receiver {

/*
  Validates and persists one uploaded blob.

      POST <path>
      X-Blob-Checksum: <hex sha256 of the original bytes>
      X-Blob-Id:       <uuid>   (optional)

  The digest is recomputed over the received body. With strict checking
  a mismatch is answered 400 and nothing is written; otherwise the body
  is stored as server-<id>.bin and answered 200. Stateless across
  requests, safe to call from several I/O threads.
*/
class UploadHandler {
 public:
  UploadHandler(std::shared_ptr<const storage::BlobStore> store, std::string path, bool verify_checksums);

  runtime::HttpResponse Handle(const runtime::HttpRequest& request) const;

  runtime::HttpResponse operator()(const runtime::HttpRequest& request) const {
    return Handle(request);
  }

 private:
  runtime::HttpResponse HandleUpload(const runtime::HttpRequest& request) const;

  std::shared_ptr<const storage::BlobStore> store_;
  std::string                               path_;
  bool                                      verify_checksums_;
};

// "Successfully received the <N> byte file"
std::string AcceptedMessage(std::size_t size_bytes);

} // namespace blobstream::receiver
