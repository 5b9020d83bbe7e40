#include "internal/receiver/upload_handler.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/storage/blob_store.hpp"
#include "internal/transport/http_headers.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/uuid.hpp"

namespace {

namespace http = boost::beast::http;

using blobstream::receiver::UploadHandler;
using blobstream::runtime::HttpRequest;
using blobstream::storage::BlobStore;

std::filesystem::path FreshDir(const std::string& test_name) {
  const auto dir = std::filesystem::temp_directory_path() / "blobstream_upload_handler_tests" / test_name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

int CountFiles(const std::filesystem::path& dir) {
  int count = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++count;
  }
  return count;
}

HttpRequest MakeUpload(const std::string& body, const std::string& checksum, const std::string& id) {
  HttpRequest req{http::verb::post, "/uploads", 11};
  req.set(blobstream::transport::kChecksumHeader, checksum);
  if (!id.empty()) req.set(blobstream::transport::kBlobIdHeader, id);
  req.body() = body;
  req.prepare_payload();
  return req;
}

std::string Digest(const std::string& body) {
  return blobstream::util::Sha256Hex(body.data(), body.size());
}

std::string NewId() {
  return blobstream::util::ToString(blobstream::util::GenerateUUID());
}

void TestMatchingUploadIsStored() {
  const auto dir = FreshDir("matching");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  const std::string body(2048, 'a');
  const auto        id  = NewId();
  auto              res = handler.Handle(MakeUpload(body, Digest(body), id));

  assert(res.result() == http::status::ok);
  assert(res.body() == "Successfully received the 2048 byte file");
  assert(std::filesystem::file_size(dir / ("server-" + id + ".bin")) == 2048);
  assert(Digest(store->Read(id)->ToString()) == Digest(body));
}

void TestMismatchIsRejectedWithoutWriting() {
  const auto dir = FreshDir("mismatch");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  const std::string original = "original payload";
  const std::string corrupt  = "Original payload";
  const auto        id       = NewId();
  auto              res      = handler.Handle(MakeUpload(corrupt, Digest(original), id));

  assert(res.result() == http::status::bad_request);
  assert(!store->Exists(id));
  assert(CountFiles(dir) == 0);
}

void TestMismatchIsStoredWhenVerificationDisabled() {
  const auto dir = FreshDir("mismatch_lenient");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", false);

  const std::string body = "whatever arrived";
  const auto        id   = NewId();
  auto              res  = handler.Handle(MakeUpload(body, Digest("something else"), id));

  assert(res.result() == http::status::ok);
  assert(store->Exists(id));
}

void TestMissingOrMalformedChecksumIsBadRequest() {
  const auto dir = FreshDir("bad_checksum");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  HttpRequest missing{http::verb::post, "/uploads", 11};
  missing.body() = "data";
  missing.prepare_payload();
  assert(handler.Handle(missing).result() == http::status::bad_request);

  assert(handler.Handle(MakeUpload("data", "not-a-digest", NewId())).result() == http::status::bad_request);
  assert(CountFiles(dir) == 0);
}

void TestMalformedIdIsBadRequest() {
  const auto dir = FreshDir("bad_id");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  const std::string body = "data";
  auto              res  = handler.Handle(MakeUpload(body, Digest(body), "../../escape"));
  assert(res.result() == http::status::bad_request);
  assert(CountFiles(dir) == 0);
}

void TestMissingIdGetsFreshName() {
  const auto dir = FreshDir("no_id");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  const std::string body = "anonymous";
  assert(handler.Handle(MakeUpload(body, Digest(body), "")).result() == http::status::ok);
  assert(handler.Handle(MakeUpload(body, Digest(body), "")).result() == http::status::ok);
  assert(CountFiles(dir) == 2);
}

void TestStoredBlobIsNeverOverwritten() {
  const auto dir = FreshDir("duplicate_id");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  const auto        id    = NewId();
  const std::string first = "first";
  const std::string again = "second";
  assert(handler.Handle(MakeUpload(first, Digest(first), id)).result() == http::status::ok);
  assert(handler.Handle(MakeUpload(again, Digest(again), id)).result() == http::status::conflict);
  assert(store->Read(id)->ToString() == "first");
}

void TestRoutingErrors() {
  const auto dir = FreshDir("routing");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);

  HttpRequest get{http::verb::get, "/uploads", 11};
  assert(handler.Handle(get).result() == http::status::method_not_allowed);

  const std::string body = "data";
  auto              req  = MakeUpload(body, Digest(body), NewId());
  req.target("/elsewhere");
  assert(handler.Handle(req).result() == http::status::not_found);

  auto with_query = MakeUpload(body, Digest(body), NewId());
  with_query.target("/uploads?source=test");
  assert(handler.Handle(with_query).result() == http::status::ok);
}

void TestStorageFailureIsServerError() {
  const auto dir = FreshDir("vanished");
  auto       store = std::make_shared<const BlobStore>(dir, "server");
  UploadHandler handler(store, "/uploads", true);
  std::filesystem::remove_all(dir);

  const std::string body = "data";
  assert(handler.Handle(MakeUpload(body, Digest(body), NewId())).result() == http::status::internal_server_error);
}

} // namespace

int main() {
  TestMatchingUploadIsStored();
  TestMismatchIsRejectedWithoutWriting();
  TestMismatchIsStoredWhenVerificationDisabled();
  TestMissingOrMalformedChecksumIsBadRequest();
  TestMalformedIdIsBadRequest();
  TestMissingIdGetsFreshName();
  TestStoredBlobIsNeverOverwritten();
  TestRoutingErrors();
  TestStorageFailureIsServerError();

  std::cout << "blobstream_unit_upload_handler: pass\n";
  return 0;
}
