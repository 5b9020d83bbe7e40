#include "upload_handler.hpp"

#include <arrow/buffer.h>

#include <filesystem>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/transport/http_headers.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace blobstream::receiver {

namespace http = boost::beast::http;

using blobstream::observability::IntField;
using blobstream::observability::StringField;
using blobstream::runtime::HttpRequest;
using blobstream::runtime::HttpResponse;
using blobstream::util::InvalidRequest;

namespace {

HttpResponse MakeResponse(const HttpRequest& request, http::status status, std::string body) {
  HttpResponse res{status, request.version()};
  res.set(http::field::server, "blobstream-receiver");
  res.set(http::field::content_type, "text/plain");
  res.keep_alive(request.keep_alive());
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

std::string_view TargetPath(std::string_view target) {
  auto query = target.find('?');
  return query == std::string_view::npos ? target : target.substr(0, query);
}

std::string ExtractChecksum(const HttpRequest& request) {
  auto it = request.find(transport::kChecksumHeader);
  if (it == request.end()) {
    throw InvalidRequest("Malformed request, no checksum header");
  }
  const auto  value = it->value();
  std::string checksum(value.data(), value.size());
  if (!util::IsHexDigest(checksum)) {
    throw InvalidRequest("Malformed request, checksum header is not a hex sha256 digest");
  }
  return checksum;
}

std::string ExtractBlobId(const HttpRequest& request) {
  auto it = request.find(transport::kBlobIdHeader);
  if (it == request.end()) {
    return util::ToString(util::GenerateUUID());
  }
  const auto  value = it->value();
  std::string id(value.data(), value.size());
  if (!util::IsCanonicalUUID(id)) {
    throw InvalidRequest("Malformed request, blob id is not a UUID");
  }
  return id;
}

} // namespace

std::string AcceptedMessage(std::size_t size_bytes) {
  return "Successfully received the " + std::to_string(size_bytes) + " byte file";
}

UploadHandler::UploadHandler(std::shared_ptr<const storage::BlobStore> store, std::string path, bool verify_checksums)
    : store_(std::move(store)), path_(std::move(path)), verify_checksums_(verify_checksums) {
}

HttpResponse UploadHandler::Handle(const HttpRequest& request) const {
  const std::string_view target(request.target().data(), request.target().size());
  if (TargetPath(target) != path_) {
    return MakeResponse(request, http::status::not_found, "Not found\n");
  }

  if (request.method() != http::verb::post) {
    auto res = MakeResponse(request, http::status::method_not_allowed, "Only POST is supported\n");
    res.set(http::field::allow, "POST");
    return res;
  }

  try {
    return HandleUpload(request);
  } catch (const InvalidRequest& e) {
    BLOBSTREAM_LOG_ERROR(e.what());
    return MakeResponse(request, http::status::bad_request, std::string(e.what()) + "\n");
  } catch (const util::StorageError& e) {
    BLOBSTREAM_LOG_ERROR("Failed to save uploaded file", {StringField("error", e.what())});
    return MakeResponse(request, http::status::internal_server_error, "Failed to save file\n");
  }
}

HttpResponse UploadHandler::HandleUpload(const HttpRequest& request) const {
  const auto declared = ExtractChecksum(request);
  const auto blob_id  = ExtractBlobId(request);

  const auto& body = request.body();

  util::Sha256 hasher;
  hasher.Update(body.data(), body.size());
  const auto computed = hasher.FinalHex();

  const auto id    = StringField("id", blob_id);
  const auto bytes = IntField("bytes", static_cast<int64_t>(body.size()));

  if (!util::DigestsEqual(declared, computed)) {
    if (verify_checksums_) {
      BLOBSTREAM_LOG_ERROR("Strict hash checking enabled, but hashes dont match!",
                           {id, bytes, StringField("declared", declared), StringField("computed", computed)});
      BLOBSTREAM_LOG_INFO("Saving file will be skipped due to hash mismatch!", {id});
      return MakeResponse(request, http::status::bad_request, "Checksum mismatch, file was not saved\n");
    }
    BLOBSTREAM_LOG_WARN("Hashes dont match, saving anyway since verification is disabled", {id, bytes});
  }

  const arrow::Buffer   view(reinterpret_cast<const uint8_t*>(body.data()), static_cast<int64_t>(body.size()));
  std::filesystem::path path;
  try {
    path = store_->Write(blob_id, view);
  } catch (const util::BlobExistsError&) {
    BLOBSTREAM_LOG_WARN("Refusing to overwrite an existing blob", {id});
    return MakeResponse(request, http::status::conflict, "Blob id already stored\n");
  }
  BLOBSTREAM_LOG_INFO("Wrote a " + std::to_string(body.size()) + " byte file to " + path.string(), {id});

  return MakeResponse(request, http::status::ok, AcceptedMessage(body.size()));
}

} // namespace blobstream::receiver
