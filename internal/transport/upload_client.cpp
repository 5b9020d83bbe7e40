#include "upload_client.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/error.hpp>
#include <boost/beast/http.hpp>

#include "internal/transport/http_headers.hpp"
#include "internal/util/errors.hpp"

namespace blobstream::transport {

namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = boost::asio::ip::tcp;

using blobstream::util::TransportError;

UploadClient::UploadClient(std::string host, uint16_t port, std::string path, std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port), path_(std::move(path)), timeout_(timeout), resolver_(ioc_) {
}

UploadClient::~UploadClient() {
  Close();
}

// Run queued async operations to completion. tcp_stream timeouts only
// apply to async operations, so every step goes through here.
void UploadClient::Drive() {
  ioc_.restart();
  ioc_.run();
}

void UploadClient::Connect() {
  beast::error_code ec;
  auto              results = resolver_.resolve(host_, std::to_string(port_), ec);
  if (ec) throw TransportError("resolve " + host_ + " failed: " + ec.message());

  stream_ = std::make_unique<beast::tcp_stream>(ioc_);
  stream_->expires_after(timeout_);
  stream_->async_connect(results, [&ec](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
  Drive();

  if (ec) {
    Close();
    throw TransportError("connect to " + host_ + ":" + std::to_string(port_) + " failed: " + ec.message());
  }
}

void UploadClient::Close() {
  if (!stream_) return;

  beast::error_code ignored;
  stream_->socket().shutdown(tcp::socket::shutdown_both, ignored);
  stream_->close();
  stream_.reset();
  buffer_.clear();
}

// True if a kept-alive connection still looks usable. The receiver
// closes idle connections, so a pending EOF, reset, or unexpected bytes
// mean the socket must not carry another request.
bool UploadClient::ReusableConnection() {
  auto& socket = stream_->socket();

  beast::error_code ec;
  socket.non_blocking(true, ec);
  if (ec) return false;

  char probe = 0;
  socket.read_some(boost::asio::buffer(&probe, 1), ec);

  beast::error_code ignored;
  socket.non_blocking(false, ignored);

  return ec == boost::asio::error::would_block;
}

UploadResponse UploadClient::Post(const std::string& blob_id, const std::string& checksum, const arrow::Buffer& payload) {
  if (stream_ && !ReusableConnection()) Close();

  const bool reused = stream_ != nullptr;
  if (!reused) Connect();

  try {
    return Send(blob_id, checksum, payload);
  } catch (const StaleConnection& e) {
    // The peer closed a reused connection before answering, so the
    // request was never handled. Send it once more on a new connection.
    if (!reused) throw TransportError(e.what());
  }

  Connect();
  try {
    return Send(blob_id, checksum, payload);
  } catch (const StaleConnection& e) {
    throw TransportError(e.what());
  }
}

UploadResponse UploadClient::Send(const std::string& blob_id, const std::string& checksum, const arrow::Buffer& payload) {
  http::request<http::span_body<char const>> req{http::verb::post, path_, 11};
  req.set(http::field::host, host_ + ":" + std::to_string(port_));
  req.set(http::field::user_agent, "blobstream-sender");
  req.set(http::field::content_type, "application/octet-stream");
  req.set(kChecksumHeader, checksum);
  req.set(kBlobIdHeader, blob_id);
  req.keep_alive(true);
  req.body() = http::span_body<char const>::value_type(reinterpret_cast<const char*>(payload.data()),
                                                        static_cast<std::size_t>(payload.size()));
  req.prepare_payload();

  beast::error_code ec;

  stream_->expires_after(timeout_);
  http::async_write(*stream_, req, [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  Drive();
  if (ec) {
    Close();
    if (ec == boost::asio::error::broken_pipe || ec == boost::asio::error::connection_reset)
      throw StaleConnection("sending request failed: " + ec.message());
    throw TransportError("sending request failed: " + ec.message());
  }

  http::response<http::string_body> res;
  stream_->expires_after(timeout_);
  http::async_read(*stream_, buffer_, res, [&ec](const beast::error_code& e, std::size_t) { ec = e; });
  Drive();
  if (ec) {
    Close();
    // end_of_stream means the connection closed before any response byte.
    if (ec == http::error::end_of_stream)
      throw StaleConnection("reading response failed: " + ec.message());
    throw TransportError("reading response failed: " + ec.message());
  }

  UploadResponse response;
  response.status = res.result_int();
  response.body   = std::move(res.body());

  if (!res.keep_alive()) Close();

  return response;
}

} // namespace blobstream::transport
