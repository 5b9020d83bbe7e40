#pragma once

#include <arrow/buffer.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

namespace blobstream::transport {

struct UploadResponse {
  unsigned    status = 0;
  std::string body;
};

/*
  Blocking HTTP/1.1 upload client over Boost.Beast.

  Each sender worker owns one client and therefore one keep-alive
  connection. Every network step runs under `timeout`; any failure
  closes the connection and throws TransportError. The next Post()
  reconnects.

  A kept-alive connection the receiver has since closed is detected
  before reuse. If the receiver closes it anyway between the check and
  the request, and no response byte arrived, the request is sent once
  more on a fresh connection. Otherwise a failed request is never
  replayed.

  Not thread-safe.
*/
class UploadClient {
 public:
  UploadClient(std::string host, uint16_t port, std::string path, std::chrono::milliseconds timeout);
  ~UploadClient();

  UploadClient(const UploadClient&)            = delete;
  UploadClient& operator=(const UploadClient&) = delete;

  // POST payload bytes with checksum and id headers.
  UploadResponse Post(const std::string& blob_id, const std::string& checksum, const arrow::Buffer& payload);

  void Close();

  bool connected() const {
    return stream_ != nullptr;
  }

 private:
  // Reused connection closed by the peer before the response started.
  class StaleConnection : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  void           Connect();
  void           Drive();
  bool           ReusableConnection();
  UploadResponse Send(const std::string& blob_id, const std::string& checksum, const arrow::Buffer& payload);

  std::string               host_;
  uint16_t                  port_;
  std::string               path_;
  std::chrono::milliseconds timeout_;

  boost::asio::io_context                  ioc_;
  boost::asio::ip::tcp::resolver           resolver_;
  std::unique_ptr<boost::beast::tcp_stream> stream_;
  boost::beast::flat_buffer                buffer_;
};

} // namespace blobstream::transport
