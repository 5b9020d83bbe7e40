#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace blobstream::runtime {

namespace http = boost::beast::http;

using HttpRequest  = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;
using HttpHandler  = std::function<HttpResponse(const HttpRequest&)>;

struct ServerOptions {
  std::size_t               io_threads     = 1;
  uint64_t                  max_body_bytes = 8 * 1024 * 1024;
  std::chrono::milliseconds idle_timeout{30000};
};

/*
  One HTTP/1.1 keep-alive connection.

  Reads a request, hands it to the handler and writes the response,
  until the peer closes, the idle timeout expires or the server drains.
  All members are touched only from the connection's strand.
*/
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket&& socket, std::shared_ptr<const HttpHandler> handler, const ServerOptions& options);

  void Run();

  /*
    Ask the connection to finish. An idle connection is closed at once;
    a request already in flight is completed and answered with
    "Connection: close".
  */
  void Drain();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void DoWrite(HttpResponse response);
  void OnWrite(bool close, boost::beast::error_code ec, std::size_t bytes_transferred);
  void OnDrain();
  void DoClose();

  boost::beast::tcp_stream                         stream_;
  boost::beast::flat_buffer                        buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::shared_ptr<HttpResponse>                    response_;
  std::shared_ptr<const HttpHandler>               handler_;
  ServerOptions                                    options_;

  bool reading_  = false;
  bool draining_ = false;
};

} // namespace blobstream::runtime
