#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/runtime/http_session.hpp"

namespace blobstream::runtime {

/*
  HTTP listener on an Asio io_context.

  Start() binds and begins accepting. Wait() runs the event loop on
  `io_threads` threads and returns once the server has stopped and every
  connection has finished. Stop() may be called from any thread: it
  closes the listener and drains open connections, letting requests
  already in flight complete.
*/
class Server {
public:
  Server(std::string bind_address, uint16_t port, HttpHandler handler, ServerOptions options = {});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error if the address cannot be bound.
  void Start();
  void Wait();
  void Stop();

  // Bound port; meaningful after Start() (resolves port 0).
  uint16_t port() const {
    return port_;
  }

private:
  void DoAccept();
  void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
  void OnStop();

  std::string bind_address_;
  uint16_t port_;
  ServerOptions options_;
  std::shared_ptr<const HttpHandler> handler_;

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;

  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<HttpSession>> sessions_;
  bool stopping_ = false;
};

} // namespace blobstream::runtime
