#include "server.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <stdexcept>
#include <thread>

#include "internal/observability/logging.hpp"

namespace blobstream::runtime {

namespace beast = boost::beast;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using blobstream::observability::IntField;
using blobstream::observability::StringField;

Server::Server(std::string bind_address, uint16_t port, HttpHandler handler, ServerOptions options)
    : bind_address_(std::move(bind_address)),
      port_(port),
      options_(options),
      handler_(std::make_shared<const HttpHandler>(std::move(handler))),
      ioc_(static_cast<int>(std::max<std::size_t>(options.io_threads, 1))),
      acceptor_(net::make_strand(ioc_)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  beast::error_code ec;

  auto address = net::ip::make_address(bind_address_, ec);
  if (ec) throw std::runtime_error("Invalid bind address " + bind_address_ + ": " + ec.message());

  tcp::endpoint endpoint{address, port_};

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);

  if (ec) {
    throw std::runtime_error("Failed to listen on " + bind_address_ + ":" + std::to_string(port_) + ": " + ec.message());
  }

  port_ = acceptor_.local_endpoint().port();
  DoAccept();

  BLOBSTREAM_LOG_INFO("Receiver listening", {StringField("address", bind_address_), IntField("port", port_)});
}

void Server::Wait() {
  std::vector<std::thread> extra;
  for (std::size_t i = 1; i < options_.io_threads; ++i) {
    extra.emplace_back([this] { ioc_.run(); });
  }
  ioc_.run();
  for (auto& t : extra) t.join();
}

void Server::Stop() {
  net::post(acceptor_.get_executor(), [this] { OnStop(); });
}

void Server::OnStop() {
  if (acceptor_.is_open()) {
    beast::error_code ignored;
    acceptor_.close(ignored);
  }

  std::vector<std::shared_ptr<HttpSession>> live;
  {
    std::lock_guard lock(sessions_mutex_);
    if (stopping_) return;
    stopping_ = true;
    for (auto& weak : sessions_) {
      if (auto session = weak.lock()) live.push_back(std::move(session));
    }
    sessions_.clear();
  }

  BLOBSTREAM_LOG_INFO("Receiver stopping", {IntField("open_connections", static_cast<int64_t>(live.size()))});
  for (auto& session : live) session->Drain();
}

void Server::DoAccept() {
  acceptor_.async_accept(net::make_strand(ioc_), beast::bind_front_handler(&Server::OnAccept, this));
}

void Server::OnAccept(beast::error_code ec, tcp::socket socket) {
  if (ec == net::error::operation_aborted) return;

  if (ec) {
    BLOBSTREAM_LOG_WARN("Accept failed", {StringField("error", ec.message())});
  } else {
    auto session = std::make_shared<HttpSession>(std::move(socket), handler_, options_);
    {
      std::lock_guard lock(sessions_mutex_);
      if (stopping_) return;
      sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(), [](const auto& w) { return w.expired(); }),
                      sessions_.end());
      sessions_.push_back(session);
    }
    session->Run();
  }

  if (acceptor_.is_open()) DoAccept();
}

} // namespace blobstream::runtime
