#include "http_session.hpp"

#include <boost/asio/dispatch.hpp>

#include <string>

#include "internal/observability/logging.hpp"

namespace blobstream::runtime {

namespace beast = boost::beast;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

using blobstream::observability::StringField;

namespace {

HttpResponse PlainResponse(http::status status, unsigned version, std::string body) {
  HttpResponse res{status, version};
  res.set(http::field::server, "blobstream-receiver");
  res.set(http::field::content_type, "text/plain");
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}

} // namespace

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<const HttpHandler> handler, const ServerOptions& options)
    : stream_(std::move(socket)), handler_(std::move(handler)), options_(options) {
}

void HttpSession::Run() {
  net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
}

void HttpSession::Drain() {
  net::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::OnDrain, shared_from_this()));
}

void HttpSession::OnDrain() {
  draining_ = true;

  // Nothing of the next request has arrived yet: treat as idle.
  if (reading_ && parser_ && !parser_->got_some()) {
    stream_.cancel();
  }
}

void HttpSession::DoRead() {
  if (draining_) return DoClose();

  parser_.emplace();
  parser_->body_limit(options_.max_body_bytes);

  stream_.expires_after(options_.idle_timeout);
  reading_ = true;
  http::async_read(stream_, buffer_, *parser_, beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
}

void HttpSession::OnRead(beast::error_code ec, std::size_t) {
  reading_ = false;

  if (ec == http::error::end_of_stream) return DoClose();

  if (ec == http::error::body_limit) {
    auto res = PlainResponse(http::status::payload_too_large, 11, "Upload exceeds the configured body limit\n");
    res.keep_alive(false);
    return DoWrite(std::move(res));
  }

  if (ec) {
    if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
      BLOBSTREAM_LOG_WARN("Failed reading request", {StringField("error", ec.message())});
    }
    return DoClose();
  }

  auto request = parser_->release();

  HttpResponse res;
  try {
    res = (*handler_)(request);
  } catch (const std::exception& e) {
    BLOBSTREAM_LOG_ERROR("Unhandled error in request handler", {StringField("error", e.what())});
    res = PlainResponse(http::status::internal_server_error, request.version(), "Internal server error\n");
    res.keep_alive(request.keep_alive());
  }

  if (draining_) res.keep_alive(false);
  DoWrite(std::move(res));
}

void HttpSession::DoWrite(HttpResponse response) {
  response_ = std::make_shared<HttpResponse>(std::move(response));

  stream_.expires_after(options_.idle_timeout);
  http::async_write(stream_, *response_,
                    beast::bind_front_handler(&HttpSession::OnWrite, shared_from_this(), response_->need_eof()));
}

void HttpSession::OnWrite(bool close, beast::error_code ec, std::size_t) {
  if (ec) {
    BLOBSTREAM_LOG_WARN("Failed writing response", {StringField("error", ec.message())});
    return DoClose();
  }

  response_.reset();

  if (close) return DoClose();

  DoRead();
}

void HttpSession::DoClose() {
  beast::error_code ignored;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
}

} // namespace blobstream::runtime
