#include "shutdown_coordinator.hpp"

#include <boost/asio/post.hpp>

#include <csignal>

#include "internal/observability/logging.hpp"

namespace blobstream::runtime {

using blobstream::observability::IntField;

ShutdownCoordinator::ShutdownCoordinator(Callback on_shutdown)
    : on_shutdown_(std::move(on_shutdown)), signals_(ioc_) {
}

ShutdownCoordinator::~ShutdownCoordinator() {
  Stop();
}

void ShutdownCoordinator::Start() {
  signals_.add(SIGINT);
  signals_.add(SIGTERM);

  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) return; // cancelled by Stop()

    triggered_ = true;
    BLOBSTREAM_LOG_INFO("Received shutdown signal", {IntField("signal", signal_number)});
    on_shutdown_(signal_number);
  });

  thread_ = std::thread([this] { ioc_.run(); });
}

void ShutdownCoordinator::Stop() {
  if (!thread_.joinable()) return;

  boost::asio::post(ioc_, [this] {
    boost::system::error_code ignored;
    signals_.cancel(ignored);
    signals_.clear(ignored);
  });
  thread_.join();
}

} // namespace blobstream::runtime
