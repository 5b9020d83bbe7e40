#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <functional>
#include <thread>

namespace blobstream::runtime {

/*
  Turns SIGINT / SIGTERM into a single shutdown callback.

  The signal set runs on a private io_context thread. The callback is
  invoked at most once, from that thread, and must only request
  shutdown (cancel a token, stop a server); the owner does the waiting.
*/
class ShutdownCoordinator {
 public:
  using Callback = std::function<void(int signal_number)>;

  explicit ShutdownCoordinator(Callback on_shutdown);
  ~ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&)            = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  // Install the handlers. Signals arriving before Start() use the default action.
  void Start();

  // Remove the handlers and join the signal thread.
  void Stop();

  bool triggered() const {
    return triggered_;
  }

 private:
  Callback on_shutdown_;

  boost::asio::io_context ioc_;
  boost::asio::signal_set signals_;
  std::thread             thread_;
  std::atomic<bool>       triggered_{false};
};

} // namespace blobstream::runtime
