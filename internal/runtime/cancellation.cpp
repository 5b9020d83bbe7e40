#include "cancellation.hpp"

namespace blobstream::runtime {

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(mutex_);
  return cancelled_;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return cv_.wait_for(lock, timeout, [&] { return cancelled_; });
}

} // namespace blobstream::runtime
