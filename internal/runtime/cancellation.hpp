#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blobstream::runtime {

/*
  Cooperative cancellation flag.

  Tasks check it at their own suspension points; WaitFor() is an
  interruptible sleep that wakes as soon as Cancel() is called.
*/
class CancellationToken {
 public:
  void Cancel();

  bool IsCancelled() const;

  // Sleep up to `timeout`. Returns true if cancelled before or during the wait.
  bool WaitFor(std::chrono::milliseconds timeout) const;

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
};

} // namespace blobstream::runtime
