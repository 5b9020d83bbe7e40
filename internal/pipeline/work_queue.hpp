#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/model/blob_task.hpp"

namespace blobstream::pipeline {

/*
  Thread-safe FIFO handoff between BlobSource and the sender workers.

  Multi-consumer, first-available-worker-wins. A task is handed to
  exactly one Take() call. With a non-zero capacity Put() blocks while
  the queue is full, which throttles the source when workers lag.

  Close() marks end-of-stream: tasks already queued are still handed
  out, then Take() returns std::nullopt to every caller.
*/
class WorkQueue {
 public:
  // capacity 0 = unbounded
  explicit WorkQueue(std::size_t capacity = 0);

  // Returns false if the queue was closed; the task is dropped.
  bool Put(model::BlobTask task);

  // blocking wait
  std::optional<model::BlobTask> Take();

  void Close();

  std::size_t Size() const;
  bool        Closed() const;

 private:
  bool Full() const;

  const std::size_t capacity_;

  mutable std::mutex          mutex_;
  std::condition_variable     not_empty_;
  std::condition_variable     not_full_;
  std::queue<model::BlobTask> queue_;
  bool                        closed_ = false;
};

} // namespace blobstream::pipeline
