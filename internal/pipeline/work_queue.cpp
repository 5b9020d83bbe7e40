#include "work_queue.hpp"

namespace blobstream::pipeline {

WorkQueue::WorkQueue(std::size_t capacity) : capacity_(capacity) {
}

bool WorkQueue::Full() const {
  return capacity_ != 0 && queue_.size() >= capacity_;
}

bool WorkQueue::Put(model::BlobTask task) {
  {
    std::unique_lock lock(mutex_);

    not_full_.wait(lock, [&] { return closed_ || !Full(); });

    if (closed_) return false;

    queue_.push(std::move(task));
  }
  not_empty_.notify_one();
  return true;
}

std::optional<model::BlobTask> WorkQueue::Take() {
  std::optional<model::BlobTask> task;
  {
    std::unique_lock lock(mutex_);

    not_empty_.wait(lock, [&] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) return std::nullopt;

    task = std::move(queue_.front());
    queue_.pop();
  }
  not_full_.notify_one();
  return task;
}

void WorkQueue::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t WorkQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

bool WorkQueue::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

} // namespace blobstream::pipeline
