#pragma once

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <thread>

#include "internal/model/blob_task.hpp"
#include "internal/model/transfer_outcome.hpp"

namespace blobstream::pipeline {
class WorkQueue;
}
namespace blobstream::storage {
class BlobStore;
}
namespace blobstream::transport {
class UploadClient;
}

namespace blobstream::sender {

struct CorruptionPolicy {
  bool   enabled = false;
  double rate    = 0.0;
};

/*
  Pulls blobs from the work queue and uploads them, one at a time.

  Per task:
      persist sender-<uuid>.bin → digest → maybe corrupt → POST

  Failures are contained to the task: they are logged, reported as a
  failed outcome and the worker moves on. Nothing is retried. The
  worker exits once the queue reports end-of-stream.
*/
class SenderWorker {
 public:
  using OutcomeSink = std::function<void(const model::TransferOutcome&)>;

  SenderWorker(std::string name, std::shared_ptr<pipeline::WorkQueue> queue, std::shared_ptr<const storage::BlobStore> store,
               std::unique_ptr<transport::UploadClient> client, CorruptionPolicy corruption, OutcomeSink sink);
  ~SenderWorker();

  SenderWorker(const SenderWorker&)            = delete;
  SenderWorker& operator=(const SenderWorker&) = delete;

  void Start();

  // Wait for the worker to drain the queue and exit.
  void Join();

  // Handle one task on the calling thread.
  model::TransferOutcome Process(const model::BlobTask& task);

  const std::string& name() const {
    return name_;
  }

 private:
  void Run();
  bool ShouldCorrupt();

  std::string                               name_;
  std::shared_ptr<pipeline::WorkQueue>      queue_;
  std::shared_ptr<const storage::BlobStore> store_;
  std::unique_ptr<transport::UploadClient>  client_;
  CorruptionPolicy                          corruption_;
  OutcomeSink                               sink_;

  std::mt19937_64 rng_{std::random_device{}()};
  std::thread     thread_;
};

} // namespace blobstream::sender
