#pragma once

#include <cstdint>
#include <functional>
#include <optional>

#include "config/config.pb.h"
#include "internal/model/transfer_outcome.hpp"

namespace blobstream::runtime {
class CancellationToken;
}

namespace blobstream::sender {

struct PipelineSummary {
  uint64_t generated = 0;
  uint64_t accepted  = 0;
  uint64_t rejected  = 0;
  uint64_t failed    = 0;
  uint64_t corrupted = 0;

  uint64_t completed() const {
    return accepted + rejected + failed;
  }
};

/*
  Composition root of the sending process.

      BlobSource → WorkQueue → {SenderWorker x N} → receiver

  Run() blocks until the source is exhausted or `token` is cancelled,
  every queued blob has produced an outcome and all workers have
  exited. Cancellation stops generation only; queued work still drains.
*/
class SenderPipeline {
 public:
  using OutcomeObserver = std::function<void(const model::TransferOutcome&)>;

  explicit SenderPipeline(blobstream::runtime::config::SenderConfig config, OutcomeObserver observer = {});

  // Fixes blob sizes and delays; used by tests.
  void SetSeed(uint64_t seed) {
    seed_ = seed;
  }

  // Throws StorageError if the target directory is unusable and
  // GenerationError if blob generation fails.
  PipelineSummary Run(const blobstream::runtime::CancellationToken& token);

 private:
  blobstream::runtime::config::SenderConfig config_;
  OutcomeObserver                           observer_;
  std::optional<uint64_t>                   seed_;
};

} // namespace blobstream::sender
