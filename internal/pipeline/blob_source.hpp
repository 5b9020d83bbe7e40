#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

#include "internal/model/blob_task.hpp"

namespace blobstream::runtime {
class CancellationToken;
namespace config {
class SourceConfig;
}
} // namespace blobstream::runtime

namespace blobstream::pipeline {

class WorkQueue;

struct BlobSourceOptions {
  uint64_t num_blobs = 100; // 0 = until cancelled

  uint64_t min_blob_bytes = 1024;
  uint64_t max_blob_bytes = 1024 * 1024;

  std::chrono::milliseconds min_delay{1};
  std::chrono::milliseconds max_delay{1000};

  // Fixes sizes and delays for tests. Payload bytes are always random.
  std::optional<uint64_t> seed;
};

BlobSourceOptions OptionsFromConfig(const blobstream::runtime::config::SourceConfig& config);

/*
  Produces a bounded, time-jittered sequence of random blobs.

  Sizes are uniform in [min_blob_bytes, max_blob_bytes] and the pause
  between emissions is uniform in [min_delay, max_delay]. The source
  never touches disk.
*/
class BlobSource {
 public:
  explicit BlobSource(BlobSourceOptions options);

  // One blob with the next sequence id. Throws GenerationError.
  model::BlobTask Next();

  std::chrono::milliseconds NextDelay();

  /*
    Emit into `queue` until the count is reached or `token` is cancelled,
    then Close() the queue. A cancellation interrupts the current pause.
    Returns the number of tasks handed to the queue.
  */
  uint64_t Run(WorkQueue& queue, const blobstream::runtime::CancellationToken& token);

  const BlobSourceOptions& options() const {
    return options_;
  }

 private:
  BlobSourceOptions options_;
  std::mt19937_64   rng_;
  uint64_t          next_sequence_ = 0;
};

} // namespace blobstream::pipeline
