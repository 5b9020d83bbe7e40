#include "blob_source.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/work_queue.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace blobstream::pipeline {

using blobstream::observability::IntField;
using blobstream::util::GenerationError;

BlobSourceOptions OptionsFromConfig(const blobstream::runtime::config::SourceConfig& config) {
  BlobSourceOptions options;
  options.num_blobs      = config.num_blobs();
  options.min_blob_bytes = config.min_blob_bytes();
  options.max_blob_bytes = config.max_blob_bytes();
  options.min_delay      = std::chrono::milliseconds(config.min_delay_ms());
  options.max_delay      = std::chrono::milliseconds(config.max_delay_ms());
  return options;
}

BlobSource::BlobSource(BlobSourceOptions options)
    : options_(std::move(options)), rng_(options_.seed ? *options_.seed : std::random_device{}()) {
}

model::BlobTask BlobSource::Next() {
  std::uniform_int_distribution<uint64_t> size_dist(options_.min_blob_bytes, options_.max_blob_bytes);
  const uint64_t                          size = size_dist(rng_);

  std::shared_ptr<arrow::Buffer> buffer;
  try {
    buffer = storage::common::AllocateMutable(static_cast<int64_t>(size));
  } catch (const std::exception& e) {
    throw GenerationError("failed to allocate " + std::to_string(size) + " byte blob: " + e.what());
  }

  uint8_t* out       = buffer->mutable_data();
  uint64_t remaining = size;
  while (remaining > 0) {
    const int chunk = static_cast<int>(std::min<uint64_t>(remaining, INT_MAX));
    if (RAND_bytes(out, chunk) != 1) {
      throw GenerationError("RAND_bytes failed");
    }
    out += chunk;
    remaining -= static_cast<uint64_t>(chunk);
  }

  model::BlobTask task;
  task.sequence_id = next_sequence_++;
  task.payload     = std::move(buffer);
  return task;
}

std::chrono::milliseconds BlobSource::NextDelay() {
  std::uniform_int_distribution<int64_t> delay_dist(options_.min_delay.count(), options_.max_delay.count());
  return std::chrono::milliseconds(delay_dist(rng_));
}

uint64_t BlobSource::Run(WorkQueue& queue, const blobstream::runtime::CancellationToken& token) {
  uint64_t emitted = 0;

  try {
    while (options_.num_blobs == 0 || emitted < options_.num_blobs) {
      if (token.IsCancelled()) break;

      auto       task        = Next();
      const auto sequence_id = task.sequence_id;
      const auto size        = task.payload->size();

      if (!queue.Put(std::move(task))) break;
      ++emitted;
      BLOBSTREAM_LOG_INFO("Generated new blob", {IntField("seq", static_cast<int64_t>(sequence_id)), IntField("bytes", size)});

      if (options_.num_blobs != 0 && emitted == options_.num_blobs) break;

      if (token.WaitFor(NextDelay())) break;
    }
  } catch (...) {
    // Let workers drain what was queued before the failure propagates.
    queue.Close();
    throw;
  }

  if (token.IsCancelled()) {
    BLOBSTREAM_LOG_INFO("Generator cancelled", {IntField("emitted", static_cast<int64_t>(emitted))});
  } else {
    BLOBSTREAM_LOG_INFO("Generator task done!", {IntField("emitted", static_cast<int64_t>(emitted))});
  }

  queue.Close();
  return emitted;
}

} // namespace blobstream::pipeline
