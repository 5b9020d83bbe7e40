#include "sender_pipeline.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/blob_source.hpp"
#include "internal/pipeline/work_queue.hpp"
#include "internal/runtime/cancellation.hpp"
#include "internal/sender/sender_worker.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/transport/upload_client.hpp"

namespace blobstream::sender {

using blobstream::model::TransferOutcome;
using blobstream::model::TransferStatus;
using blobstream::observability::BoolField;
using blobstream::observability::IntField;
using blobstream::observability::StringField;

SenderPipeline::SenderPipeline(blobstream::runtime::config::SenderConfig config, OutcomeObserver observer)
    : config_(std::move(config)), observer_(std::move(observer)) {
}

PipelineSummary SenderPipeline::Run(const blobstream::runtime::CancellationToken& token) {
  auto store = std::make_shared<const storage::BlobStore>(config_.binfile_dir(), "sender");
  auto queue = std::make_shared<pipeline::WorkQueue>(static_cast<std::size_t>(config_.queue_capacity()));

  CorruptionPolicy corruption;
  corruption.enabled = config_.corruption().enabled();
  corruption.rate    = config::ResolveCorruptionRate(config_);

  PipelineSummary summary;
  std::mutex      summary_mutex;

  auto sink = [&](const TransferOutcome& outcome) {
    {
      std::lock_guard lock(summary_mutex);
      switch (outcome.status) {
        case TransferStatus::kAccepted:
          ++summary.accepted;
          break;
        case TransferStatus::kRejected:
          ++summary.rejected;
          break;
        case TransferStatus::kFailed:
          ++summary.failed;
          break;
      }
      if (outcome.corrupted) ++summary.corrupted;
    }
    if (observer_) observer_(outcome);
  };

  BLOBSTREAM_LOG_INFO("Starting sender",
                      {StringField("url", config::TargetUrl(config_)), IntField("workers", config_.num_workers()),
                       IntField("blobs", static_cast<int64_t>(config_.source().num_blobs())),
                       StringField("dir", config_.binfile_dir()), BoolField("inject_bad_checksums", corruption.enabled)});

  const auto timeout = std::chrono::milliseconds(config_.request_timeout_ms());

  std::vector<std::unique_ptr<SenderWorker>> workers;
  workers.reserve(config_.num_workers());
  for (uint32_t i = 0; i < config_.num_workers(); ++i) {
    auto client = std::make_unique<transport::UploadClient>(config_.target().address(), static_cast<uint16_t>(config_.target().port()),
                                                            config_.target().path(), timeout);
    workers.push_back(std::make_unique<SenderWorker>("W" + std::to_string(i), queue, store, std::move(client), corruption, sink));
  }
  for (auto& worker : workers) worker->Start();

  auto options = pipeline::OptionsFromConfig(config_.source());
  options.seed = seed_;
  pipeline::BlobSource source(options);

  std::exception_ptr failure;
  try {
    summary.generated = source.Run(*queue, token);
  } catch (const std::exception& e) {
    BLOBSTREAM_LOG_ERROR("Blob generation failed", {StringField("error", e.what())});
    failure = std::current_exception();
  }

  // The source closed the queue; workers exit once it is drained.
  for (auto& worker : workers) worker->Join();

  if (failure) std::rethrow_exception(failure);

  BLOBSTREAM_LOG_INFO("Done!", {IntField("generated", static_cast<int64_t>(summary.generated)),
                                IntField("accepted", static_cast<int64_t>(summary.accepted)),
                                IntField("rejected", static_cast<int64_t>(summary.rejected)),
                                IntField("failed", static_cast<int64_t>(summary.failed))});
  return summary;
}

} // namespace blobstream::sender
