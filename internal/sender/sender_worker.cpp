#include "sender_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/pipeline/work_queue.hpp"
#include "internal/sender/checksummed_payload.hpp"
#include "internal/storage/blob_store.hpp"
#include "internal/transport/upload_client.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace blobstream::sender {

using blobstream::model::TransferOutcome;
using blobstream::model::TransferStatus;
using blobstream::observability::BoolField;
using blobstream::observability::IntField;
using blobstream::observability::StringField;

SenderWorker::SenderWorker(std::string name, std::shared_ptr<pipeline::WorkQueue> queue,
                           std::shared_ptr<const storage::BlobStore> store, std::unique_ptr<transport::UploadClient> client,
                           CorruptionPolicy corruption, OutcomeSink sink)
    : name_(std::move(name)),
      queue_(std::move(queue)),
      store_(std::move(store)),
      client_(std::move(client)),
      corruption_(corruption),
      sink_(std::move(sink)) {}

SenderWorker::~SenderWorker() {
  Join();
}

void SenderWorker::Start() {
  thread_ = std::thread(&SenderWorker::Run, this);
}

void SenderWorker::Join() {
  if (thread_.joinable())
    thread_.join();
}

void SenderWorker::Run() {
  while (true) {
    auto task = queue_->Take();
    if (!task)
      break;

    auto outcome = Process(*task);
    if (sink_) sink_(outcome);
  }

  BLOBSTREAM_LOG_INFO(name_ + " done!");
}

bool SenderWorker::ShouldCorrupt() {
  if (!corruption_.enabled || corruption_.rate <= 0.0) return false;
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng_) < corruption_.rate;
}

TransferOutcome SenderWorker::Process(const model::BlobTask& task) {
  TransferOutcome outcome;
  outcome.sequence_id = task.sequence_id;
  outcome.blob_id     = util::ToString(util::GenerateUUID());
  outcome.size_bytes  = static_cast<uint64_t>(task.payload->size());

  const auto seq   = IntField("seq", static_cast<int64_t>(task.sequence_id));
  const auto id    = StringField("id", outcome.blob_id);
  const auto bytes = IntField("bytes", task.payload->size());

  try {
    auto path = store_->Write(outcome.blob_id, *task.payload);
    BLOBSTREAM_LOG_INFO(name_ + " wrote binary file", {seq, id, StringField("path", path.string())});

    auto transfer     = PrepareTransfer(task.payload, ShouldCorrupt());
    outcome.corrupted = transfer.corrupted;
    if (transfer.corrupted) {
      BLOBSTREAM_LOG_INFO(name_ + " intentionally corrupting blob", {seq, id});
    }

    auto response       = client_->Post(outcome.blob_id, transfer.declared_checksum, *transfer.payload_bytes);
    outcome.http_status = response.status;
    outcome.message     = std::move(response.body);
  } catch (const util::StorageError& e) {
    outcome.status  = TransferStatus::kFailed;
    outcome.message = e.what();
    BLOBSTREAM_LOG_ERROR(name_ + " could not persist blob", {seq, id, bytes, StringField("error", e.what())});
    return outcome;
  } catch (const util::TransportError& e) {
    outcome.status  = TransferStatus::kFailed;
    outcome.message = e.what();
    BLOBSTREAM_LOG_ERROR(name_ + " transport failure sending blob", {seq, id, bytes, StringField("error", e.what())});
    return outcome;
  } catch (const std::exception& e) {
    outcome.status  = TransferStatus::kFailed;
    outcome.message = e.what();
    BLOBSTREAM_LOG_ERROR(name_ + " unexpected failure sending blob", {seq, id, bytes, StringField("error", e.what())});
    return outcome;
  }

  const auto status = IntField("status", outcome.http_status);
  if (outcome.http_status == 200) {
    outcome.status = TransferStatus::kAccepted;
    BLOBSTREAM_LOG_INFO(name_ + " successfully sent blob", {seq, id, bytes, status, StringField("response", outcome.message)});
  } else if (outcome.http_status == 400) {
    outcome.status = TransferStatus::kRejected;
    BLOBSTREAM_LOG_WARN(name_ + " blob rejected by receiver",
                        {seq, id, bytes, status, BoolField("corrupted", outcome.corrupted), StringField("response", outcome.message)});
  } else {
    outcome.status = TransferStatus::kFailed;
    BLOBSTREAM_LOG_ERROR(name_ + " encountered unexpected status sending blob", {seq, id, bytes, status, StringField("response", outcome.message)});
  }

  return outcome;
}

} // namespace blobstream::sender
