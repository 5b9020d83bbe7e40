#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>

namespace blobstream::model {

/*
  A unit of work.

  Created by BlobSource, consumed exactly once by one SenderWorker.
  The payload buffer is never written through this handle.
*/
struct BlobTask {
  uint64_t sequence_id = 0;

  std::shared_ptr<const arrow::Buffer> payload;
};

} // namespace blobstream::model
