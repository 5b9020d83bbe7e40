#include "internal/pipeline/blob_source.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/pipeline/work_queue.hpp"
#include "internal/runtime/cancellation.hpp"

namespace {

using blobstream::pipeline::BlobSource;
using blobstream::pipeline::BlobSourceOptions;
using blobstream::pipeline::WorkQueue;
using blobstream::runtime::CancellationToken;

void TestBlobSizesStayWithinDefaultBounds() {
  BlobSourceOptions options;
  options.seed = 7;
  BlobSource source(options);

  for (int i = 0; i < 64; ++i) {
    auto task = source.Next();
    assert(task.payload);
    assert(task.payload->size() >= 1024);
    assert(task.payload->size() <= 1048576);
  }
}

void TestSequenceIdsIncrease() {
  BlobSourceOptions options;
  options.min_blob_bytes = 16;
  options.max_blob_bytes = 16;
  BlobSource source(options);

  for (uint64_t i = 0; i < 10; ++i) {
    assert(source.Next().sequence_id == i);
  }
}

void TestFixedSizeRange() {
  BlobSourceOptions options;
  options.min_blob_bytes = 2048;
  options.max_blob_bytes = 2048;
  BlobSource source(options);

  auto a = source.Next();
  auto b = source.Next();
  assert(a.payload->size() == 2048);
  assert(b.payload->size() == 2048);
  // Independent random contents.
  assert(!a.payload->Equals(*b.payload));
}

void TestDelaysStayWithinDefaultBounds() {
  BlobSourceOptions options;
  options.seed = 11;
  BlobSource source(options);

  bool saw_short = false;
  bool saw_long  = false;
  for (int i = 0; i < 10000; ++i) {
    auto delay = source.NextDelay();
    assert(delay >= std::chrono::milliseconds(1));
    assert(delay <= std::chrono::milliseconds(1000));
    saw_short |= delay < std::chrono::milliseconds(100);
    saw_long |= delay > std::chrono::milliseconds(900);
  }
  assert(saw_short && saw_long);
}

void TestRunEmitsConfiguredCountAndClosesQueue() {
  BlobSourceOptions options;
  options.num_blobs      = 5;
  options.min_blob_bytes = 1024;
  options.max_blob_bytes = 4096;
  options.min_delay      = std::chrono::milliseconds(1);
  options.max_delay      = std::chrono::milliseconds(2);
  BlobSource source(options);

  WorkQueue         queue;
  CancellationToken token;
  assert(source.Run(queue, token) == 5);
  assert(queue.Closed());

  uint64_t expected = 0;
  while (auto task = queue.Take()) {
    assert(task->sequence_id == expected++);
  }
  assert(expected == 5);
}

void TestCancellationInterruptsPause() {
  BlobSourceOptions options;
  options.num_blobs      = 0;
  options.min_blob_bytes = 1024;
  options.max_blob_bytes = 1024;
  options.min_delay      = std::chrono::milliseconds(10000);
  options.max_delay      = std::chrono::milliseconds(10000);
  BlobSource source(options);

  WorkQueue         queue;
  CancellationToken token;

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.Cancel();
  });

  const auto started = std::chrono::steady_clock::now();
  const auto emitted = source.Run(queue, token);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  assert(emitted == 1);
  assert(elapsed < std::chrono::seconds(5));
  assert(queue.Closed());
}

void TestAlreadyCancelledEmitsNothing() {
  BlobSourceOptions options;
  options.num_blobs = 3;
  BlobSource source(options);

  WorkQueue         queue;
  CancellationToken token;
  token.Cancel();

  assert(source.Run(queue, token) == 0);
  assert(!queue.Take().has_value());
}

} // namespace

int main() {
  TestBlobSizesStayWithinDefaultBounds();
  TestSequenceIdsIncrease();
  TestFixedSizeRange();
  TestDelaysStayWithinDefaultBounds();
  TestRunEmitsConfiguredCountAndClosesQueue();
  TestCancellationInterruptsPause();
  TestAlreadyCancelledEmitsNothing();

  std::cout << "blobstream_unit_blob_source: pass\n";
  return 0;
}
