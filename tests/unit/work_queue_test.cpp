#include "internal/pipeline/work_queue.hpp"

#include <cassert>
#include <chrono>
#include <atomic>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

using blobstream::model::BlobTask;
using blobstream::pipeline::WorkQueue;

BlobTask MakeTask(uint64_t sequence_id) {
  BlobTask task;
  task.sequence_id = sequence_id;
  return task;
}

void TestTakeIsFifo() {
  WorkQueue queue;
  for (uint64_t i = 0; i < 5; ++i) assert(queue.Put(MakeTask(i)));

  for (uint64_t i = 0; i < 5; ++i) {
    auto task = queue.Take();
    assert(task.has_value());
    assert(task->sequence_id == i);
  }
  assert(queue.Size() == 0);
}

void TestCloseDrainsQueuedTasksThenEndsStream() {
  WorkQueue queue;
  assert(queue.Put(MakeTask(1)));
  assert(queue.Put(MakeTask(2)));
  queue.Close();

  assert(!queue.Put(MakeTask(3)));

  assert(queue.Take()->sequence_id == 1);
  assert(queue.Take()->sequence_id == 2);
  assert(!queue.Take().has_value());
  assert(!queue.Take().has_value());
}

void TestCloseWakesBlockedConsumers() {
  WorkQueue                queue;
  std::vector<std::thread> consumers;
  std::atomic<int>         ended{0};

  for (int i = 0; i < 4; ++i) {
    consumers.emplace_back([&] {
      if (!queue.Take().has_value()) ++ended;
    });
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.Close();
  for (auto& t : consumers) t.join();

  assert(ended == 4);
}

void TestEachTaskDeliveredToExactlyOneConsumer() {
  constexpr uint64_t kTasks     = 2000;
  constexpr int      kConsumers = 8;

  WorkQueue             queue(16);
  std::mutex            seen_mutex;
  std::multiset<uint64_t> seen;

  std::vector<std::thread> consumers;
  for (int i = 0; i < kConsumers; ++i) {
    consumers.emplace_back([&] {
      while (auto task = queue.Take()) {
        std::lock_guard<std::mutex> lock(seen_mutex);
        seen.insert(task->sequence_id);
      }
    });
  }

  for (uint64_t i = 0; i < kTasks; ++i) assert(queue.Put(MakeTask(i)));
  queue.Close();
  for (auto& t : consumers) t.join();

  assert(seen.size() == kTasks);
  for (uint64_t i = 0; i < kTasks; ++i) assert(seen.count(i) == 1);
}

void TestBoundedPutBlocksUntilSpaceFrees() {
  WorkQueue queue(1);
  assert(queue.Put(MakeTask(0)));

  std::atomic<bool> second_put_done{false};
  std::thread       producer([&] {
    assert(queue.Put(MakeTask(1)));
    second_put_done = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!second_put_done);
  assert(queue.Size() == 1);

  assert(queue.Take()->sequence_id == 0);
  producer.join();
  assert(second_put_done);
  assert(queue.Take()->sequence_id == 1);
}

void TestCloseReleasesBlockedProducer() {
  WorkQueue queue(1);
  assert(queue.Put(MakeTask(0)));

  std::atomic<bool> put_result{true};
  std::thread       producer([&] { put_result = queue.Put(MakeTask(1)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  queue.Close();
  producer.join();

  assert(!put_result);
  assert(queue.Take()->sequence_id == 0);
  assert(!queue.Take().has_value());
}

} // namespace

int main() {
  TestTakeIsFifo();
  TestCloseDrainsQueuedTasksThenEndsStream();
  TestCloseWakesBlockedConsumers();
  TestEachTaskDeliveredToExactlyOneConsumer();
  TestBoundedPutBlocksUntilSpaceFrees();
  TestCloseReleasesBlockedProducer();

  std::cout << "blobstream_unit_work_queue: pass\n";
  return 0;
}
