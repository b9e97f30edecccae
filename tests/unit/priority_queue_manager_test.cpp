#include "internal/queue/priority_queue_manager.hpp"

#include <cassert>
#include <iostream>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::model::SyncRecord;
using edgesync::queue::PriorityQueueManager;
using edgesync::testing::MakeRecord;

SyncRecord Chained(std::uint8_t priority, std::uint64_t sequence) {
  auto record     = MakeRecord(priority, 1000 + sequence);
  record.sequence = sequence;
  return record;
}

// Pops in the order a draining engine would see.
std::vector<std::uint64_t> DrainOrder(PriorityQueueManager& queue) {
  std::vector<std::uint64_t> out;
  for (std::uint8_t p = 0; p < 6; ++p) {
    while (auto head = queue.Peek(p)) {
      out.push_back(head->sequence);
      queue.Remove(head->id);
    }
  }
  return out;
}

void TestStrictPriorityThenSequence() {
  PriorityQueueManager queue;
  const std::vector<std::uint8_t> priorities{5, 0, 3, 0, 1};
  for (std::uint64_t i = 0; i < priorities.size(); ++i) {
    assert(queue.Enqueue(Chained(priorities[i], i + 1)));
  }

  assert(queue.TotalLen() == 5);
  assert(queue.Len(0) == 2);

  // P0 (seq 2), P0 (seq 4), P1, P3, P5
  const std::vector<std::uint64_t> expected{2, 4, 5, 3, 1};
  assert(DrainOrder(queue) == expected);
  assert(queue.TotalLen() == 0);
}

void TestEnqueueOutOfOrderStaysSequenceOrdered() {
  PriorityQueueManager queue;
  queue.Enqueue(Chained(2, 9));
  queue.Enqueue(Chained(2, 3));
  queue.Enqueue(Chained(2, 6));
  assert(queue.Peek(2)->sequence == 3);
}

void TestDuplicateIdIgnored() {
  PriorityQueueManager queue;
  const auto record = Chained(1, 1);
  assert(queue.Enqueue(record));
  assert(!queue.Enqueue(record));
  assert(queue.Len(1) == 1);
}

void TestUnchainedRejected() {
  PriorityQueueManager queue;
  bool threw = false;
  try {
    queue.Enqueue(MakeRecord(1));
  } catch (const edgesync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestRemoveAllSkipsUnknownIds() {
  PriorityQueueManager queue;
  const auto a = Chained(4, 1);
  const auto b = Chained(4, 2);
  queue.Enqueue(a);
  queue.Enqueue(b);

  assert(queue.RemoveAll({a.id, MakeRecord(4).id}) == 1);
  assert(queue.Len(4) == 1);
  assert(queue.Peek(4)->id == b.id);
  assert(!queue.Remove(a.id));

  queue.Clear();
  assert(queue.TotalLen() == 0);
  assert(queue.Peek(4) == nullptr);
  assert(queue.Peek(9) == nullptr);
}

} // namespace

int main() {
  TestStrictPriorityThenSequence();
  TestEnqueueOutOfOrderStaysSequenceOrdered();
  TestDuplicateIdIgnored();
  TestUnchainedRejected();
  TestRemoveAllSkipsUnknownIds();

  std::cout << "edgesync_unit_priority_queue_manager: pass\n";
  return 0;
}
