#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/model/priority.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::queue {

/*
  Six in-memory FIFO queues of chained records, one per priority class,
  each ordered by sequence. Strict priority across classes, no fairness.

  The queue is an index over the store, rebuilt from it on restart; removing
  here never deletes the stored row.
*/
class PriorityQueueManager {
 public:
  using RecordPtr = std::shared_ptr<const model::SyncRecord>;

  // Returns false if the id is already queued. Throws util::InvalidState for
  // unchained records.
  bool Enqueue(model::SyncRecord record);

  // Head of one class, or nullptr when empty.
  RecordPtr Peek(std::uint8_t priority) const;

  bool Remove(const model::RecordId& id);

  // Drops every listed id that is queued; returns how many were.
  std::size_t RemoveAll(const std::vector<model::RecordId>& ids);

  std::size_t Len(std::uint8_t priority) const;
  std::size_t TotalLen() const;

  void Clear();

 private:
  void PublishDepth(std::uint8_t priority) const;

  mutable std::mutex                                                  mutex_;
  std::array<std::map<std::uint64_t, RecordPtr>, model::kPriorityCount> classes_;
  std::map<model::RecordId, std::pair<std::uint8_t, std::uint64_t>>     index_;
};

} // namespace edgesync::queue
