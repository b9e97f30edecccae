#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "internal/model/sync_record.hpp"

namespace edgesync::ingest {

enum class OfferResult {
  kAccepted,
  kAcceptedDroppedOldest, // an older non-critical record made room
  kDropped,               // incoming non-critical record discarded
  kRejected,              // critical overflow beyond twice the capacity
};

/*
  Bounded handoff between producers and the ingest worker.

  Offer never blocks. When full, the oldest queued record of priority >= 2
  is dropped; if every queued record is critical, a non-critical newcomer is
  dropped instead and a critical one is admitted up to twice the capacity.
*/
class IngestQueue {
 public:
  explicit IngestQueue(std::size_t capacity);

  OfferResult Offer(model::SyncRecord record);

  // Blocks until a record is available. After Shutdown the remaining
  // records are still handed out, then nullopt.
  std::optional<model::SyncRecord> Take();

  void Shutdown();

  std::size_t   Size() const;
  std::size_t   Capacity() const {
    return capacity_;
  }
  std::uint64_t Dropped() const;

 private:
  std::size_t capacity_;

  mutable std::mutex            mutex_;
  std::condition_variable       cv_;
  std::deque<model::SyncRecord> queue_;
  std::uint64_t                 dropped_  = 0;
  bool                          shutdown_ = false;
};

} // namespace edgesync::ingest
