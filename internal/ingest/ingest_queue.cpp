#include "ingest_queue.hpp"

#include <algorithm>

#include "internal/model/priority.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace edgesync::ingest {

using observability::IntField;
using observability::StringField;

IngestQueue::IngestQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

OfferResult IngestQueue::Offer(model::SyncRecord record) {
  OfferResult result = OfferResult::kAccepted;
  {
    std::lock_guard lock(mutex_);

    if (queue_.size() >= capacity_) {
      auto victim = std::find_if(queue_.begin(), queue_.end(), [](const model::SyncRecord& r) { return !model::IsCritical(r.priority); });

      if (victim != queue_.end()) {
        EDGESYNC_LOG_WARN("ingest queue full, dropped oldest non-critical record",
                          {StringField("record_id", util::ToString(victim->id)), IntField("priority", victim->priority)});
        observability::Metrics::Instance().RecordIngestDrop(victim->priority);
        queue_.erase(victim);
        ++dropped_;
        result = OfferResult::kAcceptedDroppedOldest;
      } else if (!model::IsCritical(record.priority)) {
        EDGESYNC_LOG_WARN("ingest queue full of critical records, dropped incoming record",
                          {StringField("record_id", util::ToString(record.id)), IntField("priority", record.priority)});
        observability::Metrics::Instance().RecordIngestDrop(record.priority);
        ++dropped_;
        return OfferResult::kDropped;
      } else if (queue_.size() >= 2 * capacity_) {
        EDGESYNC_LOG_ERROR("ingest queue overflow, critical record rejected",
                           {observability::AlertField("ingest_overflow"), StringField("record_id", util::ToString(record.id)),
                            IntField("priority", record.priority)});
        observability::Metrics::Instance().RecordIngestDrop(record.priority);
        ++dropped_;
        return OfferResult::kRejected;
      }
    }

    queue_.push_back(std::move(record));
  }
  cv_.notify_one();
  return result;
}

std::optional<model::SyncRecord> IngestQueue::Take() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  model::SyncRecord record = std::move(queue_.front());
  queue_.pop_front();
  return record;
}

void IngestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t IngestQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::uint64_t IngestQueue::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace edgesync::ingest
