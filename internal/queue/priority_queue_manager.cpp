#include "priority_queue_manager.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::queue {

bool PriorityQueueManager::Enqueue(model::SyncRecord record) {
  if (!record.IsChained()) {
    throw util::InvalidState("cannot queue unchained record " + util::ToString(record.id));
  }
  if (!model::IsValidPriority(record.priority)) {
    throw std::invalid_argument("priority out of range: " + std::to_string(record.priority));
  }

  std::lock_guard lock(mutex_);
  if (index_.contains(record.id)) {
    return false;
  }

  const auto priority = record.priority;
  const auto sequence = record.sequence;
  index_.emplace(record.id, std::make_pair(priority, sequence));
  classes_[priority].emplace(sequence, std::make_shared<const model::SyncRecord>(std::move(record)));
  PublishDepth(priority);
  return true;
}

PriorityQueueManager::RecordPtr PriorityQueueManager::Peek(std::uint8_t priority) const {
  if (!model::IsValidPriority(priority)) return nullptr;

  std::lock_guard lock(mutex_);
  const auto&     cls = classes_[priority];
  if (cls.empty()) return nullptr;
  return cls.begin()->second;
}

bool PriorityQueueManager::Remove(const model::RecordId& id) {
  std::lock_guard lock(mutex_);
  auto            it = index_.find(id);
  if (it == index_.end()) return false;

  const auto [priority, sequence] = it->second;
  classes_[priority].erase(sequence);
  index_.erase(it);
  PublishDepth(priority);
  return true;
}

std::size_t PriorityQueueManager::RemoveAll(const std::vector<model::RecordId>& ids) {
  std::size_t removed = 0;
  for (const auto& id : ids) {
    if (Remove(id)) ++removed;
  }
  return removed;
}

std::size_t PriorityQueueManager::Len(std::uint8_t priority) const {
  if (!model::IsValidPriority(priority)) return 0;

  std::lock_guard lock(mutex_);
  return classes_[priority].size();
}

std::size_t PriorityQueueManager::TotalLen() const {
  std::lock_guard lock(mutex_);
  return index_.size();
}

void PriorityQueueManager::Clear() {
  std::lock_guard lock(mutex_);
  for (std::uint8_t p = 0; p < model::kPriorityCount; ++p) {
    classes_[p].clear();
    PublishDepth(p);
  }
  index_.clear();
}

void PriorityQueueManager::PublishDepth(std::uint8_t priority) const {
  observability::Metrics::Instance().SetQueueDepth(priority, classes_[priority].size());
}

} // namespace edgesync::queue
