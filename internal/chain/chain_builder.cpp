#include "chain_builder.hpp"

#include <stdexcept>

#include "internal/chain/record_hash.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/bytes.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::chain {

ChainBuilder::ChainBuilder(std::shared_ptr<store::LocalDataStore> store, std::shared_ptr<const crypto::Ed25519Signer> signer)
    : store_(std::move(store)), signer_(std::move(signer)) {
  if (!store_ || !signer_) {
    throw std::invalid_argument("ChainBuilder: store and signer are required");
  }
  public_key_ = signer_->Public();
  head_       = store_->ChainHead();

  EDGESYNC_LOG_INFO("chain head loaded", {observability::UintField("last_sequence", head_.last_sequence),
                                          observability::StringField("last_hash", util::HexEncode(head_.last_hash))});
}

model::SyncRecord ChainBuilder::ChainAppend(const model::SyncRecord& unchained) {
  if (unchained.IsChained()) {
    throw util::InvalidState("record " + util::ToString(unchained.id) + " is already chained at sequence " +
                             std::to_string(unchained.sequence));
  }

  std::lock_guard lock(mutex_);

  model::SyncRecord record = unchained;
  record.sequence          = head_.last_sequence + 1;
  record.prev_hash         = head_.last_hash;
  record.hash              = ComputeRecordHash(record);
  record.signature         = signer_->Sign(std::string_view(reinterpret_cast<const char*>(record.hash.data()), record.hash.size()));

  const model::ChainState next{record.sequence, record.hash};
  store_->Link(record, next);
  head_ = next;

  return record;
}

std::size_t ChainBuilder::ResumePending(const ChainedCallback& on_chained) {
  const auto  pending = store_->Pending();
  std::size_t chained = 0;
  for (const auto& record : pending) {
    auto linked = ChainAppend(record);
    ++chained;
    if (on_chained) on_chained(linked);
  }

  if (chained > 0) {
    EDGESYNC_LOG_WARN("re-chained records left unchained by an earlier run", {observability::UintField("count", chained)});
  }
  return chained;
}

model::ChainState ChainBuilder::Head() const {
  std::lock_guard lock(mutex_);
  return head_;
}

} // namespace edgesync::chain
