#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

#include "internal/crypto/ed25519.hpp"
#include "internal/model/sync_record.hpp"
#include "internal/store/local_data_store.hpp"

namespace edgesync::chain {

/*
  Integrity chain builder.

  ChainAppend is the single serialization point of the node: it assigns the
  next sequence, links to the previous hash, signs, and persists both the
  row and the new head in one store transaction. The in-memory head only
  advances after that commit.
*/
class ChainBuilder {
 public:
  using ChainedCallback = std::function<void(const model::SyncRecord&)>;

  ChainBuilder(std::shared_ptr<store::LocalDataStore> store, std::shared_ptr<const crypto::Ed25519Signer> signer);

  // Record must already be appended to the store and unchained.
  model::SyncRecord ChainAppend(const model::SyncRecord& unchained);

  // Chains every appended-but-unchained record left by a crash, in
  // creation order. Returns how many were chained.
  std::size_t ResumePending(const ChainedCallback& on_chained = {});

  model::ChainState Head() const;

  const crypto::PublicKey& NodePublicKey() const {
    return public_key_;
  }

 private:
  std::shared_ptr<store::LocalDataStore>       store_;
  std::shared_ptr<const crypto::Ed25519Signer> signer_;
  crypto::PublicKey                            public_key_;

  mutable std::mutex mutex_;
  model::ChainState  head_;
};

} // namespace edgesync::chain
