#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/crypto/ed25519.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::chain {

struct ChainAnchor {
  std::uint64_t  sequence = 0;
  model::Hash256 hash{};
};

/*
  Recomputes hashes, checks links and verifies Ed25519 signatures against
  one node key. Every failure throws util::ChainIntegrityViolation carrying
  the offending sequence.
*/
class ChainVerifier {
 public:
  explicit ChainVerifier(crypto::PublicKey node_key);

  // Payload digest, hash and signature of a single record. A non-zero
  // record.hash must match the recomputed value. Returns the recomputed hash.
  model::Hash256 VerifyRecord(const model::SyncRecord& record) const;

  // Contiguous run in ascending sequence. With an anchor the first record
  // must link to it; without one a run starting at sequence 1 must have a
  // zero prev_hash. Returns the anchor of the last record.
  ChainAnchor VerifyChain(const std::vector<model::SyncRecord>& records, std::optional<ChainAnchor> anchor = std::nullopt) const;

  // Ascending records that may have holes (acked or expired rows). Links
  // are only checked between adjacent sequences. Returns records checked.
  std::size_t VerifySegments(const std::vector<model::SyncRecord>& records) const;

 private:
  crypto::PublicKey node_key_;
};

} // namespace edgesync::chain
