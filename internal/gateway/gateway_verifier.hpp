#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "edgesync/v1/types.pb.h"
#include "internal/chain/chain_verifier.hpp"
#include "internal/model/sync_record.hpp"

namespace edgesync::gateway {

struct Verdict {
  bool                       accepted = false;
  edgesync::v1::RejectReason reason   = edgesync::v1::REJECT_REASON_NONE;
  std::string                detail;
};

/*
  Per-node chain check on the receiving side.

  Nodes drain classes in priority order and expire old rows, so the gateway
  sees a chain with holes. Only links to stored neighbours are checked:

    bad hash or signature                -> bad-signature
    sequence already stored, same hash   -> duplicate
    sequence already stored, other hash  -> sequence-gap
    seq 1 with non-zero prev_hash        -> sequence-gap
    prev_hash != stored hash(seq - 1)    -> sequence-gap
    hash != stored prev_hash(seq + 1)    -> sequence-gap
*/
class GatewayVerifier {
 public:
  explicit GatewayVerifier(crypto::PublicKey node_key);

  // Checks and, when accepted, remembers the record's links.
  Verdict Submit(const model::SyncRecord& record);

  std::uint64_t LastStoredSequence() const;
  std::size_t   StoredCount() const {
    return links_.size();
  }

 private:
  struct Link {
    model::Hash256 hash{};
    model::Hash256 prev_hash{};
  };

  chain::ChainVerifier          verifier_;
  std::map<std::uint64_t, Link> links_;
};

} // namespace edgesync::gateway
