#include "gateway_verifier.hpp"

#include "internal/util/errors.hpp"

namespace edgesync::gateway {

namespace {

Verdict Reject(edgesync::v1::RejectReason reason, std::string detail) {
  return Verdict{false, reason, std::move(detail)};
}

} // namespace

GatewayVerifier::GatewayVerifier(crypto::PublicKey node_key) : verifier_(node_key) {
}

Verdict GatewayVerifier::Submit(const model::SyncRecord& record) {
  const auto seq = record.sequence;
  if (seq == 0) {
    return Reject(edgesync::v1::REJECT_REASON_MALFORMED, "record is not chained");
  }
  if (seq == 1 && record.prev_hash != model::kZeroHash) {
    return Reject(edgesync::v1::REJECT_REASON_SEQUENCE_GAP, "sequence 1 must have a zero prev_hash");
  }

  model::Hash256 hash;
  try {
    hash = verifier_.VerifyRecord(record);
  } catch (const util::ChainIntegrityViolation& e) {
    return Reject(edgesync::v1::REJECT_REASON_BAD_SIGNATURE, e.what());
  }

  if (auto it = links_.find(seq); it != links_.end()) {
    if (it->second.hash == hash) {
      return Reject(edgesync::v1::REJECT_REASON_DUPLICATE, "sequence " + std::to_string(seq) + " already stored");
    }
    return Reject(edgesync::v1::REJECT_REASON_SEQUENCE_GAP, "conflicting record for stored sequence " + std::to_string(seq));
  }

  if (auto prev = links_.find(seq - 1); prev != links_.end() && prev->second.hash != record.prev_hash) {
    return Reject(edgesync::v1::REJECT_REASON_SEQUENCE_GAP, "prev_hash does not match stored sequence " + std::to_string(seq - 1));
  }
  if (auto next = links_.find(seq + 1); next != links_.end() && next->second.prev_hash != hash) {
    return Reject(edgesync::v1::REJECT_REASON_SEQUENCE_GAP, "hash does not match prev_hash of stored sequence " + std::to_string(seq + 1));
  }

  links_.emplace(seq, Link{hash, record.prev_hash});
  return Verdict{true, edgesync::v1::REJECT_REASON_NONE, {}};
}

std::uint64_t GatewayVerifier::LastStoredSequence() const {
  return links_.empty() ? 0 : links_.rbegin()->first;
}

} // namespace edgesync::gateway
