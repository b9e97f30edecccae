#include "chain_verifier.hpp"

#include <string>

#include "internal/chain/record_hash.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/util/errors.hpp"

namespace edgesync::chain {

namespace {

[[noreturn]] void Violation(const std::string& what, std::uint64_t sequence) {
  throw util::ChainIntegrityViolation(what + " at sequence " + std::to_string(sequence), sequence);
}

void CheckLink(const model::SyncRecord& record, const ChainAnchor& previous) {
  if (record.sequence != previous.sequence + 1) {
    Violation("sequence gap after " + std::to_string(previous.sequence), record.sequence);
  }
  if (record.prev_hash != previous.hash) {
    Violation("prev_hash mismatch", record.sequence);
  }
}

} // namespace

ChainVerifier::ChainVerifier(crypto::PublicKey node_key) : node_key_(node_key) {
}

model::Hash256 ChainVerifier::VerifyRecord(const model::SyncRecord& record) const {
  if (!record.IsChained()) {
    Violation("record is not chained", record.sequence);
  }
  if (record.sequence == 1 && record.prev_hash != model::kZeroHash) {
    Violation("first record has non-zero prev_hash", record.sequence);
  }

  try {
    if (codec::PayloadCodec::Digest(codec::PayloadCodec::Decompress(record.payload)) != record.digest) {
      Violation("payload digest mismatch", record.sequence);
    }
  } catch (const util::CodecError& e) {
    Violation(std::string("payload does not decode: ") + e.what(), record.sequence);
  }

  const auto computed = ComputeRecordHash(record);
  if (record.hash != model::kZeroHash && record.hash != computed) {
    Violation("hash mismatch", record.sequence);
  }

  const std::string_view message(reinterpret_cast<const char*>(computed.data()), computed.size());
  if (!crypto::Ed25519Verify(node_key_, message, record.signature)) {
    Violation("bad signature", record.sequence);
  }
  return computed;
}

ChainAnchor ChainVerifier::VerifyChain(const std::vector<model::SyncRecord>& records, std::optional<ChainAnchor> anchor) const {
  std::optional<ChainAnchor> previous = anchor;
  for (const auto& record : records) {
    const auto hash = VerifyRecord(record);
    if (previous) {
      CheckLink(record, *previous);
    }
    previous = ChainAnchor{record.sequence, hash};
  }
  return previous.value_or(ChainAnchor{});
}

std::size_t ChainVerifier::VerifySegments(const std::vector<model::SyncRecord>& records) const {
  std::optional<ChainAnchor> previous;
  for (const auto& record : records) {
    const auto hash = VerifyRecord(record);
    if (previous) {
      if (record.sequence <= previous->sequence) {
        Violation("sequence out of order", record.sequence);
      }
      if (record.sequence == previous->sequence + 1) {
        CheckLink(record, *previous);
      }
    }
    previous = ChainAnchor{record.sequence, hash};
  }
  return records.size();
}

} // namespace edgesync::chain
