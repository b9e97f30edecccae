#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "internal/chain/chain_builder.hpp"
#include "internal/chain/chain_verifier.hpp"
#include "internal/chain/record_hash.hpp"
#include "internal/crypto/ed25519.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_records.hpp"

namespace {

using edgesync::chain::ChainAnchor;
using edgesync::chain::ChainBuilder;
using edgesync::chain::ChainVerifier;
using edgesync::model::SyncRecord;
using edgesync::testing::AppendChained;
using edgesync::testing::MakeMemoryStore;
using edgesync::testing::MakeRecord;
using edgesync::util::ChainIntegrityViolation;

struct Fixture {
  std::shared_ptr<edgesync::store::LocalDataStore>   store  = MakeMemoryStore();
  std::shared_ptr<const edgesync::crypto::Ed25519Signer> signer = edgesync::crypto::Ed25519Signer::Generate();
  ChainBuilder                                       chain{store, signer};

  std::vector<SyncRecord> AppendMany(int n) {
    std::vector<SyncRecord> out;
    for (int i = 0; i < n; ++i) {
      out.push_back(AppendChained(*store, chain, MakeRecord(static_cast<uint8_t>(i % 6), 1000 + i, "r" + std::to_string(i))));
    }
    return out;
  }
};

std::uint64_t ViolationSequence(const ChainVerifier& verifier, const std::vector<SyncRecord>& records) {
  try {
    verifier.VerifyChain(records);
  } catch (const ChainIntegrityViolation& e) {
    return e.Sequence();
  }
  return 0;
}

void TestSequencesAreContiguousAndLinked() {
  Fixture f;
  const auto records = f.AppendMany(5);

  assert(records.front().sequence == 1);
  assert(records.front().prev_hash == edgesync::model::kZeroHash);
  for (size_t i = 1; i < records.size(); ++i) {
    assert(records[i].sequence == records[i - 1].sequence + 1);
    assert(records[i].prev_hash == records[i - 1].hash);
  }

  const auto head = f.chain.Head();
  assert(head.last_sequence == 5);
  assert(head.last_hash == records.back().hash);
  assert(f.store->ChainHead().last_hash == head.last_hash);

  ChainVerifier verifier(f.chain.NodePublicKey());
  const auto    anchor = verifier.VerifyChain(f.store->IterChained());
  assert(anchor.sequence == 5);
  assert(anchor.hash == head.last_hash);
}

void TestHashCoversProducerFields() {
  Fixture f;
  const auto record = f.AppendMany(1).front();
  assert(edgesync::chain::HashInput(record).size() == edgesync::chain::kHashInputBytes);
  assert(edgesync::chain::ComputeRecordHash(record) == record.hash);

  auto changed         = record;
  changed.timestamp_ms = record.timestamp_ms + 1;
  assert(edgesync::chain::ComputeRecordHash(changed) != record.hash);
}

void TestPayloadMutationFailsVerification() {
  Fixture f;
  auto records = f.AppendMany(3);
  ChainVerifier verifier(f.chain.NodePublicKey());

  auto tampered = records;
  tampered[1].payload.back() ^= 0x01;
  assert(ViolationSequence(verifier, tampered) == 2);
}

void TestHashAndSignatureTamperingDetected() {
  Fixture f;
  auto records = f.AppendMany(3);
  ChainVerifier verifier(f.chain.NodePublicKey());

  auto bad_hash     = records;
  bad_hash[2].hash[0] ^= 0xFF;
  assert(ViolationSequence(verifier, bad_hash) == 3);

  auto bad_signature          = records;
  bad_signature[0].signature[5] ^= 0x01;
  assert(ViolationSequence(verifier, bad_signature) == 1);

  auto bad_digest      = records;
  bad_digest[1].digest[0] ^= 0x01;
  assert(ViolationSequence(verifier, bad_digest) == 2);

  // a different key rejects everything
  auto other = edgesync::crypto::Ed25519Signer::Generate();
  assert(ViolationSequence(ChainVerifier(other->Public()), records) == 1);
}

void TestGapsAndReorderDetected() {
  Fixture f;
  auto records = f.AppendMany(4);
  ChainVerifier verifier(f.chain.NodePublicKey());

  std::vector<SyncRecord> gap{records[0], records[2]};
  assert(ViolationSequence(verifier, gap) == 3);

  std::vector<SyncRecord> tail{records[2], records[3]};
  const auto anchor = verifier.VerifyChain(tail, ChainAnchor{records[1].sequence, records[1].hash});
  assert(anchor.sequence == 4);

  bool threw = false;
  try {
    verifier.VerifyChain(tail, ChainAnchor{records[0].sequence, records[0].hash});
  } catch (const ChainIntegrityViolation&) {
    threw = true;
  }
  assert(threw);
}

void TestSegmentsTolerateHoles() {
  Fixture f;
  auto records = f.AppendMany(6);
  ChainVerifier verifier(f.chain.NodePublicKey());

  std::vector<SyncRecord> holes{records[0], records[1], records[4], records[5]};
  assert(verifier.VerifySegments(holes) == 4);

  holes[3].prev_hash[0] ^= 0x01;
  bool threw = false;
  try {
    verifier.VerifySegments(holes);
  } catch (const ChainIntegrityViolation& e) {
    threw = e.Sequence() == 6;
  }
  assert(threw);
}

void TestChainingTwiceIsRejected() {
  Fixture f;
  const auto chained = f.AppendMany(1).front();

  bool threw = false;
  try {
    f.chain.ChainAppend(chained);
  } catch (const edgesync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(f.chain.Head().last_sequence == 1);
}

void TestResumePendingChainsLeftoverRecords() {
  auto store  = MakeMemoryStore();
  auto signer = std::shared_ptr<const edgesync::crypto::Ed25519Signer>(edgesync::crypto::Ed25519Signer::Generate());

  {
    ChainBuilder chain(store, signer);
    AppendChained(*store, chain, MakeRecord(1, 1000, "first"));
  }

  // appended but never linked, as after a crash between the two steps
  const auto a = MakeRecord(0, 2000, "a");
  const auto b = MakeRecord(4, 3000, "b");
  store->Append(a);
  store->Append(b);
  assert(store->Pending().size() == 2);

  ChainBuilder            resumed(store, signer);
  std::vector<SyncRecord> seen;
  assert(resumed.ResumePending([&](const SyncRecord& r) { seen.push_back(r); }) == 2);

  assert(seen.size() == 2);
  assert(seen[0].id == a.id && seen[0].sequence == 2);
  assert(seen[1].id == b.id && seen[1].sequence == 3);
  assert(store->Pending().empty());

  ChainVerifier verifier(signer->Public());
  assert(verifier.VerifyChain(store->IterChained()).sequence == 3);
}

} // namespace

int main() {
  TestSequencesAreContiguousAndLinked();
  TestHashCoversProducerFields();
  TestPayloadMutationFailsVerification();
  TestHashAndSignatureTamperingDetected();
  TestGapsAndReorderDetected();
  TestSegmentsTolerateHoles();
  TestChainingTwiceIsRejected();
  TestResumePendingChainsLeftoverRecords();

  std::cout << "edgesync_unit_chain: pass\n";
  return 0;
}
