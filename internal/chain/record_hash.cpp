#include "record_hash.hpp"

#include "internal/crypto/sha256.hpp"
#include "internal/util/bytes.hpp"

namespace edgesync::chain {

std::string HashInput(const model::SyncRecord& record) {
  std::string input;
  input.reserve(kHashInputBytes);
  util::AppendArray(input, record.prev_hash);
  util::AppendU64BE(input, record.sequence);
  util::AppendArray(input, record.id);
  util::AppendArray(input, record.digest);
  util::AppendU64BE(input, record.timestamp_ms);
  return input;
}

model::Hash256 ComputeRecordHash(const model::SyncRecord& record) {
  return crypto::Sha256(HashInput(record));
}

} // namespace edgesync::chain
