#pragma once

#include <string>

#include "internal/model/sync_record.hpp"

namespace edgesync::chain {

inline constexpr std::size_t kHashInputBytes = 32 + 8 + 16 + 32 + 8;

// prev_hash || sequence (BE) || id || digest || timestamp_ms (BE)
std::string HashInput(const model::SyncRecord& record);

model::Hash256 ComputeRecordHash(const model::SyncRecord& record);

} // namespace edgesync::chain
