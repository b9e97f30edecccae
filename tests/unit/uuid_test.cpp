#include "internal/util/uuid.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>

namespace {

using edgesync::util::FromUnixMillis;
using edgesync::util::GenerateUUIDv7;

void TestVersionAndVariantBits() {
  const auto id = GenerateUUIDv7();
  assert((id[6] & 0xF0) == 0x70);
  assert((id[8] & 0xC0) == 0x80);
}

void TestMillisPrefixRoundTrips() {
  const uint64_t ms = 1'700'000'123'456ULL;
  const auto     id = GenerateUUIDv7(FromUnixMillis(ms));
  assert(edgesync::util::UUIDv7Millis(id) == ms);
}

void TestIdsSortByCreationTime() {
  const auto earlier = GenerateUUIDv7(FromUnixMillis(1000));
  const auto later   = GenerateUUIDv7(FromUnixMillis(2000));
  assert(earlier < later);
}

void TestStringAndBytesForms() {
  const auto id  = GenerateUUIDv7();
  const auto str = edgesync::util::ToString(id);
  assert(str.size() == 36);
  assert(str[8] == '-' && str[13] == '-' && str[18] == '-' && str[23] == '-');
  assert(edgesync::util::FromString(str) == id);
  assert(edgesync::util::FromBytes(edgesync::util::ToBytes(id)) == id);

  bool threw = false;
  try {
    (void)edgesync::util::FromBytes("short");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestIdsAreUnique() {
  std::set<edgesync::util::UUID> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(GenerateUUIDv7());
  }
  assert(ids.size() == 1000);
}

} // namespace

int main() {
  TestVersionAndVariantBits();
  TestMillisPrefixRoundTrips();
  TestIdsSortByCreationTime();
  TestStringAndBytesForms();
  TestIdsAreUnique();

  std::cout << "edgesync_unit_uuid: pass\n";
  return 0;
}
