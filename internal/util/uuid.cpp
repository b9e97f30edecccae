#include "uuid.hpp"

#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace edgesync::util {

UUID GenerateUUIDv7() {
  return GenerateUUIDv7(Now());
}

UUID GenerateUUIDv7(TimePoint at) {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  const uint64_t ms = ToUnixMillis(at);
  for (size_t i = 0; i < 6; ++i) {
    id[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));
  }

  // RFC 9562 variant + version 7
  id[6] = (id[6] & 0x0F) | 0x70;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

uint64_t UUIDv7Millis(const UUID& id) {
  uint64_t ms = 0;
  for (size_t i = 0; i < 6; ++i) {
    ms = (ms << 8) | id[i];
  }
  return ms;
}

std::string ToString(const UUID& id) {
  std::ostringstream oss;

  for (size_t i = 0; i < id.size(); ++i) {
    if (i==4||i==6||i==8||i==10) oss << "-";
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(id[i]);
  }
  return oss.str();
}

UUID FromString(const std::string& str) {
  UUID id{};
  std::string hex;

  for (char c : str)
    if (c != '-') hex += c;

  if (hex.size() != 32)
    throw std::runtime_error("Invalid UUID string");

  for (size_t i = 0; i < 16; ++i)
    id[i] = static_cast<uint8_t>(std::stoul(hex.substr(i*2,2), nullptr, 16));

  return id;
}

std::string ToBytes(const UUID& id) {
  return std::string(reinterpret_cast<const char*>(id.data()), id.size());
}

UUID FromBytes(const std::string& bytes) {
  if (bytes.size() != 16)
    throw std::runtime_error("Invalid record id size");

  UUID id{};
  std::memcpy(id.data(), bytes.data(), 16);
  return id;
}

} // namespace edgesync::util
