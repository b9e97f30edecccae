#include "bytes.hpp"

namespace edgesync::util {

std::string HexEncode(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    result.push_back(kHex[(c >> 4) & 0x0F]);
    result.push_back(kHex[c & 0x0F]);
  }
  return result;
}

} // namespace edgesync::util
