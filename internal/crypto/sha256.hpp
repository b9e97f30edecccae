#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace edgesync::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

// Throws util::CryptoError if OpenSSL fails.
Sha256Digest Sha256(std::string_view data);

} // namespace edgesync::crypto
