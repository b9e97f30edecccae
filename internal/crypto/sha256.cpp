#include "sha256.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <string>

#include "internal/util/errors.hpp"

namespace edgesync::crypto {

Sha256Digest Sha256(std::string_view data) {
  Sha256Digest out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    throw util::CryptoError("EVP_Digest(EVP_sha256) failed: " + std::to_string(ERR_get_error()));
  }
  if (len != out.size()) {
    throw util::CryptoError("unexpected SHA-256 length");
  }
  return out;
}

} // namespace edgesync::crypto
