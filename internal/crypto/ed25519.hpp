#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_pkey_st EVP_PKEY;

namespace edgesync::crypto {

using PublicKey     = std::array<uint8_t, 32>;
using SignatureBytes = std::array<uint8_t, 64>;

/*
  Ed25519 signing key (OpenSSL EVP_PKEY_ED25519).

  The node key lives in a PEM file; hardware key storage is outside this
  component. Not copyable; share through std::shared_ptr.
*/
class Ed25519Signer {
 public:
  static std::unique_ptr<Ed25519Signer> Generate();
  static std::unique_ptr<Ed25519Signer> LoadPem(const std::string& path);
  static std::unique_ptr<Ed25519Signer> LoadOrCreatePem(const std::string& path);

  ~Ed25519Signer();

  Ed25519Signer(const Ed25519Signer&)            = delete;
  Ed25519Signer& operator=(const Ed25519Signer&) = delete;

  SignatureBytes Sign(std::string_view message) const;
  PublicKey      Public() const;

  void SavePem(const std::string& path) const;

 private:
  explicit Ed25519Signer(EVP_PKEY* key);

  EVP_PKEY* key_;
};

bool Ed25519Verify(const PublicKey& public_key, std::string_view message, const SignatureBytes& signature);

// Raw 32 byte public key files, as written by `edgesyncctl keygen`.
PublicKey LoadPublicKey(const std::string& path);
void      SavePublicKey(const PublicKey& key, const std::string& path);

} // namespace edgesync::crypto
