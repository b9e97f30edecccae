#include "ed25519.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "internal/util/errors.hpp"

namespace edgesync::crypto {

namespace {

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const {
    EVP_PKEY_CTX_free(ctx);
  }
};

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

struct PkeyDeleter {
  void operator()(EVP_PKEY* key) const {
    EVP_PKEY_free(key);
  }
};

struct FileCloser {
  void operator()(std::FILE* f) const {
    if (f) std::fclose(f);
  }
};

std::string OpenSSLError(const char* what) {
  char buf[256] = {0};
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

} // namespace

Ed25519Signer::Ed25519Signer(EVP_PKEY* key) : key_(key) {
}

Ed25519Signer::~Ed25519Signer() {
  EVP_PKEY_free(key_);
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::Generate() {
  std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
  if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
    throw util::CryptoError(OpenSSLError("EVP_PKEY_keygen_init"));
  }

  EVP_PKEY* key = nullptr;
  if (EVP_PKEY_keygen(ctx.get(), &key) != 1) {
    throw util::CryptoError(OpenSSLError("EVP_PKEY_keygen"));
  }
  return std::unique_ptr<Ed25519Signer>(new Ed25519Signer(key));
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::LoadPem(const std::string& path) {
  std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
  if (!file) {
    throw util::CryptoError("cannot open private key: " + path);
  }

  EVP_PKEY* key = PEM_read_PrivateKey(file.get(), nullptr, nullptr, nullptr);
  if (!key) {
    throw util::CryptoError(OpenSSLError("PEM_read_PrivateKey"));
  }
  if (EVP_PKEY_id(key) != EVP_PKEY_ED25519) {
    EVP_PKEY_free(key);
    throw util::CryptoError("private key is not Ed25519: " + path);
  }
  return std::unique_ptr<Ed25519Signer>(new Ed25519Signer(key));
}

std::unique_ptr<Ed25519Signer> Ed25519Signer::LoadOrCreatePem(const std::string& path) {
  if (std::filesystem::exists(path)) {
    return LoadPem(path);
  }
  auto signer = Generate();
  signer->SavePem(path);
  return signer;
}

void Ed25519Signer::SavePem(const std::string& path) const {
  std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "wb"));
  if (!file) {
    throw util::CryptoError("cannot write private key: " + path);
  }
  if (PEM_write_PrivateKey(file.get(), key_, nullptr, nullptr, 0, nullptr, nullptr) != 1) {
    throw util::CryptoError(OpenSSLError("PEM_write_PrivateKey"));
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace);
}

SignatureBytes Ed25519Signer::Sign(std::string_view message) const {
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_) != 1) {
    throw util::CryptoError(OpenSSLError("EVP_DigestSignInit"));
  }

  SignatureBytes signature{};
  size_t         len = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &len, reinterpret_cast<const unsigned char*>(message.data()), message.size()) != 1 ||
      len != signature.size()) {
    throw util::CryptoError(OpenSSLError("EVP_DigestSign"));
  }
  return signature;
}

PublicKey Ed25519Signer::Public() const {
  PublicKey key{};
  size_t    len = key.size();
  if (EVP_PKEY_get_raw_public_key(key_, key.data(), &len) != 1 || len != key.size()) {
    throw util::CryptoError(OpenSSLError("EVP_PKEY_get_raw_public_key"));
  }
  return key;
}

bool Ed25519Verify(const PublicKey& public_key, std::string_view message, const SignatureBytes& signature) {
  std::unique_ptr<EVP_PKEY, PkeyDeleter> key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    return false;
  }
  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    return false;
  }
  return EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
         EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), reinterpret_cast<const unsigned char*>(message.data()),
                          message.size()) == 1;
}

PublicKey LoadPublicKey(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::CryptoError("cannot open public key: " + path);
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  PublicKey   key{};
  if (bytes.size() != key.size()) {
    throw util::CryptoError("public key must be 32 raw bytes: " + path);
  }
  std::copy(bytes.begin(), bytes.end(), key.begin());
  return key;
}

void SavePublicKey(const PublicKey& key, const std::string& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw util::CryptoError("cannot write public key: " + path);
  }
  out.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
}

} // namespace edgesync::crypto
