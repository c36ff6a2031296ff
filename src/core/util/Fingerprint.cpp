#include "Fingerprint.hpp"

#include <cstdint>
#include <stdexcept>

#include <openssl/evp.h>

namespace gb {

static std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("sha256 digest failed");
  }
  EVP_MD_CTX_free(ctx);
  return to_hex(digest, len);
}

std::string fingerprint(std::string_view remoteAddress) {
  return sha256_hex(remoteAddress).substr(0, kFingerprintHexLen);
}

} // namespace gb
