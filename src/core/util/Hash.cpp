#include "Hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace tgw {

std::string to_hex(const uint8_t* data, size_t len) {
  static const char* k = "0123456789abcdef";
  std::string out; out.resize(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out[2*i]   = k[(data[i] >> 4) & 0xF];
    out[2*i+1] = k[data[i] & 0xF];
  }
  return out;
}

std::string sha256_hex(std::string_view bytes) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex failed");
  if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;
  if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLen) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  return to_hex(hash, hashLen);
}

bool constant_time_equals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace tgw
