/**
 * @file checksum.cpp
 * @brief SHA-256 implementation via OpenSSL EVP
 */

#include "media_relay/checksum.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

#include <fmt/core.h>
#include <openssl/evp.h>

namespace media_relay {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

Sha256::~Sha256() { EVP_MD_CTX_free(ctx_); }

void Sha256::update(const void *data, size_t size) {
  if (size > 0)
    EVP_DigestUpdate(ctx_, data, size);
}

std::string Sha256::hex_digest() {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  EVP_DigestFinal_ex(ctx_, digest, &len);

  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    hex += fmt::format("{:02x}", digest[i]);
  }
  return hex;
}

bool sha256_file(const std::string &path, std::string &hex) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;

  Sha256 sha;
  std::vector<char> buffer(1024 * 1024);
  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize n = in.gcount();
    if (n > 0)
      sha.update(buffer.data(), static_cast<size_t>(n));
  }
  if (in.bad())
    return false;

  hex = sha.hex_digest();
  return true;
}

} // namespace media_relay
