/**
 * @file checksum.hpp
 * @brief SHA-256 hashing for transfer verification and dedup keys
 */

#ifndef MEDIA_RELAY_CHECKSUM_HPP
#define MEDIA_RELAY_CHECKSUM_HPP

#include <cstddef>
#include <cstdint>
#include <string>

struct evp_md_ctx_st;

namespace media_relay {

/**
 * @class Sha256
 * @brief Incremental SHA-256 on top of OpenSSL's EVP interface.
 */
class Sha256 {
  evp_md_ctx_st *ctx_ = nullptr;

public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256 &) = delete;
  Sha256 &operator=(const Sha256 &) = delete;

  void update(const void *data, size_t size);

  /// Finish the digest; the object must not be updated afterwards
  std::string hex_digest();
};

/**
 * @brief Hash a whole local file.
 * @param path File to read
 * @param hex Output: lower-case hex digest
 * @return false if the file could not be read
 */
bool sha256_file(const std::string &path, std::string &hex);

} // namespace media_relay

#endif // MEDIA_RELAY_CHECKSUM_HPP
