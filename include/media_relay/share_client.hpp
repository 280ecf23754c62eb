/**
 * @file share_client.hpp
 * @brief Abstract network share session
 *
 * @details A ShareClient is one session against one share. Paths are
 *          relative to the session's share root and always use '/'.
 *          Every operation reports an ErrorKind:
 *
 *          - ConnectionFailed: the session is gone or timed out
 *
 *          - AuthenticationFailed: credentials rejected
 *
 *          - RemoteWriteFailed: the server refused or failed an I/O call
 *
 *          - NotFound: stat/read/remove of a missing path
 *
 * @note A session is owned by exactly one worker and used sequentially;
 *       implementations are not thread-safe.
 */

#ifndef MEDIA_RELAY_SHARE_CLIENT_HPP
#define MEDIA_RELAY_SHARE_CLIENT_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "errors.hpp"

namespace media_relay {

/**
 * @struct ShareSettings
 * @brief Connection parameters for every backend.
 */
struct ShareSettings {
  std::string backend = "smb"; //< "smb" or "local"

  std::string server;
  std::string share;
  std::string username;
  std::string password;
  std::string workgroup = "WORKGROUP";
  std::string base_path = "media"; //< Directory inside the share
  int timeout_ms = 30000;

  std::string local_root; //< Mount point for the local backend
};

class ShareClient {
public:
  virtual ~ShareClient() = default;

  virtual ErrorKind connect() = 0;
  virtual void disconnect() = 0;
  virtual bool connected() const = 0;

  /// Human-readable root (smb://server/share/base or a local directory)
  virtual std::string share_root() const = 0;

  /**
   * @brief Size of a remote file.
   * @return None, or NotFound when the path does not exist
   */
  virtual ErrorKind stat(const std::string &path, uint64_t &size) = 0;

  /// Create every missing directory of path (mkdir -p)
  virtual ErrorKind make_directories(const std::string &path) = 0;

  /// Create or truncate a file
  virtual ErrorKind create(const std::string &path) = 0;

  /// Write size bytes at an explicit offset; the file must exist
  virtual ErrorKind write(const std::string &path, const void *data,
                          size_t size, uint64_t offset) = 0;

  /**
   * @brief Read up to size bytes at offset.
   * @param read_bytes Output: bytes read, 0 at end of file
   */
  virtual ErrorKind read(const std::string &path, uint64_t offset, void *buf,
                         size_t size, size_t &read_bytes) = 0;

  /// Make written data durable and release the cached handle
  virtual ErrorKind flush(const std::string &path) = 0;

  /// Rename, replacing an existing target
  virtual ErrorKind rename(const std::string &from, const std::string &to) = 0;

  virtual ErrorKind remove(const std::string &path) = 0;
};

/**
 * @brief Build the session configured by settings.backend.
 * @return nullptr for an unknown backend name
 */
std::unique_ptr<ShareClient> make_share_client(const ShareSettings &settings);

/// Parent directory of a '/'-separated relative path ("" at top level)
std::string remote_parent(const std::string &path);

} // namespace media_relay

#endif // MEDIA_RELAY_SHARE_CLIENT_HPP
