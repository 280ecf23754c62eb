/**
 * @file smb_share_client.hpp
 * @brief SMB/CIFS share session on top of libsmbclient
 *
 * @details Each instance owns its own SMBCCTX, so workers never share
 *          connection state. Paths are mapped to
 *          smb://<server>/<share>/<base_path>/<path> with every component
 *          percent-encoded.
 *
 * @note libsmbclient has no positional write; writes go through the cached
 *       open handle with lseek + write. flush() closes the handle, which is
 *       the point where the server commits the data.
 */

#ifndef MEDIA_RELAY_SMB_SHARE_CLIENT_HPP
#define MEDIA_RELAY_SMB_SHARE_CLIENT_HPP

#include "share_client.hpp"

struct _SMBCCTX;
struct _SMBCFILE;

namespace media_relay {

/// Percent-encode one path for an smb:// URL ('/' is kept)
std::string smb_url_encode(const std::string &path);

/**
 * @brief Classify an errno left by a libsmbclient call.
 * @return ConnectionFailed for network/timeout errors, RemoteWriteFailed
 *         for everything else
 */
ErrorKind smb_io_error(int err);

class SmbShareClient : public ShareClient {
  ShareSettings settings_;
  _SMBCCTX *ctx_ = nullptr;

  _SMBCFILE *file_ = nullptr;
  std::string file_path_;
  bool file_writable_ = false;

  std::string url(const std::string &path) const;
  ErrorKind open_cached(const std::string &path, bool writable);
  void close_cached();
  ErrorKind fail_io(const char *op, const std::string &path, int err);

  static void auth_callback(_SMBCCTX *ctx, const char *server,
                            const char *share, char *workgroup, int wg_len,
                            char *username, int un_len, char *password,
                            int pw_len);

public:
  explicit SmbShareClient(ShareSettings settings);
  ~SmbShareClient() override;

  SmbShareClient(const SmbShareClient &) = delete;
  SmbShareClient &operator=(const SmbShareClient &) = delete;

  /**
   * @brief Create the context and open the share root.
   * @return None, AuthenticationFailed (EACCES/EPERM on the share) or
   *         ConnectionFailed
   */
  ErrorKind connect() override;
  void disconnect() override;
  bool connected() const override { return ctx_ != nullptr; }
  std::string share_root() const override;

  ErrorKind stat(const std::string &path, uint64_t &size) override;
  ErrorKind make_directories(const std::string &path) override;
  ErrorKind create(const std::string &path) override;
  ErrorKind write(const std::string &path, const void *data, size_t size,
                  uint64_t offset) override;
  ErrorKind read(const std::string &path, uint64_t offset, void *buf,
                 size_t size, size_t &read_bytes) override;
  ErrorKind flush(const std::string &path) override;
  ErrorKind rename(const std::string &from, const std::string &to) override;
  ErrorKind remove(const std::string &path) override;
};

} // namespace media_relay

#endif // MEDIA_RELAY_SMB_SHARE_CLIENT_HPP
