/**
 * @file local_share_client.hpp
 * @brief Share session over a locally mounted share (cifs mount, NFS, disk)
 */

#ifndef MEDIA_RELAY_LOCAL_SHARE_CLIENT_HPP
#define MEDIA_RELAY_LOCAL_SHARE_CLIENT_HPP

#include "share_client.hpp"

namespace media_relay {

/**
 * @class LocalShareClient
 * @brief ShareClient writing below <root>/<base_path> with pread/pwrite.
 * @note connect() fails with ConnectionFailed when root is not a directory,
 *       which is what an unmounted share looks like.
 */
class LocalShareClient : public ShareClient {
  std::string root_;
  std::string base_;
  bool connected_ = false;

  /// Cached descriptor of the file currently being written or read
  int fd_ = -1;
  std::string fd_path_;
  bool fd_writable_ = false;

  std::string full_path(const std::string &path) const;
  ErrorKind open_cached(const std::string &path, bool writable);
  void close_cached();

public:
  LocalShareClient(std::string root, std::string base_path);
  ~LocalShareClient() override;

  LocalShareClient(const LocalShareClient &) = delete;
  LocalShareClient &operator=(const LocalShareClient &) = delete;

  ErrorKind connect() override;
  void disconnect() override;
  bool connected() const override { return connected_; }
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

#endif // MEDIA_RELAY_LOCAL_SHARE_CLIENT_HPP
