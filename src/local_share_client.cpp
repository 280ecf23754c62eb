/**
 * @file local_share_client.cpp
 * @brief Locally mounted share backend
 */

#include "media_relay/local_share_client.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

LocalShareClient::LocalShareClient(std::string root, std::string base_path)
    : root_(std::move(root)), base_(std::move(base_path)) {}

LocalShareClient::~LocalShareClient() { close_cached(); }

std::string LocalShareClient::full_path(const std::string &path) const {
  fs::path p(root_);
  if (!base_.empty())
    p /= base_;
  if (!path.empty())
    p /= path;
  return p.string();
}

std::string LocalShareClient::share_root() const { return full_path(""); }

ErrorKind LocalShareClient::connect() {
  std::error_code ec;
  if (root_.empty() || !fs::is_directory(root_, ec)) {
    LOG_ERROR("Share root {} is not a mounted directory", root_);
    return ErrorKind::ConnectionFailed;
  }
  if (!base_.empty()) {
    fs::create_directories(full_path(""), ec);
    if (ec) {
      LOG_ERROR("Cannot create {}: {}", full_path(""), ec.message());
      return ec == std::errc::permission_denied
                 ? ErrorKind::AuthenticationFailed
                 : ErrorKind::ConnectionFailed;
    }
  }
  connected_ = true;
  return ErrorKind::None;
}

void LocalShareClient::disconnect() {
  close_cached();
  connected_ = false;
}

void LocalShareClient::close_cached() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  fd_path_.clear();
  fd_writable_ = false;
}

ErrorKind LocalShareClient::open_cached(const std::string &path,
                                        bool writable) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  if (fd_ >= 0 && fd_path_ == path && (fd_writable_ || !writable))
    return ErrorKind::None;

  close_cached();
  int fd = ::open(full_path(path).c_str(), writable ? O_RDWR : O_RDONLY);
  if (fd < 0) {
    return errno == ENOENT ? ErrorKind::NotFound : ErrorKind::RemoteWriteFailed;
  }
  fd_ = fd;
  fd_path_ = path;
  fd_writable_ = writable;
  return ErrorKind::None;
}

ErrorKind LocalShareClient::stat(const std::string &path, uint64_t &size) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  struct stat st {};
  if (::stat(full_path(path).c_str(), &st) != 0) {
    return errno == ENOENT ? ErrorKind::NotFound : ErrorKind::RemoteWriteFailed;
  }
  size = static_cast<uint64_t>(st.st_size);
  return ErrorKind::None;
}

ErrorKind LocalShareClient::make_directories(const std::string &path) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  std::error_code ec;
  fs::create_directories(full_path(path), ec);
  if (ec) {
    LOG_WARN("mkdir {} failed: {}", full_path(path), ec.message());
    return ErrorKind::RemoteWriteFailed;
  }
  return ErrorKind::None;
}

ErrorKind LocalShareClient::create(const std::string &path) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  close_cached();
  int fd = ::open(full_path(path).c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    LOG_WARN("create {} failed: {}", full_path(path), std::strerror(errno));
    return ErrorKind::RemoteWriteFailed;
  }
  fd_ = fd;
  fd_path_ = path;
  fd_writable_ = true;
  return ErrorKind::None;
}

ErrorKind LocalShareClient::write(const std::string &path, const void *data,
                                  size_t size, uint64_t offset) {
  ErrorKind err = open_cached(path, true);
  if (err != ErrorKind::None)
    return err == ErrorKind::NotFound ? ErrorKind::RemoteWriteFailed : err;

  const char *p = static_cast<const char *>(data);
  size_t done = 0;
  while (done < size) {
    ssize_t n = ::pwrite(fd_, p + done, size - done,
                         static_cast<off_t>(offset + done));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      LOG_WARN("write {} failed: {}", full_path(path), std::strerror(errno));
      close_cached();
      return ErrorKind::RemoteWriteFailed;
    }
    done += static_cast<size_t>(n);
  }
  return ErrorKind::None;
}

ErrorKind LocalShareClient::read(const std::string &path, uint64_t offset,
                                 void *buf, size_t size, size_t &read_bytes) {
  ErrorKind err = open_cached(path, false);
  if (err != ErrorKind::None)
    return err;

  ssize_t n;
  do {
    n = ::pread(fd_, buf, size, static_cast<off_t>(offset));
  } while (n < 0 && errno == EINTR);
  if (n < 0) {
    close_cached();
    return ErrorKind::RemoteWriteFailed;
  }
  read_bytes = static_cast<size_t>(n);
  return ErrorKind::None;
}

ErrorKind LocalShareClient::flush(const std::string &path) {
  if (fd_ >= 0 && fd_path_ == path) {
    int rc = fd_writable_ ? ::fsync(fd_) : 0;
    close_cached();
    if (rc != 0)
      return ErrorKind::RemoteWriteFailed;
  }
  return connected_ ? ErrorKind::None : ErrorKind::ConnectionFailed;
}

ErrorKind LocalShareClient::rename(const std::string &from,
                                   const std::string &to) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  if (fd_path_ == from || fd_path_ == to)
    close_cached();
  if (::rename(full_path(from).c_str(), full_path(to).c_str()) != 0) {
    return errno == ENOENT ? ErrorKind::NotFound : ErrorKind::RemoteWriteFailed;
  }
  return ErrorKind::None;
}

ErrorKind LocalShareClient::remove(const std::string &path) {
  if (!connected_)
    return ErrorKind::ConnectionFailed;
  if (fd_path_ == path)
    close_cached();
  if (::unlink(full_path(path).c_str()) != 0) {
    return errno == ENOENT ? ErrorKind::NotFound : ErrorKind::RemoteWriteFailed;
  }
  return ErrorKind::None;
}

} // namespace media_relay
