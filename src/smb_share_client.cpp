/**
 * @file smb_share_client.cpp
 * @brief libsmbclient backend
 */

#include "media_relay/smb_share_client.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>

#include <fmt/core.h>
#include <libsmbclient.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace {

void copy_field(const std::string &value, char *out, int len) {
  if (len <= 0)
    return;
  std::strncpy(out, value.c_str(), static_cast<size_t>(len) - 1);
  out[len - 1] = '\0';
}

} // namespace

std::string smb_url_encode(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        c == '/') {
      out += static_cast<char>(c);
    } else {
      out += fmt::format("%{:02X}", c);
    }
  }
  return out;
}

ErrorKind smb_io_error(int err) {
  switch (err) {
  case ETIMEDOUT:
  case ECONNRESET:
  case ECONNREFUSED:
  case ECONNABORTED:
  case EHOSTUNREACH:
  case ENETUNREACH:
  case ENETDOWN:
  case ENOTCONN:
  case EPIPE:
  case EBADF:
    return ErrorKind::ConnectionFailed;
  default:
    return ErrorKind::RemoteWriteFailed;
  }
}

SmbShareClient::SmbShareClient(ShareSettings settings)
    : settings_(std::move(settings)) {}

SmbShareClient::~SmbShareClient() { disconnect(); }

void SmbShareClient::auth_callback(SMBCCTX *ctx, const char *, const char *,
                                   char *workgroup, int wg_len, char *username,
                                   int un_len, char *password, int pw_len) {
  auto *self = static_cast<SmbShareClient *>(smbc_getOptionUserData(ctx));
  if (!self)
    return;
  copy_field(self->settings_.workgroup, workgroup, wg_len);
  copy_field(self->settings_.username, username, un_len);
  copy_field(self->settings_.password, password, pw_len);
}

std::string SmbShareClient::url(const std::string &path) const {
  std::string rel = settings_.base_path;
  if (!path.empty()) {
    if (!rel.empty())
      rel += "/";
    rel += path;
  }
  std::string u = fmt::format("smb://{}/{}", settings_.server,
                              smb_url_encode(settings_.share));
  if (!rel.empty())
    u += "/" + smb_url_encode(rel);
  return u;
}

std::string SmbShareClient::share_root() const { return url(""); }

ErrorKind SmbShareClient::connect() {
  disconnect();

  if (settings_.server.empty() || settings_.share.empty()) {
    LOG_ERROR("SMB_SERVER and SMB_SHARE must be set");
    return ErrorKind::ConnectionFailed;
  }

  SMBCCTX *ctx = smbc_new_context();
  if (!ctx) {
    LOG_ERROR("smbc_new_context failed: {}", std::strerror(errno));
    return ErrorKind::ConnectionFailed;
  }
  smbc_setDebug(ctx, 0);
  smbc_setTimeout(ctx, settings_.timeout_ms);
  smbc_setOptionUserData(ctx, this);
  smbc_setOptionNoAutoAnonymousLogin(ctx, 1);
  smbc_setFunctionAuthDataWithContext(ctx, &SmbShareClient::auth_callback);

  if (!smbc_init_context(ctx)) {
    LOG_ERROR("smbc_init_context failed: {}", std::strerror(errno));
    smbc_free_context(ctx, 1);
    return ErrorKind::ConnectionFailed;
  }

  /// Listing the share root performs the tree connect and the logon
  std::string share_url =
      fmt::format("smb://{}/{}", settings_.server, smb_url_encode(settings_.share));
  SMBCFILE *dir = smbc_getFunctionOpendir(ctx)(ctx, share_url.c_str());
  if (!dir) {
    int err = errno;
    smbc_free_context(ctx, 1);
    if (err == EACCES || err == EPERM) {
      LOG_ERROR("SMB logon to {} rejected for user '{}'", share_url,
                settings_.username);
      return ErrorKind::AuthenticationFailed;
    }
    LOG_ERROR("Cannot reach {}: {}", share_url, std::strerror(err));
    return ErrorKind::ConnectionFailed;
  }
  smbc_getFunctionClosedir(ctx)(ctx, dir);
  ctx_ = ctx;

  if (!settings_.base_path.empty()) {
    /// make_directories() is relative to the base path; build it from the
    /// share root instead
    std::string base = settings_.base_path;
    settings_.base_path.clear();
    ErrorKind err = make_directories(base);
    settings_.base_path = base;
    if (err != ErrorKind::None) {
      disconnect();
      return err;
    }
  }

  LOG_INFO("Connected to {}", share_root());
  return ErrorKind::None;
}

void SmbShareClient::disconnect() {
  close_cached();
  if (ctx_) {
    smbc_free_context(ctx_, 1);
    ctx_ = nullptr;
  }
}

void SmbShareClient::close_cached() {
  if (ctx_ && file_) {
    smbc_getFunctionClose(ctx_)(ctx_, file_);
  }
  file_ = nullptr;
  file_path_.clear();
  file_writable_ = false;
}

ErrorKind SmbShareClient::fail_io(const char *op, const std::string &path,
                                  int err) {
  ErrorKind kind = smb_io_error(err);
  LOG_WARN("SMB {} {} failed: {} ({})", op, path, std::strerror(err),
           error_name(kind));
  close_cached();
  /// A dead session must be rebuilt by the next connect()
  if (kind == ErrorKind::ConnectionFailed)
    disconnect();
  return kind;
}

ErrorKind SmbShareClient::open_cached(const std::string &path, bool writable) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  if (file_ && file_path_ == path && (file_writable_ || !writable))
    return ErrorKind::None;

  close_cached();
  SMBCFILE *f = smbc_getFunctionOpen(ctx_)(ctx_, url(path).c_str(),
                                           writable ? O_RDWR : O_RDONLY, 0);
  if (!f) {
    if (errno == ENOENT)
      return ErrorKind::NotFound;
    return fail_io("open", path, errno);
  }
  file_ = f;
  file_path_ = path;
  file_writable_ = writable;
  return ErrorKind::None;
}

ErrorKind SmbShareClient::stat(const std::string &path, uint64_t &size) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  struct stat st {};
  if (smbc_getFunctionStat(ctx_)(ctx_, url(path).c_str(), &st) < 0) {
    if (errno == ENOENT)
      return ErrorKind::NotFound;
    return fail_io("stat", path, errno);
  }
  size = static_cast<uint64_t>(st.st_size);
  return ErrorKind::None;
}

ErrorKind SmbShareClient::make_directories(const std::string &path) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;

  std::string partial;
  size_t pos = 0;
  while (pos <= path.size()) {
    size_t slash = path.find('/', pos);
    if (slash == std::string::npos)
      slash = path.size();
    std::string component = path.substr(pos, slash - pos);
    pos = slash + 1;
    if (component.empty())
      continue;

    partial += partial.empty() ? component : "/" + component;
    if (smbc_getFunctionMkdir(ctx_)(ctx_, url(partial).c_str(), 0755) < 0 &&
        errno != EEXIST) {
      return fail_io("mkdir", partial, errno);
    }
  }
  return ErrorKind::None;
}

ErrorKind SmbShareClient::create(const std::string &path) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  close_cached();
  SMBCFILE *f = smbc_getFunctionOpen(ctx_)(
      ctx_, url(path).c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
  if (!f)
    return fail_io("create", path, errno);
  file_ = f;
  file_path_ = path;
  file_writable_ = true;
  return ErrorKind::None;
}

ErrorKind SmbShareClient::write(const std::string &path, const void *data,
                                size_t size, uint64_t offset) {
  ErrorKind err = open_cached(path, true);
  if (err != ErrorKind::None)
    return err == ErrorKind::NotFound ? ErrorKind::RemoteWriteFailed : err;

  if (smbc_getFunctionLseek(ctx_)(ctx_, file_, static_cast<off_t>(offset),
                                  SEEK_SET) < 0) {
    return fail_io("seek", path, errno);
  }

  const char *p = static_cast<const char *>(data);
  size_t done = 0;
  while (done < size) {
    ssize_t n = smbc_getFunctionWrite(ctx_)(ctx_, file_, p + done, size - done);
    if (n < 0)
      return fail_io("write", path, errno);
    if (n == 0)
      return fail_io("write", path, EIO);
    done += static_cast<size_t>(n);
  }
  return ErrorKind::None;
}

ErrorKind SmbShareClient::read(const std::string &path, uint64_t offset,
                               void *buf, size_t size, size_t &read_bytes) {
  ErrorKind err = open_cached(path, false);
  if (err != ErrorKind::None)
    return err;

  if (smbc_getFunctionLseek(ctx_)(ctx_, file_, static_cast<off_t>(offset),
                                  SEEK_SET) < 0) {
    return fail_io("seek", path, errno);
  }
  ssize_t n = smbc_getFunctionRead(ctx_)(ctx_, file_, buf, size);
  if (n < 0)
    return fail_io("read", path, errno);
  read_bytes = static_cast<size_t>(n);
  return ErrorKind::None;
}

ErrorKind SmbShareClient::flush(const std::string &path) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  if (file_ && file_path_ == path) {
    int rc = smbc_getFunctionClose(ctx_)(ctx_, file_);
    file_ = nullptr;
    file_path_.clear();
    file_writable_ = false;
    if (rc < 0)
      return fail_io("close", path, errno);
  }
  return ErrorKind::None;
}

ErrorKind SmbShareClient::rename(const std::string &from,
                                 const std::string &to) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  if (file_path_ == from || file_path_ == to)
    close_cached();

  /// SMB rename does not replace an existing target
  uint64_t existing = 0;
  if (stat(to, existing) == ErrorKind::None) {
    ErrorKind err = remove(to);
    if (err != ErrorKind::None)
      return err;
  }

  if (smbc_getFunctionRename(ctx_)(ctx_, url(from).c_str(), ctx_,
                                   url(to).c_str()) < 0) {
    if (errno == ENOENT)
      return ErrorKind::NotFound;
    return fail_io("rename", from, errno);
  }
  return ErrorKind::None;
}

ErrorKind SmbShareClient::remove(const std::string &path) {
  if (!ctx_)
    return ErrorKind::ConnectionFailed;
  if (file_path_ == path)
    close_cached();
  if (smbc_getFunctionUnlink(ctx_)(ctx_, url(path).c_str()) < 0) {
    if (errno == ENOENT)
      return ErrorKind::NotFound;
    return fail_io("unlink", path, errno);
  }
  return ErrorKind::None;
}

} // namespace media_relay
