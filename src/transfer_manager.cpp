/**
 * @file transfer_manager.cpp
 * @brief Chunked, resumable, verified transfer with retry
 */

#include "media_relay/transfer_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

#include "media_relay/checksum.hpp"
#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

const char *to_string(TransferPhase phase) {
  switch (phase) {
  case TransferPhase::Pending:
    return "PENDING";
  case TransferPhase::Connecting:
    return "CONNECTING";
  case TransferPhase::Writing:
    return "WRITING";
  case TransferPhase::Verifying:
    return "VERIFYING";
  case TransferPhase::Confirmed:
    return "CONFIRMED";
  case TransferPhase::Failed:
    break;
  }
  return "FAILED";
}

TransferManager::TransferManager(ShareClient &client, TransferOptions options,
                                 const CancellationToken *cancel)
    : client_(client), options_(options), cancel_(cancel) {
  if (options_.chunk_size == 0)
    options_.chunk_size = TRANSFER_CHUNK_SIZE;
}

bool TransferManager::cancelled(const TransferHooks &hooks) const {
  if (cancel_ && cancel_->requested())
    return true;
  return hooks.should_cancel && hooks.should_cancel();
}

std::chrono::milliseconds TransferManager::backoff_delay(int attempt) const {
  long delay = std::max(0, options_.retry_base_delay_ms);
  for (int i = 1; i < attempt && delay < options_.retry_max_delay_ms; ++i)
    delay *= 2;
  return std::chrono::milliseconds(std::min<long>(delay, options_.retry_max_delay_ms));
}

TransferResult TransferManager::transfer(const TransferRequest &request,
                                         const TransferHooks &hooks) {
  TransferResult result;

  std::error_code ec;
  uint64_t size = fs::file_size(request.local_path, ec);
  if (ec) {
    LOG_ERROR("Transfer source missing: {}", request.local_path);
    result.error = ErrorKind::NotFound;
    result.phase = TransferPhase::Failed;
    return result;
  }

  TIMER_START(checksum);
  if (!sha256_file(request.local_path, result.checksum)) {
    LOG_ERROR("Cannot read {}", request.local_path);
    result.error = ErrorKind::NotFound;
    result.phase = TransferPhase::Failed;
    return result;
  }
  TIMER_END(checksum);
  result.bytes = size;

  uint64_t offset = std::min(request.resume_offset, size);

  for (int attempt = 1;; ++attempt) {
    if (cancelled(hooks)) {
      result.error = ErrorKind::Cancelled;
      break;
    }

    result.attempts = attempt;
    if (hooks.on_attempt)
      hooks.on_attempt(attempt);

    result.phase = TransferPhase::Pending;
    ErrorKind err = run_attempt(request, size, result.checksum, offset, hooks,
                                result);
    if (err == ErrorKind::None) {
      result.error = ErrorKind::None;
      result.phase = TransferPhase::Confirmed;
      if (hooks.on_phase)
        hooks.on_phase(TransferPhase::Confirmed);
      return result;
    }

    result.error = err;
    if (err == ErrorKind::Cancelled)
      break;

    RetryPolicy policy = retry_policy_for(err);
    if (!policy.retryable || attempt >= policy.max_attempts) {
      LOG_ERROR("Transfer of {} failed after {} attempt(s): {}",
                request.remote_path, attempt, error_name(err));
      break;
    }

    auto delay = backoff_delay(attempt);
    LOG_WARN("Transfer of {} attempt {} failed ({}); retrying in {} ms",
             request.remote_path, attempt, error_name(err), delay.count());
    bool stop = false;
    if (cancel_) {
      stop = cancel_->wait_for(delay);
    } else {
      std::this_thread::sleep_for(delay);
    }
    if (stop || cancelled(hooks)) {
      result.error = ErrorKind::Cancelled;
      break;
    }
  }

  if (result.error == ErrorKind::Cancelled) {
    LOG_WARN("Transfer of {} cancelled", request.remote_path);
    client_.disconnect();
  }
  result.failed_in = result.phase;
  result.phase = TransferPhase::Failed;
  if (hooks.on_phase)
    hooks.on_phase(TransferPhase::Failed);
  return result;
}

ErrorKind TransferManager::remote_checksum(const std::string &path,
                                           uint64_t size, std::string &hex,
                                           const TransferHooks &hooks) {
  Sha256 sha;
  std::vector<char> buf(options_.chunk_size);
  uint64_t pos = 0;
  while (pos < size) {
    if (cancelled(hooks))
      return ErrorKind::Cancelled;
    size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - pos));
    size_t got = 0;
    ErrorKind err = client_.read(path, pos, buf.data(), want, got);
    if (err != ErrorKind::None)
      return err;
    if (got == 0)
      break;
    sha.update(buf.data(), got);
    pos += got;
  }
  hex = sha.hex_digest();
  return pos == size ? ErrorKind::None : ErrorKind::ChecksumMismatch;
}

ErrorKind TransferManager::run_attempt(const TransferRequest &request,
                                       uint64_t size,
                                       const std::string &checksum,
                                       uint64_t &offset,
                                       const TransferHooks &hooks,
                                       TransferResult &result) {
  auto phase = [&](TransferPhase p) {
    result.phase = p;
    if (hooks.on_phase)
      hooks.on_phase(p);
  };

  // **----- CONNECTING -----**
  phase(TransferPhase::Connecting);
  if (!client_.connected()) {
    ErrorKind err = client_.connect();
    if (err != ErrorKind::None)
      return err;
  }

  const std::string &dest = request.remote_path;
  const std::string part = dest + PARTIAL_SUFFIX;

  /// Idempotent re-entry: a previous run may have renamed before crashing
  uint64_t existing = 0;
  ErrorKind err = client_.stat(dest, existing);
  if (err == ErrorKind::None && existing == size) {
    std::string remote_hex;
    err = remote_checksum(dest, size, remote_hex, hooks);
    if (err == ErrorKind::Cancelled)
      return err;
    if (err == ErrorKind::None && remote_hex == checksum) {
      LOG_INFO("{} already on share with matching checksum", dest);
      err = client_.flush(dest);
      if (err != ErrorKind::None)
        return err;
      result.already_present = true;
      offset = size;
      if (hooks.on_progress)
        hooks.on_progress(size);
      return ErrorKind::None;
    }
    if (err != ErrorKind::None && err != ErrorKind::ChecksumMismatch)
      return err;
    err = client_.flush(dest);
    if (err != ErrorKind::None)
      return err;
    LOG_WARN("{} exists with different content; replacing", dest);
  } else if (err != ErrorKind::None && err != ErrorKind::NotFound) {
    return err;
  }

  err = client_.make_directories(remote_parent(dest));
  if (err != ErrorKind::None)
    return err;

  // **----- WRITING -----**
  phase(TransferPhase::Writing);

  uint64_t part_size = 0;
  err = client_.stat(part, part_size);
  if (err == ErrorKind::NotFound) {
    part_size = 0;
  } else if (err != ErrorKind::None) {
    return err;
  }

  /// Bytes on the share are the only proof of progress
  offset = std::min(offset, part_size);
  if (err == ErrorKind::NotFound || offset == 0 || part_size > size) {
    offset = 0;
    err = client_.create(part);
    if (err != ErrorKind::None)
      return err;
  } else {
    LOG_INFO("Resuming {} at byte {} of {}", part, offset, size);
  }

  std::ifstream in(request.local_path, std::ios::binary);
  if (!in)
    return ErrorKind::NotFound;
  in.seekg(static_cast<std::streamoff>(offset));

  TIMER_START(write);
  std::vector<char> buf(options_.chunk_size);
  while (offset < size) {
    if (cancelled(hooks))
      return ErrorKind::Cancelled;

    size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - offset));
    in.read(buf.data(), static_cast<std::streamsize>(want));
    if (static_cast<size_t>(in.gcount()) != want) {
      LOG_ERROR("Short read on {} at byte {}", request.local_path, offset);
      return ErrorKind::NotFound;
    }

    err = client_.write(part, buf.data(), want, offset);
    if (err != ErrorKind::None)
      return err;
    offset += want;
    if (hooks.on_progress)
      hooks.on_progress(offset);
  }

  err = client_.flush(part);
  if (err != ErrorKind::None)
    return err;
  TIMER_END(write);

  // **----- VERIFYING -----**
  phase(TransferPhase::Verifying);
  TIMER_START(verify);

  uint64_t written = 0;
  err = client_.stat(part, written);
  if (err != ErrorKind::None)
    return err == ErrorKind::NotFound ? ErrorKind::RemoteWriteFailed : err;

  std::string remote_hex;
  err = written == size ? remote_checksum(part, size, remote_hex, hooks)
                        : ErrorKind::ChecksumMismatch;
  ErrorKind closed = client_.flush(part);
  if (err == ErrorKind::None && closed != ErrorKind::None)
    return closed;
  if (err == ErrorKind::ChecksumMismatch ||
      (err == ErrorKind::None && remote_hex != checksum)) {
    LOG_ERROR("Checksum mismatch on {} ({} of {} bytes)", part, written, size);
    ErrorKind rm = client_.remove(part);
    if (rm != ErrorKind::None && rm != ErrorKind::NotFound)
      LOG_WARN("Could not remove {}: {}", part, error_name(rm));
    offset = 0;
    if (hooks.on_progress)
      hooks.on_progress(0);
    return ErrorKind::ChecksumMismatch;
  }
  if (err != ErrorKind::None)
    return err;
  TIMER_END(verify);

  err = client_.rename(part, dest);
  if (err != ErrorKind::None)
    return err == ErrorKind::NotFound ? ErrorKind::RemoteWriteFailed : err;

  LOG_INFO("Transferred {} ({} bytes) to {}", request.local_path, size, dest);
  return ErrorKind::None;
}

} // namespace media_relay
