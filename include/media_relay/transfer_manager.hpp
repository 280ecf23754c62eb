/**
 * @file transfer_manager.hpp
 * @brief Resumable, verified file copy onto a share
 *
 * @details One transfer runs one or more attempts. Each attempt moves
 *          through:
 *
 *          PENDING -> CONNECTING -> WRITING -> VERIFYING -> CONFIRMED
 *
 *          and ends in FAILED on any error. Data goes to "<dest>.part" in
 *          fixed-size chunks at explicit offsets, is read back and hashed,
 *          and only then renamed to "<dest>". A file that is not confirmed
 *          never appears under its final name.
 *
 * @attention RETRIES:
 *
 *   - Whether an error is retried, and how often, comes from
 *     retry_policy_for()
 *
 *   - Delay between attempts doubles from retry_base_delay_ms up to
 *     retry_max_delay_ms
 *
 *   - A retry resumes from the bytes already present in the .part file
 */

#ifndef MEDIA_RELAY_TRANSFER_MANAGER_HPP
#define MEDIA_RELAY_TRANSFER_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "cancellation.hpp"
#include "errors.hpp"
#include "share_client.hpp"
#include "types.hpp"

namespace media_relay {

enum class TransferPhase { Pending, Connecting, Writing, Verifying, Confirmed, Failed };

const char *to_string(TransferPhase phase);

struct TransferOptions {
  size_t chunk_size = TRANSFER_CHUNK_SIZE;
  int retry_base_delay_ms = 1000;
  int retry_max_delay_ms = 30000;
};

/**
 * @struct TransferRequest
 * @brief What to copy and where; the session lives in the manager.
 */
struct TransferRequest {
  std::string local_path;
  std::string remote_path;    //< Relative to the share root
  uint64_t resume_offset = 0; //< bytesTransferred committed by an earlier run
};

struct TransferResult {
  ErrorKind error = ErrorKind::None;
  TransferPhase phase = TransferPhase::Pending;
  TransferPhase failed_in = TransferPhase::Pending; //< Phase the last attempt stopped in
  uint64_t bytes = 0;
  std::string checksum; //< SHA-256 of the local file
  int attempts = 0;
  bool already_present = false; //< Confirmed without copying
};

/**
 * @struct TransferHooks
 * @brief Callbacks into the caller (the ledger, in the pipeline).
 * @note Every hook is optional.
 */
struct TransferHooks {
  std::function<void(int attempt)> on_attempt;
  std::function<void(uint64_t bytes)> on_progress;
  std::function<void(TransferPhase phase)> on_phase;
  std::function<bool()> should_cancel;
};

/**
 * @class TransferManager
 * @brief Drives one ShareClient session through transfers, one at a time.
 */
class TransferManager {
  ShareClient &client_;
  TransferOptions options_;
  const CancellationToken *cancel_;

  bool cancelled(const TransferHooks &hooks) const;

  ErrorKind run_attempt(const TransferRequest &request, uint64_t size,
                        const std::string &checksum, uint64_t &offset,
                        const TransferHooks &hooks, TransferResult &result);

  /// Hash the first size bytes of a remote file
  ErrorKind remote_checksum(const std::string &path, uint64_t size,
                            std::string &hex, const TransferHooks &hooks);

public:
  TransferManager(ShareClient &client, TransferOptions options,
                  const CancellationToken *cancel = nullptr);

  /**
   * @brief Copy a local file to the share, retrying per policy.
   * @return Result with error None and phase Confirmed on success
   */
  TransferResult transfer(const TransferRequest &request,
                          const TransferHooks &hooks = {});

  /// Delay before attempt number attempt + 1
  std::chrono::milliseconds backoff_delay(int attempt) const;
};

} // namespace media_relay

#endif // MEDIA_RELAY_TRANSFER_MANAGER_HPP
