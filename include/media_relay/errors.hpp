/**
 * @file errors.hpp
 * @brief Error taxonomy and the retry policy table
 *
 * @details Every pipeline component reports failures as an ErrorKind status
 *          code. Whether a failure is worth retrying is decided in exactly
 *          one place, retry_policy_for(), so the policy can be audited and
 *          tested on its own.
 */

#ifndef MEDIA_RELAY_ERRORS_HPP
#define MEDIA_RELAY_ERRORS_HPP

#include <string>

namespace media_relay {

enum class ErrorKind {
  None,
  NotFound,
  UnreadableContainer,
  UnclassifiedMedia,
  RemuxFailed,
  ConnectionFailed,
  AuthenticationFailed,
  RemoteWriteFailed,
  ChecksumMismatch,
  CleanupPartial,
  Cancelled
};

/// Stable name stored in the ledger's reason column
const char *error_name(ErrorKind kind);

bool parse_error_name(const std::string &text, ErrorKind &out);

/**
 * @struct RetryPolicy
 * @brief How the Transfer Manager reacts to one error kind.
 * @note max_attempts counts the first attempt (1 = never retried).
 */
struct RetryPolicy {
  bool retryable;
  int max_attempts;
};

/**
 * @brief Look up the retry policy of an error kind.
 *
 * @attention TABLE:
 *
 *   - ConnectionFailed     retried, 5 attempts
 *
 *   - RemoteWriteFailed    retried, 5 attempts
 *
 *   - AuthenticationFailed not retried
 *
 *   - ChecksumMismatch     not retried
 *
 *   - everything else      not retried
 */
RetryPolicy retry_policy_for(ErrorKind kind);

} // namespace media_relay

#endif // MEDIA_RELAY_ERRORS_HPP
