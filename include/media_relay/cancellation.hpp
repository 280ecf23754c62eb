/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag shared by workers and signal handlers
 */

#ifndef MEDIA_RELAY_CANCELLATION_HPP
#define MEDIA_RELAY_CANCELLATION_HPP

#include <atomic>
#include <chrono>

namespace media_relay {

/**
 * @class CancellationToken
 * @brief One-way flag: once requested it stays requested.
 * @note request() only stores to a lock-free atomic and may be called from
 *       a signal handler.
 */
class CancellationToken {
  std::atomic<bool> requested_{false};

public:
  void request() { requested_.store(true); }
  bool requested() const { return requested_.load(); }

  /**
   * @brief Sleep for up to duration, waking early on cancellation.
   * @return true if cancellation was requested
   */
  bool wait_for(std::chrono::milliseconds duration) const;
};

/**
 * @brief Route SIGINT and SIGTERM to a token.
 * @note The token must outlive the process' signal handling.
 */
void install_signal_handlers(CancellationToken &token);

} // namespace media_relay

#endif // MEDIA_RELAY_CANCELLATION_HPP
