/**
 * @file cancellation.cpp
 * @brief Cancellation token and signal wiring
 */

#include "media_relay/cancellation.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace media_relay {

namespace {

CancellationToken *signal_token = nullptr;

void on_signal(int) { signal_token->request(); }

} // namespace

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  const auto slice = std::chrono::milliseconds(100);
  auto deadline = std::chrono::steady_clock::now() + duration;
  while (!requested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;
    auto left =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(slice, left));
  }
  return true;
}

void install_signal_handlers(CancellationToken &token) {
  signal_token = &token;

  struct sigaction action {};
  action.sa_handler = on_signal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

} // namespace media_relay
