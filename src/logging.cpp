/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector static members and methods
 */

#include "media_relay/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_relay {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, StageTiming> TimingCollector::stages;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  StageTiming &t = stages[name];
  t.count++;
  t.total_us += us;
  t.max_us = std::max(t.max_us, us);
}

StageTiming TimingCollector::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = stages.find(name);
  return it == stages.end() ? StageTiming{} : it->second;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (stages.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "===================== STAGE TIMINGS =====================\n");
  fmt::print("{:<16} {:>8} {:>14} {:>14}\n", "Stage", "Count", "Avg (s)",
             "Max (s)");
  fmt::print("{:-<16} {:-<8} {:-<14} {:-<14}\n", "", "", "", "");

  for (const auto &entry : stages) {
    const StageTiming &t = entry.second;
    double avg = t.count > 0 ? (t.total_us / t.count) / 1000000.0 : 0.0;
    fmt::print("{:<16} {:>8} {:>14.2f} {:>14.2f}\n", entry.first, t.count, avg,
               t.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "=========================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  stages.clear();
}

} // namespace media_relay
