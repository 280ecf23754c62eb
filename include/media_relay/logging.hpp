/**
 * @file logging.hpp
 * @brief Logging macros and stage timing collection
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Stage timing macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector aggregating per-stage durations
 *            across all workers
 *
 * @note All logs use fmt::print and are flushed immediately so that output
 *       from a service manager (journald) shows up in order.
 */

#ifndef MEDIA_RELAY_LOGGING_HPP
#define MEDIA_RELAY_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace media_relay {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(media_relay::log_mutex);                  \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @struct StageTiming
 * @brief Accumulated duration of one pipeline stage.
 */
struct StageTiming {
  long count = 0;        //< Number of measurements
  long total_us = 0;     //< Sum of durations in microseconds
  long max_us = 0;       //< Slowest single measurement
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for stage durations.
 * @note All workers record into the same table; the batch summary prints
 *       one line per stage.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, StageTiming> stages;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /// Snapshot of one stage (zeroed if never recorded)
  static StageTiming get(const std::string &name);

  /**
   * @brief Print all collected stages as a formatted table.
   */
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    media_relay::TimingCollector::record(#name, timer_duration_##name);        \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace media_relay

#endif // MEDIA_RELAY_LOGGING_HPP
