/**
 * @file system.hpp
 * @brief Small formatting and filesystem utilities
 *
 * @details Provides:
 *
 *          - Time and size formatting for logs and summaries
 *
 *          - Media file discovery under a source directory
 */

#ifndef MEDIA_RELAY_SYSTEM_HPP
#define MEDIA_RELAY_SYSTEM_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace media_relay {

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/// 1536 -> "1.5 KiB"
std::string format_bytes(uint64_t bytes);

/// Format unix seconds as local "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp(int64_t unix_seconds);

// **---- File Discovery ----**

/// True for the container extensions the pipeline accepts (case-insensitive)
bool is_media_file(const std::string &path);

/**
 * @brief Collect media files below a directory.
 * @note Recursive; hidden entries and partial downloads (.part) are skipped.
 * @return Sorted absolute paths
 */
std::vector<std::string> collect_media_files(const std::string &dir);

} // namespace media_relay

#endif // MEDIA_RELAY_SYSTEM_HPP
