/**
 * @file system.cpp
 * @brief Formatting and file discovery utilities
 */

#include "media_relay/system.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>

#include <fmt/core.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_bytes(uint64_t bytes) {
  static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  int unit = 0;
  while (value >= 1024.0 && unit < 4) {
    value /= 1024.0;
    ++unit;
  }
  if (unit == 0)
    return fmt::format("{} B", bytes);
  return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string format_timestamp(int64_t unix_seconds) {
  std::time_t t = static_cast<std::time_t>(unix_seconds);
  std::tm tm_buf{};
  if (!localtime_r(&t, &tm_buf))
    return std::to_string(unix_seconds);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return buf;
}

// **---- File Discovery ----**

bool is_media_file(const std::string &path) {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mkv" || ext == ".mp4" || ext == ".avi" || ext == ".m4v" ||
         ext == ".mov" || ext == ".ts";
}

std::vector<std::string> collect_media_files(const std::string &dir) {
  std::vector<std::string> files;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG_ERROR("Cannot scan {}: {}", dir, ec.message());
    return files;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOG_WARN("Scan error below {}: {}", dir, ec.message());
      break;
    }
    const fs::path &p = it->path();
    std::string name = p.filename().string();
    if (!name.empty() && name[0] == '.') {
      if (it->is_directory(ec))
        it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(ec) || !is_media_file(name))
      continue;
    files.push_back(fs::absolute(p).lexically_normal().string());
  }

  std::sort(files.begin(), files.end());
  return files;
}

} // namespace media_relay
