/**
 * @file cleanup_agent.cpp
 * @brief Cleanup of remux artifacts, sources and empty directories
 */

#include "media_relay/cleanup_agent.hpp"

#include <filesystem>

#include <fmt/core.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

/// Is path strictly below root? Both must be lexically normal absolute paths.
bool strictly_inside(const fs::path &root, const fs::path &path) {
  auto r = root.begin();
  auto p = path.begin();
  for (; r != root.end(); ++r, ++p) {
    if (p == path.end() || *r != *p)
      return false;
  }
  return p != path.end();
}

fs::path normal_absolute(const std::string &path) {
  std::error_code ec;
  fs::path abs = fs::absolute(path, ec);
  if (ec)
    abs = path;
  abs = abs.lexically_normal();
  /// "dir/" normalizes to "dir/" with an empty filename; drop it
  if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
    abs = abs.parent_path();
  return abs;
}

} // namespace

CleanupAgent::CleanupAgent(std::string source_root, bool clean_original,
                           bool remove_empty_dirs)
    : source_root_(std::move(source_root)), clean_original_(clean_original),
      remove_empty_dirs_(remove_empty_dirs) {}

ErrorKind CleanupAgent::cleanup(const PipelineRecord &record,
                                CleanupReport &report) const {
  std::error_code ec;
  size_t problems_before = report.problems.size();

  if (!record.remux_path.empty()) {
    if (fs::remove(record.remux_path, ec)) {
      report.removed.push_back(record.remux_path);
    } else if (ec) {
      report.problems.push_back(
          fmt::format("remove {}: {}", record.remux_path, ec.message()));
    }
  }

  if (clean_original_) {
    ec.clear();
    if (fs::remove(record.source_path, ec)) {
      report.removed.push_back(record.source_path);
    } else if (ec) {
      report.problems.push_back(
          fmt::format("remove {}: {}", record.source_path, ec.message()));
    }

    if (remove_empty_dirs_) {
      remove_empty_parents(
          normal_absolute(record.source_path).parent_path().string(), report);
    }
  }

  for (size_t i = problems_before; i < report.problems.size(); ++i)
    LOG_WARN("Cleanup: {}", report.problems[i]);

  return report.problems.size() == problems_before ? ErrorKind::None
                                                   : ErrorKind::CleanupPartial;
}

bool CleanupAgent::remove_empty_parents(const std::string &dir,
                                        CleanupReport &report) const {
  if (source_root_.empty())
    return true;

  const fs::path root = normal_absolute(source_root_);
  fs::path current = normal_absolute(dir);

  while (strictly_inside(root, current)) {
    std::error_code ec;
    if (!fs::is_directory(current, ec))
      break;
    if (!fs::is_empty(current, ec)) {
      if (ec) {
        report.problems.push_back(
            fmt::format("list {}: {}", current.string(), ec.message()));
        return false;
      }
      break;
    }
    if (!fs::remove(current, ec)) {
      if (!ec)
        break;
      report.problems.push_back(
          fmt::format("rmdir {}: {}", current.string(), ec.message()));
      return false;
    }
    report.removed.push_back(current.string());
    current = current.parent_path();
  }
  return true;
}

} // namespace media_relay
