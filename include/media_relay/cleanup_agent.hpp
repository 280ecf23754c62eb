/**
 * @file cleanup_agent.hpp
 * @brief Local cleanup after a confirmed transfer
 */

#ifndef MEDIA_RELAY_CLEANUP_AGENT_HPP
#define MEDIA_RELAY_CLEANUP_AGENT_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace media_relay {

struct CleanupReport {
  std::vector<std::string> removed;
  std::vector<std::string> problems;
};

/**
 * @class CleanupAgent
 * @brief Removes local leftovers of a VERIFIED record.
 *
 * @attention ORDER:
 *
 *   1. Temporary remux artifact (if any)
 *
 *   2. Original source file (only when clean_original is set)
 *
 *   3. Empty parent directories of the source (remove_empty_dirs),
 *      walking up to but never removing source_root or anything outside it
 */
class CleanupAgent {
  std::string source_root_;
  bool clean_original_;
  bool remove_empty_dirs_;

public:
  CleanupAgent(std::string source_root, bool clean_original,
               bool remove_empty_dirs = true);

  /**
   * @brief Clean up after one record.
   * @return None, or CleanupPartial when any step failed (details in report)
   */
  ErrorKind cleanup(const PipelineRecord &record, CleanupReport &report) const;

  /**
   * @brief Remove dir and its empty ancestors below source_root.
   * @return false when a removal failed; non-empty directories are not an
   *         error
   */
  bool remove_empty_parents(const std::string &dir,
                            CleanupReport &report) const;
};

} // namespace media_relay

#endif // MEDIA_RELAY_CLEANUP_AGENT_HPP
