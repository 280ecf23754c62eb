/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace of environment-variable readers and
 *          load_settings(), which assembles every option into one Settings
 *          value. See config/media_relay.env for detailed documentation of
 *          each parameter.
 *
 * @note An env file is loaded first (MEDIA_RELAY_ENV_FILE, default
 *       config/media_relay.env). Variables already present in the
 *       environment win over the file.
 */

#ifndef MEDIA_RELAY_CONFIG_HPP
#define MEDIA_RELAY_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include "path_builder.hpp"
#include "remuxer.hpp"
#include "share_client.hpp"
#include "transfer_manager.hpp"

namespace media_relay {
namespace Config {

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                   const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @note Unparsable values fall back to the default.
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  char *end = nullptr;
  long parsed = std::strtol(val, &end, 10);
  return (end && *end == '\0') ? static_cast<int>(parsed) : default_val;
}

/**
 * @brief Get a boolean value from environment variable.
 * @note Accepts 1/0, true/false, yes/no, on/off (any case).
 */
bool get_env_bool(const char *name, bool default_val);

/**
 * @brief Get a comma separated list from environment variable.
 * @return Lower-cased, trimmed, non-empty entries; default_val if unset
 */
std::vector<std::string> get_env_list(const char *name,
                                      const std::vector<std::string> &default_val);

/**
 * @brief Load KEY=VALUE lines into the environment.
 * @note Blank lines, '#' comments and an "export " prefix are allowed;
 *       surrounding quotes are stripped. Existing variables are kept.
 * @return false if the file could not be opened
 */
bool load_env_file(const std::string &path);

} // namespace Config

/**
 * @struct Settings
 * @brief Every runtime option, resolved once per process (or per test).
 */
struct Settings {
  std::string source_dir;
  std::string temp_dir = "/tmp/media_relay";
  std::string ledger_path = "data/media_relay.db";

  bool dry_run = false;
  bool watch_mode = false;
  int parallel_workers = 2;
  int watch_interval_sec = 30;
  int stable_seconds = 10; //< Size must stay unchanged this long in watch mode

  ShareSettings share;
  DestinationTemplate destinations;
  LanguagePolicy language_policy;
  TransferOptions transfer;

  bool cleanup_enabled = true;
  bool clean_original_files = true;
  bool cleanup_empty_dirs = true;
  bool dedup_by_hash = false;
  bool retry_failed_on_rescan = false;
};

/**
 * @brief Build Settings from the environment (after loading the env file).
 */
Settings load_settings();

/**
 * @brief Check settings for the check-config command and for startup.
 * @param problems Output: one message per violation
 * @return true when usable
 */
bool validate_settings(const Settings &settings,
                       std::vector<std::string> &problems);

/// Print the effective settings (password masked)
void print_settings(const Settings &settings);

} // namespace media_relay

#endif // MEDIA_RELAY_CONFIG_HPP
