/**
 * @file config.cpp
 * @brief Environment parsing and Settings assembly
 */

#include "media_relay/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <fmt/core.h>

#include "media_relay/logging.hpp"

namespace media_relay {

namespace {

std::string trim(const std::string &s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // namespace

namespace Config {

bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  std::string v = to_lower(trim(val));
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  LOG_WARN("{}='{}' is not a boolean; using {}", name, val, default_val);
  return default_val;
}

std::vector<std::string> get_env_list(const char *name,
                                      const std::vector<std::string> &default_val) {
  const char *val = std::getenv(name);
  if (!val)
    return default_val;

  std::vector<std::string> out;
  std::string item;
  for (const char *p = val;; ++p) {
    if (*p == ',' || *p == '\0') {
      std::string t = to_lower(trim(item));
      if (!t.empty())
        out.push_back(t);
      item.clear();
      if (*p == '\0')
        break;
    } else {
      item += *p;
    }
  }
  return out;
}

bool load_env_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return false;

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string t = trim(line);
    if (t.empty() || t[0] == '#')
      continue;
    if (t.compare(0, 7, "export ") == 0)
      t = trim(t.substr(7));

    size_t eq = t.find('=');
    if (eq == std::string::npos || eq == 0) {
      LOG_WARN("{}:{}: ignoring malformed line", path, line_no);
      continue;
    }
    std::string key = trim(t.substr(0, eq));
    std::string value = trim(t.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    setenv(key.c_str(), value.c_str(), 0);
  }
  return true;
}

} // namespace Config

Settings load_settings() {
  std::string env_file =
      Config::get_env_string("MEDIA_RELAY_ENV_FILE", "config/media_relay.env");
  if (Config::load_env_file(env_file))
    LOG_INFO("Loaded settings from {}", env_file);

  Settings s;
  s.source_dir = Config::get_env_string("SOURCE_DIR", s.source_dir);
  s.temp_dir = Config::get_env_string("TEMP_DIR", s.temp_dir);
  s.ledger_path = Config::get_env_string("LEDGER_PATH", s.ledger_path);

  s.dry_run = Config::get_env_bool("DRY_RUN", s.dry_run);
  s.watch_mode = Config::get_env_bool("WATCH_MODE", s.watch_mode);
  s.parallel_workers = Config::get_env_int("PARALLEL_WORKERS", s.parallel_workers);
  s.watch_interval_sec =
      Config::get_env_int("WATCH_INTERVAL_SEC", s.watch_interval_sec);
  s.stable_seconds = Config::get_env_int("STABLE_SECONDS", s.stable_seconds);

  // **----- SHARE -----**
  ShareSettings &sh = s.share;
  sh.backend = to_lower(Config::get_env_string("SHARE_BACKEND", sh.backend));
  sh.local_root = Config::get_env_string("LOCAL_SHARE_ROOT", sh.local_root);
  sh.server = Config::get_env_string("SMB_SERVER", sh.server);
  sh.share = Config::get_env_string("SMB_SHARE", sh.share);
  sh.username = Config::get_env_string("SMB_USERNAME", sh.username);
  sh.password = Config::get_env_string("SMB_PASSWORD", sh.password);
  sh.workgroup = Config::get_env_string("SMB_WORKGROUP", sh.workgroup);
  sh.timeout_ms = Config::get_env_int("SMB_TIMEOUT_MS", sh.timeout_ms);
  /// SMB_BASE_PATH="" places destinations at the share root
  if (const char *base = std::getenv("SMB_BASE_PATH"))
    sh.base_path = normalize_prefix(base);

  // **----- DESTINATIONS -----**
  DestinationTemplate &d = s.destinations;
  d.english_movies = Config::get_env_string("ENGLISH_MOVIE_PATH", d.english_movies);
  d.english_tv = Config::get_env_string("ENGLISH_TV_PATH", d.english_tv);
  d.malayalam_movies =
      Config::get_env_string("MALAYALAM_MOVIE_PATH", d.malayalam_movies);
  d.malayalam_tv = Config::get_env_string("MALAYALAM_TV_PATH", d.malayalam_tv);
  d.organize_episodes =
      Config::get_env_bool("ORGANIZE_EPISODES", d.organize_episodes);

  // **----- LANGUAGE POLICY -----**
  LanguagePolicy &lp = s.language_policy;
  lp.enabled = Config::get_env_bool("EXTRACT_AUDIO_TRACKS", lp.enabled);
  lp.audio_languages =
      Config::get_env_list("PREFERRED_AUDIO_LANGS", lp.audio_languages);
  lp.subtitle_languages =
      Config::get_env_list("PREFERRED_SUBTITLE_LANGS", lp.subtitle_languages);
  lp.fallback_to_original =
      Config::get_env_bool("REMUX_FALLBACK_TO_ORIGINAL", lp.fallback_to_original);

  // **----- TRANSFER -----**
  int chunk_kb = Config::get_env_int(
      "TRANSFER_CHUNK_KB", static_cast<int>(s.transfer.chunk_size / 1024));
  if (chunk_kb > 0)
    s.transfer.chunk_size = static_cast<size_t>(chunk_kb) * 1024;
  s.transfer.retry_base_delay_ms =
      Config::get_env_int("RETRY_BASE_DELAY_MS", s.transfer.retry_base_delay_ms);
  s.transfer.retry_max_delay_ms =
      Config::get_env_int("RETRY_MAX_DELAY_MS", s.transfer.retry_max_delay_ms);

  // **----- CLEANUP / LEDGER -----**
  s.cleanup_enabled = Config::get_env_bool("CLEANUP_ENABLED", s.cleanup_enabled);
  s.clean_original_files =
      Config::get_env_bool("CLEAN_ORIGINAL_FILES", s.clean_original_files);
  s.cleanup_empty_dirs =
      Config::get_env_bool("CLEANUP_EMPTY_DIRS", s.cleanup_empty_dirs);
  s.dedup_by_hash = Config::get_env_bool("DEDUP_BY_HASH", s.dedup_by_hash);
  s.retry_failed_on_rescan =
      Config::get_env_bool("RETRY_FAILED_ON_RESCAN", s.retry_failed_on_rescan);

  return s;
}

bool validate_settings(const Settings &settings,
                       std::vector<std::string> &problems) {
  size_t before = problems.size();

  settings.destinations.validate(problems);

  const ShareSettings &sh = settings.share;
  if (sh.backend == "smb") {
    if (sh.server.empty())
      problems.push_back("SMB_SERVER is not set");
    if (sh.share.empty())
      problems.push_back("SMB_SHARE is not set");
    if (sh.username.empty())
      problems.push_back("SMB_USERNAME is not set");
  } else if (sh.backend == "local") {
    if (sh.local_root.empty())
      problems.push_back("LOCAL_SHARE_ROOT is not set");
  } else {
    problems.push_back(
        fmt::format("SHARE_BACKEND '{}' is not smb or local", sh.backend));
  }

  if (settings.language_policy.enabled &&
      settings.language_policy.audio_languages.empty())
    problems.push_back("PREFERRED_AUDIO_LANGS is empty");
  if (settings.parallel_workers < 1)
    problems.push_back("PARALLEL_WORKERS must be at least 1");
  if (settings.transfer.retry_base_delay_ms < 0 ||
      settings.transfer.retry_max_delay_ms < settings.transfer.retry_base_delay_ms)
    problems.push_back("RETRY_BASE_DELAY_MS/RETRY_MAX_DELAY_MS are inconsistent");
  if (settings.temp_dir.empty())
    problems.push_back("TEMP_DIR is empty");
  if (settings.ledger_path.empty())
    problems.push_back("LEDGER_PATH is empty");

  return problems.size() == before;
}

void print_settings(const Settings &s) {
  auto join = [](const std::vector<std::string> &v) {
    std::string out;
    for (const auto &item : v)
      out += (out.empty() ? "" : ",") + item;
    return out.empty() ? std::string("(all)") : out;
  };

  LOG_PHASE("\n========== CONFIGURATION ==========");
  LOG_INFO("Source:        {}", s.source_dir.empty() ? "(none)" : s.source_dir);
  LOG_INFO("Temp dir:      {}", s.temp_dir);
  LOG_INFO("Ledger:        {}", s.ledger_path);
  LOG_INFO("Workers:       {}", s.parallel_workers);
  LOG_INFO("Dry run:       {}", s.dry_run);
  if (s.share.backend == "smb") {
    LOG_INFO("Share:         smb://{}/{}/{} as {} ({})", s.share.server,
             s.share.share, s.share.base_path, s.share.username,
             s.share.password.empty() ? "no password" : "password set");
  } else {
    LOG_INFO("Share:         {} ({})", s.share.local_root, s.share.backend);
  }
  LOG_INFO("Movies:        {} | {}", s.destinations.english_movies,
           s.destinations.malayalam_movies);
  LOG_INFO("TV shows:      {} | {}", s.destinations.english_tv,
           s.destinations.malayalam_tv);
  LOG_INFO("Audio keep:    {} (remux {}, fallback {})",
           join(s.language_policy.audio_languages), s.language_policy.enabled,
           s.language_policy.fallback_to_original);
  LOG_INFO("Subtitle keep: {}", join(s.language_policy.subtitle_languages));
  LOG_INFO("Cleanup:       {} (originals {}, empty dirs {})", s.cleanup_enabled,
           s.clean_original_files, s.cleanup_empty_dirs);
  LOG_PHASE("===================================\n");
}

} // namespace media_relay
