/**
 * @file main.cpp
 * @brief Entry point for the media_relay command line
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - run / watch: batch processing with BatchProcessor
 *
 *          - Ledger queries and maintenance (status, history, stats,
 *            cancel, purge, backup)
 *
 *          - check-config: validate settings and try the share
 *
 * @note All options come from the environment (see config/media_relay.env);
 *       --dry-run and --no-remux-fallback override them for one run.
 */

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

extern "C" {
#include <libavutil/log.h>
}

#include <fmt/color.h>
#include <fmt/core.h>

#include "media_relay/batch_processor.hpp"
#include "media_relay/cancellation.hpp"
#include "media_relay/config.hpp"
#include "media_relay/ledger.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/share_client.hpp"
#include "media_relay/system.hpp"

using namespace media_relay;

namespace {

void print_usage() {
  fmt::print("Usage: media_relay <command> [options] [args]\n\n"
             "Commands:\n"
             "  run [file|dir]...   Process files (default: SOURCE_DIR)\n"
             "  watch [dir]         Poll a directory until interrupted\n"
             "  status <path>       Show the newest record of a file\n"
             "  history <path>      Show every transition of a file\n"
             "  stats               Ledger statistics\n"
             "  cancel <path>       Cancel the in-flight record of a file\n"
             "  purge <days>        Delete finished records older than days\n"
             "  backup <file>       Copy the ledger database\n"
             "  check-config        Validate settings and try the share\n\n"
             "Options:\n"
             "  --dry-run           Log the plan; change nothing\n"
             "  --no-remux-fallback Fail instead of sending the original when a\n"
             "                      remux fails\n");
}

std::string absolute_path(const std::string &path) {
  std::error_code ec;
  std::filesystem::path abs = std::filesystem::absolute(path, ec);
  return ec ? path : abs.lexically_normal().string();
}

void print_record(const PipelineRecord &r) {
  fmt::print(fg(fmt::color::cyan), "============== RECORD {} ==============\n",
             r.id);
  fmt::print("{:<20} {}\n", "Source:", r.source_path);
  fmt::print("{:<20} {}\n", "Key:", r.record_key);
  fmt::print("{:<20} {}{}\n", "State:", to_string(r.state),
             r.reason.empty() ? "" : fmt::format(" ({})", r.reason));
  if (!r.kind.empty())
    fmt::print("{:<20} {}/{}\n", "Class:", r.kind, r.language);
  if (!r.destination_path.empty())
    fmt::print("{:<20} {}\n", "Destination:", r.destination_path);
  fmt::print("{:<20} {} of {}\n", "Transferred:", format_bytes(r.bytes_transferred),
             format_bytes(r.file_size));
  fmt::print("{:<20} {}\n", "Attempts:", r.attempt_count);
  if (!r.checksum.empty())
    fmt::print("{:<20} {}\n", "SHA-256:", r.checksum);
  if (!r.last_error.empty())
    fmt::print("{:<20} {}\n", "Last error:", r.last_error);
  if (r.cancel_requested)
    fmt::print("{:<20} {}\n", "Cancel:", "requested");
  fmt::print("{:<20} {}\n", "Created:", format_timestamp(r.created_at));
  fmt::print("{:<20} {}\n", "Updated:", format_timestamp(r.updated_at));
}

void print_stats(const LedgerStats &stats) {
  fmt::print(fg(fmt::color::cyan),
             "================= LEDGER STATISTICS =================\n");
  fmt::print("{:<30} {:>20}\n", "Records:", stats.total);
  fmt::print("{:<30} {:>20}\n", "Bytes verified:",
             format_bytes(stats.bytes_transferred));
  fmt::print(fg(fmt::color::cyan), "\nBy state\n");
  for (const auto &entry : stats.by_state)
    fmt::print("  {:<28} {:>20}\n", entry.first, entry.second);
  if (!stats.failures_by_reason.empty()) {
    fmt::print(fg(fmt::color::cyan), "\nFailures by reason\n");
    for (const auto &entry : stats.failures_by_reason)
      fmt::print("  {:<28} {:>20}\n", entry.first, entry.second);
  }
  if (!stats.by_destination_class.empty()) {
    fmt::print(fg(fmt::color::cyan), "\nBy destination class\n");
    for (const auto &entry : stats.by_destination_class)
      fmt::print("  {:<28} {:>20}\n", entry.first, entry.second);
  }
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");
}

int check_config(const Settings &settings) {
  print_settings(settings);

  std::vector<std::string> problems;
  if (!validate_settings(settings, problems)) {
    for (const auto &p : problems)
      LOG_ERROR("{}", p);
    return 1;
  }

  auto client = make_share_client(settings.share);
  if (!client)
    return 1;
  ErrorKind err = client->connect();
  if (err != ErrorKind::None) {
    LOG_ERROR("Share {}: {}", client->share_root(), error_name(err));
    return 1;
  }
  client->disconnect();
  LOG_SUCCESS("Configuration OK; share {} is reachable", client->share_root());
  return 0;
}

int run_batch(Settings &settings, const std::string &command,
              const std::vector<std::string> &args) {
  std::vector<std::string> problems;
  if (!validate_settings(settings, problems)) {
    for (const auto &p : problems)
      LOG_ERROR("{}", p);
    return 1;
  }

  bool watch = command == "watch" || (args.empty() && settings.watch_mode);
  std::vector<std::string> inputs = args;
  if (inputs.empty() && !settings.source_dir.empty())
    inputs.push_back(settings.source_dir);
  if (inputs.empty()) {
    LOG_ERROR("No input given and SOURCE_DIR is not set");
    return 1;
  }
  if (watch && inputs.size() != 1) {
    LOG_ERROR("watch takes exactly one directory");
    return 1;
  }
  if (settings.source_dir.empty() && watch)
    settings.source_dir = inputs[0];

  CancellationToken cancel;
  install_signal_handlers(cancel);

  Ledger ledger(settings.ledger_path);
  BatchProcessor processor(settings, ledger, cancel);

  int failures = watch ? processor.watch(inputs[0]) : processor.process(inputs);
  if (cancel.requested())
    LOG_WARN("Interrupted; unfinished records resume on the next run");
  return failures == 0 ? 0 : 1;
}

} // namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);
  av_log_set_level(AV_LOG_ERROR);

  std::string command;
  std::vector<std::string> args;
  bool dry_run = false;
  bool no_fallback = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "--no-remux-fallback") {
      no_fallback = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg.size() > 1 && arg[0] == '-') {
      LOG_WARN("Unknown option: {}", arg);
      print_usage();
      return 1;
    } else if (command.empty()) {
      command = arg;
    } else {
      args.push_back(arg);
    }
  }

  if (command.empty()) {
    print_usage();
    return 1;
  }

  Settings settings = load_settings();
  if (dry_run)
    settings.dry_run = true;
  if (no_fallback)
    settings.language_policy.fallback_to_original = false;

  try {
    if (command == "run" || command == "watch")
      return run_batch(settings, command, args);

    if (command == "check-config")
      return check_config(settings);

    if (command == "status" || command == "history" || command == "cancel") {
      if (args.size() != 1) {
        LOG_ERROR("{} takes one path", command);
        return 1;
      }
      Ledger ledger(settings.ledger_path);
      std::string path = absolute_path(args[0]);

      if (command == "status") {
        PipelineRecord record;
        if (!ledger.latest(path, record) && !ledger.latest(args[0], record)) {
          LOG_WARN("No record for {}", path);
          return 1;
        }
        print_record(record);
        return 0;
      }

      if (command == "history") {
        auto entries = ledger.history(path);
        if (entries.empty()) {
          LOG_WARN("No history for {}", path);
          return 1;
        }
        for (const auto &e : entries) {
          fmt::print("{}  #{:<5} {:>18} -> {:<18} {}\n",
                     format_timestamp(e.at), e.record_id, e.from_state,
                     e.to_state, e.detail);
        }
        return 0;
      }

      if (!ledger.request_cancel(path) && !ledger.request_cancel(args[0])) {
        LOG_WARN("No in-flight record for {}", path);
        return 1;
      }
      LOG_SUCCESS("Cancellation requested for {}", path);
      return 0;
    }

    if (command == "stats") {
      Ledger ledger(settings.ledger_path);
      print_stats(ledger.statistics());
      return 0;
    }

    if (command == "purge") {
      char *end = nullptr;
      long days = args.size() == 1 ? std::strtol(args[0].c_str(), &end, 10) : -1;
      if (args.size() != 1 || *end != '\0' || days < 0) {
        LOG_ERROR("purge takes a number of days");
        return 1;
      }
      Ledger ledger(settings.ledger_path);
      int removed = ledger.purge_terminal_before(unix_now() - days * 86400);
      LOG_SUCCESS("Purged {} record(s) older than {} day(s)", removed, days);
      return 0;
    }

    if (command == "backup") {
      if (args.size() != 1) {
        LOG_ERROR("backup takes a destination file");
        return 1;
      }
      Ledger ledger(settings.ledger_path);
      ledger.backup_to(args[0]);
      LOG_SUCCESS("Ledger copied to {}", args[0]);
      return 0;
    }
  } catch (const LedgerError &e) {
    LOG_ERROR("Ledger {}: {}", settings.ledger_path, e.what());
    return 1;
  }

  LOG_WARN("Unknown command: {}", command);
  print_usage();
  return 1;
}
