/**
 * @file pipeline.cpp
 * @brief Per-file pipeline implementation
 *
 * @details Stage order and the ledger transition each stage commits:
 *
 *          - classify_stage  DISCOVERED   -> CLASSIFIED | SKIPPED | FAILED
 *
 *          - route_stage     CLASSIFIED   -> REMUXING | TRANSFERRING | SKIPPED
 *
 *          - remux_stage     REMUXING     -> TRANSFERRING | FAILED
 *
 *          - transfer_stage  TRANSFERRING -> VERIFIED | FAILED
 *
 *          - cleanup_stage   VERIFIED     -> CLEANED_UP | CLEANED_UP_PARTIAL
 */

#include "media_relay/pipeline.hpp"

#include <chrono>
#include <filesystem>

#include <fmt/core.h>

#include "media_relay/checksum.hpp"
#include "media_relay/classifier.hpp"
#include "media_relay/cleanup_agent.hpp"
#include "media_relay/logging.hpp"
#include "media_relay/path_builder.hpp"
#include "media_relay/remuxer.hpp"
#include "media_relay/system.hpp"
#include "media_relay/transfer_manager.hpp"

namespace media_relay {

namespace fs = std::filesystem;

namespace {

const char *HASH_KEY_PREFIX = "sha256:";

std::string file_name_of(const std::string &path) {
  return fs::path(path).filename().string();
}

long elapsed_us(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

// **---- Constructor ----**

FilePipeline::FilePipeline(const Settings &settings, Ledger &ledger,
                           ShareClient &client, const CancellationToken *cancel,
                           int worker_id)
    : settings_(settings), ledger_(ledger), client_(client), cancel_(cancel),
      worker_id_(worker_id) {}

// **---- Logging Helpers ----**

void FilePipeline::log_info(const std::string &msg) const {
  if (worker_id_ >= 0) {
    LOG_INFO("[Worker {}] {}", worker_id_, msg);
  } else {
    LOG_INFO("{}", msg);
  }
}

void FilePipeline::log_warn(const std::string &msg) const {
  if (worker_id_ >= 0) {
    LOG_WARN("[Worker {}] {}", worker_id_, msg);
  } else {
    LOG_WARN("{}", msg);
  }
}

void FilePipeline::log_error(const std::string &msg) const {
  if (worker_id_ >= 0) {
    LOG_ERROR("[Worker {}] {}", worker_id_, msg);
  } else {
    LOG_ERROR("{}", msg);
  }
}

// **---- Entry Points ----**

FileOutcome FilePipeline::run(const std::string &source_path) {
  auto start = std::chrono::steady_clock::now();

  std::error_code ec;
  fs::path abs = fs::absolute(source_path, ec);
  std::string path = ec ? source_path : abs.lexically_normal().string();

  FileOutcome out;
  out.source_path = path;

  ec.clear();
  bool present = fs::is_regular_file(path, ec);
  uint64_t size = present ? fs::file_size(path, ec) : 0;
  if (!present || ec) {
    log_warn(fmt::format("Not found: {}", path));
    out.state = PipelineState::Failed;
    out.reason = error_name(ErrorKind::NotFound);
    return out;
  }

  if (settings_.dry_run)
    return plan(path, size);

  std::string key = path;
  if (settings_.dedup_by_hash) {
    std::string hex;
    TIMER_START(hash);
    bool hashed = sha256_file(path, hex);
    TIMER_END(hash);
    if (!hashed) {
      log_warn(fmt::format("Cannot read {}", path));
      out.state = PipelineState::Failed;
      out.reason = error_name(ErrorKind::NotFound);
      return out;
    }
    key = HASH_KEY_PREFIX + hex;
  }

  bool created = false;
  PipelineRecord record = ledger_.discover(
      key, path, size, settings_.retry_failed_on_rescan, created);

  if (!created) {
    FileOutcome existing = outcome_of(record);
    existing.existing = true;
    if (record.source_path != path) {
      log_info(fmt::format("Skipping {}: same content as {} ({})",
                           file_name_of(path), record.source_path,
                           to_string(record.state)));
    } else {
      log_info(fmt::format("Skipping {}: already {}", file_name_of(path),
                           to_string(record.state)));
    }
    return existing;
  }

  log_info(fmt::format("Discovered {} ({}) as record {}", file_name_of(path),
                       format_bytes(size), record.id));

  Context ctx;
  drive(record, ctx);

  FileOutcome result = outcome_of(record);
  result.processing_time_us = elapsed_us(start);
  return result;
}

FileOutcome FilePipeline::resume(PipelineRecord record) {
  auto start = std::chrono::steady_clock::now();

  if (settings_.dry_run)
    return plan(record.source_path, record.file_size);

  log_info(fmt::format("Resuming record {} ({}) from {}", record.id,
                       file_name_of(record.source_path),
                       to_string(record.state)));

  Context ctx;
  drive(record, ctx);

  FileOutcome result = outcome_of(record);
  result.processing_time_us = elapsed_us(start);
  return result;
}

// **---- State Driver ----**

void FilePipeline::drive(PipelineRecord &record, Context &ctx) {
  while (!is_terminal(record.state)) {
    /// Once VERIFIED the file is on the share; only cleanup remains
    if (record.state != PipelineState::Verified && cancel_pending(record)) {
      fail(record, ErrorKind::Cancelled, "cancelled");
      return;
    }

    bool committed = false;
    switch (record.state) {
    case PipelineState::Discovered:
      committed = classify_stage(record, ctx);
      break;
    case PipelineState::Classified:
      committed = route_stage(record, ctx);
      break;
    case PipelineState::Remuxing:
      committed = remux_stage(record, ctx);
      break;
    case PipelineState::Transferring:
      committed = transfer_stage(record);
      break;
    case PipelineState::Verified:
      if (!settings_.cleanup_enabled) {
        log_info(fmt::format("Cleanup disabled; {} stays VERIFIED",
                             file_name_of(record.source_path)));
        return;
      }
      committed = cleanup_stage(record);
      break;
    default:
      return;
    }

    if (!committed) {
      if (!is_terminal(record.state)) {
        log_warn(fmt::format("Record {} is {} in another worker; leaving it",
                             record.id, to_string(record.state)));
      }
      return;
    }
  }
}

bool FilePipeline::cancel_pending(const PipelineRecord &record) const {
  if (cancel_ && cancel_->requested())
    return true;
  return ledger_.cancel_requested(record.id);
}

bool FilePipeline::fail(PipelineRecord &record, ErrorKind kind,
                        const std::string &detail) {
  if (!ledger_.transition(record, PipelineState::Failed, kind, detail))
    return false;

  record.last_error = detail;
  log_error(fmt::format("{} FAILED ({}): {}", file_name_of(record.source_path),
                        error_name(kind), detail));

  if (!record.remux_path.empty()) {
    std::error_code ec;
    fs::remove(record.remux_path, ec);
    if (ec)
      log_warn(fmt::format("Cannot remove {}: {}", record.remux_path,
                           ec.message()));
  }
  return true;
}

// **---- Stages ----**

ErrorKind FilePipeline::inspect(const PipelineRecord &record, Context &ctx) {
  MediaInfo info;
  TIMER_START(inspect);
  ErrorKind err = inspector_.inspect(record.source_path, info);
  TIMER_END(inspect);
  if (err != ErrorKind::None)
    return err;

  ctx.file = Classifier::classify(record.source_path, record.file_size, &info);
  if (record.record_key.compare(0, 7, HASH_KEY_PREFIX) == 0)
    ctx.file.content_hash = record.record_key.substr(7);
  ctx.classified = true;
  return ErrorKind::None;
}

bool FilePipeline::classify_stage(PipelineRecord &record, Context &ctx) {
  ErrorKind err = inspect(record, ctx);
  if (err != ErrorKind::None)
    return fail(record, err, "container could not be inspected");

  const MediaFile &file = ctx.file;
  record.kind = to_string(file.kind);
  record.language = to_string(file.language);
  ledger_.set_classification(record.id, record.kind, record.language);

  if (file.kind == MediaKind::Unknown) {
    log_warn(fmt::format("{}: no episode marker or video stream; skipping",
                         file.file_name()));
    return ledger_.transition(record, PipelineState::Skipped,
                              ErrorKind::UnclassifiedMedia,
                              "could not be classified");
  }

  return ledger_.transition(
      record, PipelineState::Classified, ErrorKind::None,
      fmt::format("{}/{} \"{}\"", record.kind, record.language, file.title));
}

bool FilePipeline::route_stage(PipelineRecord &record, Context &ctx) {
  if (!ctx.classified) {
    ErrorKind err = inspect(record, ctx);
    if (err != ErrorKind::None)
      return fail(record, err, "container could not be inspected");
  }

  std::string destination;
  ErrorKind err =
      build_destination(ctx.file, settings_.destinations, destination);
  if (err != ErrorKind::None)
    return ledger_.transition(record, PipelineState::Skipped, err,
                              "no destination for this kind");

  record.destination_path = destination;
  ledger_.set_destination(record.id, destination);

  std::string collision;
  PipelineRecord holder;
  if (ledger_.destination_holder(destination, record.source_path, holder)) {
    log_warn(fmt::format("{} already holds {}; {} will replace it",
                         destination, holder.source_path, record.source_path));
    collision = fmt::format(" (replaces copy of {})", holder.source_path);
  }

  TrackSelection selection = select_tracks(ctx.file, settings_.language_policy);
  if (selection.needs_remux) {
    record.remux_path = remux_path_for(settings_.temp_dir, record.source_path,
                                       record.id);
    ledger_.set_remux_path(record.id, record.remux_path);
    return ledger_.transition(
        record, PipelineState::Remuxing, ErrorKind::None,
        fmt::format("keep {} of {} streams -> {}{}", selection.keep.size(),
                    ctx.file.tracks.size(), destination, collision));
  }

  if (settings_.language_policy.enabled && selection.matched_audio == 0 &&
      ctx.file.audio_language != Language::Other) {
    log_info(fmt::format("{}: no preferred audio track; sending as is",
                         ctx.file.file_name()));
  }
  return ledger_.transition(record, PipelineState::Transferring,
                            ErrorKind::None,
                            fmt::format("no remux -> {}{}", destination,
                                        collision));
}

bool FilePipeline::remux_stage(PipelineRecord &record, Context &ctx) {
  if (!ctx.classified) {
    ErrorKind err = inspect(record, ctx);
    if (err != ErrorKind::None)
      return fail(record, err, "container could not be inspected");
  }

  TrackSelection selection = select_tracks(ctx.file, settings_.language_policy);
  if (!selection.needs_remux) {
    record.remux_path.clear();
    ledger_.set_remux_path(record.id, "");
    return ledger_.transition(record, PipelineState::Transferring,
                              ErrorKind::None, "remux no longer needed");
  }

  if (record.remux_path.empty()) {
    record.remux_path = remux_path_for(settings_.temp_dir, record.source_path,
                                       record.id);
    ledger_.set_remux_path(record.id, record.remux_path);
  }

  std::error_code ec;
  fs::create_directories(settings_.temp_dir, ec);
  ErrorKind err = ErrorKind::RemuxFailed;
  if (ec) {
    log_error(fmt::format("Cannot create {}: {}", settings_.temp_dir,
                          ec.message()));
  } else {
    /// Artifact of an interrupted run
    fs::remove(record.remux_path, ec);

    log_info(fmt::format("Remuxing {}: keeping {} of {} streams",
                         ctx.file.file_name(), selection.keep.size(),
                         ctx.file.tracks.size()));
    TIMER_START(remux);
    err = Remuxer::remux(record.source_path, selection, record.remux_path,
                         cancel_);
    TIMER_END(remux);
  }

  if (err == ErrorKind::None)
    return ledger_.transition(record, PipelineState::Transferring,
                              ErrorKind::None,
                              fmt::format("remuxed to {}", record.remux_path));

  if (err == ErrorKind::RemuxFailed &&
      settings_.language_policy.fallback_to_original) {
    log_warn(fmt::format("Remux of {} failed; sending the original",
                         ctx.file.file_name()));
    record.remux_path.clear();
    ledger_.set_remux_path(record.id, "");
    return ledger_.transition(record, PipelineState::Transferring,
                              ErrorKind::None,
                              "remux failed, falling back to original");
  }
  return fail(record, err, "remux did not complete");
}

bool FilePipeline::transfer_stage(PipelineRecord &record) {
  std::string upload = record.source_path;
  if (!record.remux_path.empty()) {
    std::error_code ec;
    if (fs::is_regular_file(record.remux_path, ec)) {
      upload = record.remux_path;
    } else if (settings_.language_policy.fallback_to_original) {
      log_warn(fmt::format("Remux artifact {} is gone; sending the original",
                           record.remux_path));
      record.remux_path.clear();
      ledger_.set_remux_path(record.id, "");
      /// Bytes already on the share belong to the remuxed file
      record.bytes_transferred = 0;
      ledger_.update_progress(record.id, 0);
    } else {
      return fail(record, ErrorKind::RemuxFailed, "remux artifact missing");
    }
  }

  if (record.destination_path.empty())
    return fail(record, ErrorKind::UnclassifiedMedia, "no destination");

  const int64_t id = record.id;
  TransferHooks hooks;
  hooks.on_attempt = [this, id, &record](int attempt) {
    record.attempt_count = ledger_.record_attempt(id);
    if (attempt > 1)
      log_warn(fmt::format("Transfer attempt {} for {}", attempt,
                           file_name_of(record.source_path)));
  };
  hooks.on_progress = [this, id, &record](uint64_t bytes) {
    record.bytes_transferred = bytes;
    ledger_.update_progress(id, bytes);
  };
  hooks.should_cancel = [this, id] { return ledger_.cancel_requested(id); };

  TransferRequest request;
  request.local_path = upload;
  request.remote_path = record.destination_path;
  request.resume_offset = record.bytes_transferred;

  log_info(fmt::format("Transferring {} -> {}{}", file_name_of(upload),
                       record.destination_path,
                       request.resume_offset > 0
                           ? fmt::format(" (resuming at {})",
                                         format_bytes(request.resume_offset))
                           : std::string()));

  TransferManager manager(client_, settings_.transfer, cancel_);
  TIMER_START(transfer);
  TransferResult result = manager.transfer(request, hooks);
  TIMER_END(transfer);

  if (result.error != ErrorKind::None) {
    return fail(record, result.error,
                fmt::format("transfer failed while {} after {} attempt(s)",
                            to_string(result.failed_in), result.attempts));
  }

  record.checksum = result.checksum;
  ledger_.set_checksum(id, result.checksum);
  if (!ledger_.transition(record, PipelineState::Verified, ErrorKind::None,
                          fmt::format("{} sha256={}", format_bytes(result.bytes),
                                      result.checksum)))
    return false;

  LOG_SUCCESS("{}Verified {} on share ({}{})",
              worker_id_ >= 0 ? fmt::format("[Worker {}] ", worker_id_) : "",
              record.destination_path, format_bytes(result.bytes),
              result.already_present ? ", already present" : "");
  return true;
}

bool FilePipeline::cleanup_stage(PipelineRecord &record) {
  CleanupAgent agent(settings_.source_dir, settings_.clean_original_files,
                     settings_.cleanup_empty_dirs);
  CleanupReport report;

  TIMER_START(cleanup);
  ErrorKind err = agent.cleanup(record, report);
  TIMER_END(cleanup);

  if (err == ErrorKind::None) {
    return ledger_.transition(
        record, PipelineState::CleanedUp, ErrorKind::None,
        fmt::format("removed {} local item(s)", report.removed.size()));
  }

  std::string detail;
  for (const auto &problem : report.problems)
    detail += (detail.empty() ? "" : "; ") + problem;
  return ledger_.transition(record, PipelineState::CleanedUpPartial, err,
                            detail);
}

// **---- Results ----**

FileOutcome FilePipeline::outcome_of(const PipelineRecord &record) const {
  FileOutcome out;
  out.source_path = record.source_path;
  out.record_id = record.id;
  out.recorded = true;
  out.state = record.state;
  out.reason = record.reason;
  out.destination = record.destination_path;
  out.attempts = record.attempt_count;
  out.bytes = record.bytes_transferred;
  return out;
}

FileOutcome FilePipeline::plan(const std::string &source_path, uint64_t size) {
  FileOutcome out;
  out.source_path = source_path;
  out.planned = true;

  MediaInfo info;
  ErrorKind err = inspector_.inspect(source_path, info);
  if (err != ErrorKind::None) {
    out.state = PipelineState::Failed;
    out.reason = error_name(err);
    log_warn(fmt::format("[DRY RUN] {}: {}", file_name_of(source_path),
                         out.reason));
    return out;
  }

  MediaFile file = Classifier::classify(source_path, size, &info);
  if (build_destination(file, settings_.destinations, out.destination) !=
      ErrorKind::None) {
    out.state = PipelineState::Skipped;
    out.reason = error_name(ErrorKind::UnclassifiedMedia);
    log_info(fmt::format("[DRY RUN] {}: would skip (unclassified)",
                         file.file_name()));
    return out;
  }

  TrackSelection selection = select_tracks(file, settings_.language_policy);
  out.state = PipelineState::Classified;
  out.bytes = size;
  log_info(fmt::format(
      "[DRY RUN] {} -> {} ({}/{}, {})", file.file_name(), out.destination,
      to_string(file.kind), to_string(file.language),
      selection.needs_remux
          ? fmt::format("remux keeps {} of {} streams", selection.keep.size(),
                        file.tracks.size())
          : std::string("no remux")));
  return out;
}

} // namespace media_relay
