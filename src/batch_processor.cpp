/**
 * @file batch_processor.cpp
 * @brief Worker pool implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Shared job queue for load balancing across workers
 *
 *          - One share session per worker
 *
 *          - Directory polling with a stability check (watch mode)
 *
 *          - Sequential summary output
 */

#include "media_relay/batch_processor.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "media_relay/logging.hpp"
#include "media_relay/system.hpp"

namespace media_relay {

namespace fs = std::filesystem;

BatchProcessor::BatchProcessor(const Settings &settings, Ledger &ledger,
                               CancellationToken &cancel,
                               ShareClientFactory factory)
    : settings_(settings), ledger_(ledger), cancel_(cancel),
      factory_(std::move(factory)),
      num_workers_(std::max(1, settings.parallel_workers)) {}

int BatchProcessor::process(const std::vector<std::string> &inputs) {
  std::vector<std::string> files;
  for (const auto &input : inputs) {
    std::error_code ec;
    if (fs::is_directory(input, ec)) {
      auto found = collect_media_files(input);
      LOG_INFO("Found {} media file(s) in {}", found.size(), input);
      files.insert(files.end(), found.begin(), found.end());
    } else {
      /// Explicit files are passed on even when missing: the pipeline
      /// reports them as NotFound
      files.push_back(fs::absolute(input, ec).lexically_normal().string());
    }
  }
  return run_batch(files, "");
}

int BatchProcessor::watch(const std::string &directory) {
  return run_batch({}, directory);
}

std::vector<FileOutcome> BatchProcessor::results() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return results_;
}

int BatchProcessor::run_batch(const std::vector<std::string> &files,
                              const std::string &watch_dir) {
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results_.clear();
  }
  files_done_.store(0);
  total_files_.store(0);
  queued_sizes_.clear();
  TimingCollector::clear();

  /// One session per worker, created up front so a bad backend fails fast
  std::vector<std::unique_ptr<ShareClient>> clients;
  for (int i = 0; i < num_workers_; ++i) {
    clients.push_back(factory_(settings_.share));
    if (!clients.back()) {
      LOG_ERROR("Cannot create a share client for backend '{}'",
                settings_.share.backend);
      return -1;
    }
  }
  queue_.reopen();

  int resumed = settings_.dry_run ? 0 : enqueue_resumable();
  for (const auto &file : files)
    enqueue_file(file);

  if (total_files_.load() == 0 && watch_dir.empty()) {
    LOG_WARN("No input files to process");
    return 0;
  }

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Files queued: {} ({} resumed)", total_files_.load(), resumed);
  LOG_INFO("Workers: {}", num_workers_);
  if (settings_.share.backend == "smb") {
    LOG_INFO("Share: smb://{}/{}/{}", settings_.share.server,
             settings_.share.share, settings_.share.base_path);
  } else {
    LOG_INFO("Share: {} ({})", settings_.share.local_root,
             settings_.share.backend);
  }
  if (settings_.dry_run)
    LOG_INFO("Dry run: nothing is transferred or recorded");
  LOG_PHASE("=======================================================");

  /// Start wall-clock timer
  auto batch_start = std::chrono::steady_clock::now();

  std::vector<std::thread> workers;
  for (int i = 0; i < num_workers_; ++i) {
    workers.emplace_back(&BatchProcessor::worker, this, i, clients[i].get());
  }

  // **---- WATCH MODE ----**

  if (!watch_dir.empty()) {
    LOG_INFO("Starting Watch Mode on directory: {}", watch_dir);
    monitor_directory(watch_dir);
  }

  queue_.finish();
  for (auto &w : workers)
    w.join();

  for (auto &client : clients)
    client->disconnect();

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();
  print_batch_summary(elapsed_sec);

  int failures = 0;
  for (const auto &result : results()) {
    if (result.failed())
      failures++;
  }
  return failures;
}

int BatchProcessor::enqueue_resumable() {
  int count = 0;
  for (const auto &record : ledger_.resumable()) {
    if (queue_.push({record.source_path, record.id})) {
      ++total_files_;
      ++count;
    }
  }
  return count;
}

void BatchProcessor::enqueue_file(const std::string &path) {
  if (queue_.push({path, 0}))
    ++total_files_;
}

void BatchProcessor::worker(int worker_id, ShareClient *client) {
  FilePipeline pipeline(settings_, ledger_, *client, &cancel_, worker_id);

  PipelineJob job;
  while (queue_.pop(job)) {
    if (cancel_.requested()) {
      queue_.complete(job.source_path);
      continue;
    }

    LOG_PHASE("[Worker {}] ----------------------------------------",
              worker_id);
    LOG_INFO("[Worker {}] Processing: {}", worker_id,
             fs::path(job.source_path).filename().string());
    LOG_INFO("[Worker {}] Progress: {}/{}", worker_id, files_done_.load() + 1,
             total_files_.load());

    FileOutcome outcome;
    try {
      PipelineRecord record;
      if (job.resume_id > 0 && ledger_.find(job.resume_id, record)) {
        outcome = pipeline.resume(record);
      } else {
        outcome = pipeline.run(job.source_path);
      }
    } catch (const std::exception &e) {
      LOG_ERROR("[Worker {}] {}: {}", worker_id, job.source_path, e.what());
      outcome.source_path = job.source_path;
      outcome.state = PipelineState::Failed;
      outcome.reason = e.what();
    }
    queue_.complete(job.source_path);

    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      results_.push_back(outcome);
    }
    ++files_done_;

    std::string name = fs::path(outcome.source_path).filename().string();
    if (outcome.failed()) {
      LOG_ERROR("[Worker {}] Failed: {} ({})", worker_id, name, outcome.reason);
    } else if (!outcome.existing) {
      LOG_SUCCESS("[Worker {}] Completed: {} -> {} ({:.1f}s)", worker_id, name,
                  to_string(outcome.state),
                  outcome.processing_time_us / 1000000.0);
    }
  }

  LOG_INFO("[Worker {}] Finished (no more files)", worker_id);
}

void BatchProcessor::monitor_directory(const std::string &directory) {
  const auto stable_for = std::chrono::seconds(std::max(0, settings_.stable_seconds));
  const auto interval =
      std::chrono::milliseconds(std::max(1, settings_.watch_interval_sec) * 1000);

  /// Sizes seen on the previous poll
  std::map<std::string, uint64_t> last_sizes;
  int poll_count = 0;

  while (!cancel_.requested()) {
    if (poll_count++ % 10 == 0) {
      LOG_INFO("[Watch] Monitoring directory: {} (Waiting for new files...)",
               directory);
    }

    std::map<std::string, uint64_t> sizes;
    for (const auto &path : collect_media_files(directory)) {
      std::error_code ec;
      uint64_t size = fs::file_size(path, ec);
      if (ec)
        continue;
      sizes[path] = size;

      auto queued = queued_sizes_.find(path);
      if (queued != queued_sizes_.end() && queued->second == size)
        continue;
      if (queue_.contains(path))
        continue;

      /// File is still growing if its size moved since the last poll or it
      /// was written too recently
      auto last = last_sizes.find(path);
      if (last != last_sizes.end() && last->second != size)
        continue;
      auto mtime = fs::last_write_time(path, ec);
      if (ec || fs::file_time_type::clock::now() - mtime < stable_for)
        continue;

      LOG_INFO("[Watch] New file detected: {}",
               fs::path(path).filename().string());
      queued_sizes_[path] = size;
      enqueue_file(path);
    }

    /// Forget files that went away (cleaned up or moved)
    for (auto it = queued_sizes_.begin(); it != queued_sizes_.end();) {
      if (sizes.count(it->first) == 0)
        it = queued_sizes_.erase(it);
      else
        ++it;
    }
    last_sizes.swap(sizes);

    if (cancel_.wait_for(interval))
      break;
  }

  LOG_INFO("[Watch] Stopping");
}

void BatchProcessor::print_batch_summary(double wall_clock_sec) {
  std::vector<FileOutcome> all = results();

  int total = static_cast<int>(all.size());
  int done = 0;
  int skipped = 0;
  int failed = 0;
  long total_time_us = 0;
  uint64_t bytes = 0;

  for (const auto &result : all) {
    if (result.failed()) {
      failed++;
    } else if (result.existing || result.state == PipelineState::Skipped) {
      skipped++;
    } else {
      done++;
      if (!result.planned)
        bytes += result.bytes;
    }
    total_time_us += result.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", total);
  fmt::print("{:<25} {:>25}\n", settings_.dry_run ? "Planned:" : "Transferred:",
             done);
  fmt::print("{:<25} {:>25}\n", "Skipped:", skipped);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Workers:", num_workers_);
  fmt::print("{:<25} {:>25}\n", "Data transferred:", format_bytes(bytes));
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of file times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  /// List failed files if any
  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &result : all) {
      if (result.failed()) {
        fmt::print(fg(fmt::color::red), "  - {} ({})\n",
                   fs::path(result.source_path).filename().string(),
                   result.reason);
      }
    }
    std::fflush(stdout);
  }

  TimingCollector::print_summary();
}

} // namespace media_relay
