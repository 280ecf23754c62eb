/**
 * @file batch_processor.hpp
 * @brief Worker pool running many files through the pipeline
 *
 * @details The BatchProcessor class orchestrates parallel processing:
 *
 *          - Spawns PARALLEL_WORKERS worker threads
 *
 *          - Each worker owns one share session, reused for every file it
 *            handles and never shared
 *
 *          - Records left non-terminal by an earlier run are queued first
 *
 *          - In watch mode the source directory is polled and files are
 *            queued once they stopped growing
 *
 *          - Logging is worker-prefixed for clarity
 *
 * @note Different files run in parallel; one file is only ever advanced by
 *       the worker that won its ledger transition.
 */

#ifndef MEDIA_RELAY_BATCH_PROCESSOR_HPP
#define MEDIA_RELAY_BATCH_PROCESSOR_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "cancellation.hpp"
#include "config.hpp"
#include "job_queue.hpp"
#include "ledger.hpp"
#include "pipeline.hpp"
#include "share_client.hpp"

namespace media_relay {

/// Creates the share session of one worker
using ShareClientFactory =
    std::function<std::unique_ptr<ShareClient>(const ShareSettings &)>;

/**
 * @class BatchProcessor
 * @brief Orchestrates parallel file processing.
 */
class BatchProcessor {
public:
  BatchProcessor(const Settings &settings, Ledger &ledger,
                 CancellationToken &cancel,
                 ShareClientFactory factory = make_share_client);

  /**
   * @brief Process files and directories (searched recursively) once.
   * @return Number of files that ended in FAILED, or -1 when the workers
   *         could not be started
   */
  int process(const std::vector<std::string> &inputs);

  /**
   * @brief Process a directory and keep polling it until cancelled.
   * @return As process()
   */
  int watch(const std::string &directory);

  /// Outcomes of the last batch, in completion order
  std::vector<FileOutcome> results() const;

private:
  const Settings &settings_;
  Ledger &ledger_;
  CancellationToken &cancel_;
  ShareClientFactory factory_;

  int num_workers_;
  JobQueue queue_;
  std::atomic<int> files_done_{0};
  std::atomic<int> total_files_{0};

  mutable std::mutex results_mutex_;
  std::vector<FileOutcome> results_;

  /// Path -> size when it was queued (watch mode)
  std::map<std::string, uint64_t> queued_sizes_;

  int run_batch(const std::vector<std::string> &files,
                const std::string &watch_dir);

  /// Queue resumable ledger records; returns how many were queued
  int enqueue_resumable();

  void enqueue_file(const std::string &path);

  /**
   * @brief Worker function for each worker thread.
   * @param worker_id The worker's ID (0-indexed)
   * @param client The worker's share session
   */
  void worker(int worker_id, ShareClient *client);

  /**
   * @brief Poll a directory until cancelled, queueing stable new files.
   */
  void monitor_directory(const std::string &directory);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec);
};

} // namespace media_relay

#endif // MEDIA_RELAY_BATCH_PROCESSOR_HPP
