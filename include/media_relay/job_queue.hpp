/**
 * @file job_queue.hpp
 * @brief Thread-safe queue of files waiting for a worker
 */

#ifndef MEDIA_RELAY_JOB_QUEUE_HPP
#define MEDIA_RELAY_JOB_QUEUE_HPP

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <string>

namespace media_relay {

/**
 * @struct PipelineJob
 * @brief One unit of work: a newly seen file or a record to resume.
 */
struct PipelineJob {
  std::string source_path;
  int64_t resume_id = 0; //< Ledger record id; 0 for a fresh file
};

/**
 * @class JobQueue
 * @brief Shared queue all workers pop from.
 *
 * @attention DESIGN:
 *
 * - A path is queued at most once while it is pending or being processed
 *
 * - pop() blocks until a job arrives or finish() was called
 *
 * @note The ledger is still the authority on who owns a file; the queue only
 *       avoids handing the same path to two workers of one process.
 */
class JobQueue {
  std::deque<PipelineJob> jobs;
  std::set<std::string> active;
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;

public:
  /**
   * @brief Add a job.
   * @return false when the path is already queued or in progress
   */
  bool push(PipelineJob job);

  /**
   * @brief Pop a job from the queue.
   * @note Blocks until a job is available or the queue is finished.
   * @return true if a job was retrieved, false if queue is empty and done
   */
  bool pop(PipelineJob &job);

  /// Called by a worker when it is done with a popped job
  void complete(const std::string &source_path);

  /// Is the path queued or being processed?
  bool contains(const std::string &source_path);

  size_t size();

  /**
   * @brief Signal that no more jobs will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();

  /// Accept jobs again after finish() (next batch)
  void reopen();
};

} // namespace media_relay

#endif // MEDIA_RELAY_JOB_QUEUE_HPP
