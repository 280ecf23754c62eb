/**
 * @file job_queue.cpp
 * @brief Thread-safe job queue implementation
 */

#include "media_relay/job_queue.hpp"

namespace media_relay {

bool JobQueue::push(PipelineJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (done || !active.insert(job.source_path).second)
      return false;
    jobs.push_back(std::move(job));
  }
  cv.notify_one();
  return true;
}

bool JobQueue::pop(PipelineJob &job) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !jobs.empty() || done; });
  if (jobs.empty())
    return false;
  job = std::move(jobs.front());
  jobs.pop_front();
  return true;
}

void JobQueue::complete(const std::string &source_path) {
  std::lock_guard<std::mutex> lock(mutex);
  active.erase(source_path);
}

bool JobQueue::contains(const std::string &source_path) {
  std::lock_guard<std::mutex> lock(mutex);
  return active.count(source_path) > 0;
}

size_t JobQueue::size() {
  std::lock_guard<std::mutex> lock(mutex);
  return jobs.size();
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done = true;
  }
  cv.notify_all();
}

void JobQueue::reopen() {
  std::lock_guard<std::mutex> lock(mutex);
  done = false;
}

} // namespace media_relay
