/**
 * @file job_queue.cpp
 * @brief Merge job queue and result collection implementation
 */

#include "dashcam_merge/job_queue.hpp"

namespace dashcam_merge {

// **----- JobQueue Implementation -----**

void JobQueue::push(QueuedJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
}

bool JobQueue::pop(QueuedJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });
  if (jobs_.empty())
    return false;
  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void JobQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

std::vector<QueuedJob> JobQueue::cancel() {
  std::vector<QueuedJob> dropped;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    dropped.reserve(jobs_.size());
    while (!jobs_.empty()) {
      dropped.push_back(std::move(jobs_.front()));
      jobs_.pop();
    }
    done_.store(true);
  }
  cv_.notify_all();
  return dropped;
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

// **----- ResultCollector Implementation -----**

ResultCollector::ResultCollector(size_t n) : results_(n) {}

void ResultCollector::add(size_t index, MergeResult &&result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= results_.size())
    results_.resize(index + 1);
  results_[index] = std::move(result);
}

std::vector<MergeResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<MergeResult> out;
  out.reserve(results_.size());
  for (auto &slot : results_) {
    if (slot)
      out.push_back(std::move(*slot));
  }
  results_.clear();
  return out;
}

} // namespace dashcam_merge
