/**
 * @file task_queue.cpp
 * @brief Project hand-out and result gathering
 */

#include "vidcap/task_queue.hpp"

#include <utility>

namespace vidcap {

// **----- TaskQueue -----**

void TaskQueue::submit(RenderTask task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push(std::move(task));
  }
  ready_.notify_one();
}

bool TaskQueue::take(RenderTask &task) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait(lock, [this] { return closed_ || !pending_.empty(); });
  if (pending_.empty())
    return false;
  task = std::move(pending_.front());
  pending_.pop();
  return true;
}

void TaskQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
}

size_t TaskQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

// **----- ResultCollector -----**

int ResultCollector::add(RenderResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!result.success)
    ++failures_;
  results_.push_back(std::move(result));
  return static_cast<int>(results_.size());
}

int ResultCollector::failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failures_;
}

std::vector<RenderResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_ = 0;
  return std::move(results_);
}

} // namespace vidcap
