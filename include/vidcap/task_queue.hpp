/**
 * @file task_queue.hpp
 * @brief Project hand-out and result gathering for batch workers
 */

#ifndef VIDCAP_TASK_QUEUE_HPP
#define VIDCAP_TASK_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

#include "types.hpp"

namespace vidcap {

/**
 * @struct RenderTask
 * @brief A discovered project and its position in the batch.
 */
struct RenderTask {
  int job_id = -1;
  ProjectInput project;
};

/**
 * @class TaskQueue
 * @brief Projects waiting for a free worker.
 *
 * @details Workers take the next project as soon as they finish one, so a
 *          long narration on one worker never stalls the rest of the batch.
 *          Once close() is called, take() drains what is left and then
 *          returns false.
 */
class TaskQueue {
  std::queue<RenderTask> pending_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  bool closed_ = false;

public:
  /// Queue a project; wakes one idle worker.
  void submit(RenderTask task);

  /**
   * @brief Wait for the next project.
   * @return false once the queue is closed and empty
   */
  bool take(RenderTask &task);

  /// No more submissions; idle workers wake up and exit.
  void close();

  /// Projects not yet taken by a worker
  size_t pending() const;
};

/**
 * @class ResultCollector
 * @brief Gathers finished projects from all workers.
 */
class ResultCollector {
  std::vector<RenderResult> results_;
  int failures_ = 0;
  mutable std::mutex mutex_;

public:
  explicit ResultCollector(size_t expected) { results_.reserve(expected); }

  /**
   * @brief Record one finished project.
   * @return Number of projects finished so far, this one included
   */
  int add(RenderResult result);

  int failures() const;

  /// Hand over everything collected, in completion order.
  std::vector<RenderResult> extract();
};

} // namespace vidcap

#endif // VIDCAP_TASK_QUEUE_HPP
