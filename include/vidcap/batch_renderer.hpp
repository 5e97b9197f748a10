/**
 * @file batch_renderer.hpp
 * @brief Parallel rendering of many project folders
 *
 * @details The BatchRenderer class orchestrates parallel rendering:
 *
 *          - Spawns PARALLEL_JOBS worker threads
 *
 *          - Each worker owns one pre-allocated processor slot (speech model
 *            service), so a model is loaded at most once per worker
 *
 *          - A shared queue distributes project folders across workers
 *
 *          - A failed job never stops the batch; each folder gets its own
 *            RenderResult
 *
 *          - Logging is job- and worker-prefixed for clarity
 *
 * @note Progress and completion callbacks run on worker threads but are
 *       serialized, so callers need no locking of their own.
 */

#ifndef VIDCAP_BATCH_RENDERER_HPP
#define VIDCAP_BATCH_RENDERER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "render_job.hpp"
#include "render_settings.hpp"
#include "task_queue.hpp"
#include "transcription_service.hpp"
#include "types.hpp"

namespace vidcap {

/// Creates the speech backend for a worker slot
using BackendFactory =
    std::function<std::unique_ptr<TranscriptionBackend>(int slot_id)>;

/// Receives each job's terminal result
using CompletionCallback = std::function<void(const RenderResult &)>;

/**
 * @struct ProcessorSlot
 * @brief Reusable per-worker state.
 */
struct ProcessorSlot {
  int slot_id = 0;
  std::unique_ptr<TranscriptionService> transcriber;
};

/**
 * @class BatchRenderer
 * @brief Bounded worker pool over a fixed array of processor slots.
 */
class BatchRenderer {
public:
  /**
   * @param num_workers Worker count, clamped to [1, 4]
   * @param factory Speech backend factory, called once per slot
   * @param services Probe / encoder services shared by all jobs
   * @param allow_accelerator false forces fallback transcription
   * @param limits Caption bounds applied to every job
   */
  BatchRenderer(int num_workers, BackendFactory factory,
                RenderServices services, bool allow_accelerator,
                CaptionLimits limits = CaptionLimits::from_config());

  void set_progress_callback(ProgressCallback cb) {
    on_progress_ = std::move(cb);
  }
  void set_completion_callback(CompletionCallback cb) {
    on_complete_ = std::move(cb);
  }

  /**
   * @brief Render every folder with the given settings.
   *
   * @param folders Project folders (already validated)
   * @param settings Settings snapshot shared by every job
   * @return One result per folder, in completion order
   */
  std::vector<RenderResult> render(const std::vector<std::string> &folders,
                                   const RenderSettings &settings);

  int num_workers() const { return static_cast<int>(slots_.size()); }

  /// Number of unsuccessful results
  static int count_failures(const std::vector<RenderResult> &results);

private:
  std::vector<ProcessorSlot> slots_; //< Index = worker id
  RenderServices services_;
  CaptionLimits limits_;

  ProgressCallback on_progress_;
  CompletionCallback on_complete_;
  std::mutex callback_mutex_; //< Serializes user callbacks

  /**
   * @brief Worker function for each thread.
   * @param worker_id Index of the thread and of its processor slot
   */
  void worker(int worker_id, TaskQueue &queue, const RenderSettings &settings,
              ResultCollector &results, int total_jobs);

  /// Run one job; anything it throws becomes a failed result for its folder
  RenderResult run_guarded(RenderJob &job, TranscriptionService &transcriber,
                           const ProgressCallback &forward);

  /// Hand a result to the completion callback without letting it unwind
  /// the worker
  void notify_complete(int job_id, const RenderResult &result);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(const std::vector<RenderResult> &results,
                           double wall_clock_sec) const;
};

} // namespace vidcap

#endif // VIDCAP_BATCH_RENDERER_HPP
