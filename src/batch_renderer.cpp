/**
 * @file batch_renderer.cpp
 * @brief Parallel project rendering implementation
 *
 * @details Implements the BatchRenderer class:
 *
 *          - Fixed pool of processor slots, one per worker thread
 *
 *          - Shared queue for load balancing
 *
 *          - Job-prefixed logging
 *
 *          - Sequential summary output
 */

#include "vidcap/batch_renderer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "vidcap/logging.hpp"
#include "vidcap/project_scanner.hpp"

namespace vidcap {

namespace fs = std::filesystem;

BatchRenderer::BatchRenderer(int num_workers, BackendFactory factory,
                             RenderServices services, bool allow_accelerator,
                             CaptionLimits limits)
    : services_(std::move(services)), limits_(limits) {
  int n = std::clamp(num_workers, 1, 4);
  slots_.resize(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    slots_[i].slot_id = i;
    slots_[i].transcriber = std::make_unique<TranscriptionService>(
        factory(i), allow_accelerator, i);
  }
}

int BatchRenderer::count_failures(const std::vector<RenderResult> &results) {
  return static_cast<int>(
      std::count_if(results.begin(), results.end(),
                    [](const RenderResult &r) { return !r.success; }));
}

std::vector<RenderResult>
BatchRenderer::render(const std::vector<std::string> &folders,
                      const RenderSettings &settings) {
  if (folders.empty()) {
    LOG_WARN("No projects to render");
    return {};
  }

  TimingCollector::clear();

  const int total_jobs = static_cast<int>(folders.size());
  const int active_workers = std::min(num_workers(), total_jobs);

  LOG_PHASE("==================== BATCH RENDER ====================");
  LOG_INFO("Projects to render: {}", total_jobs);
  LOG_INFO("Parallel workers: {}", active_workers);
  LOG_PHASE("======================================================");

  TaskQueue queue;
  for (int i = 0; i < total_jobs; ++i) {
    RenderTask task;
    task.job_id = i;
    task.project = discover_project(folders[i]);
    queue.submit(std::move(task));
  }
  queue.close();

  ResultCollector collector(folders.size());

  auto batch_start = std::chrono::high_resolution_clock::now();

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(active_workers));
  for (int w = 0; w < active_workers; ++w) {
    workers.emplace_back(&BatchRenderer::worker, this, w, std::ref(queue),
                         std::cref(settings), std::ref(collector), total_jobs);
  }
  for (auto &t : workers) {
    t.join();
  }

  auto batch_end = std::chrono::high_resolution_clock::now();
  double elapsed_sec =
      std::chrono::duration<double>(batch_end - batch_start).count();

  std::vector<RenderResult> results = collector.extract();
  print_batch_summary(results, elapsed_sec);
  TimingCollector::print_summary();
  return results;
}

void BatchRenderer::worker(int worker_id, TaskQueue &queue,
                           const RenderSettings &settings,
                           ResultCollector &results, int total_jobs) {
  ProcessorSlot &slot = slots_[static_cast<size_t>(worker_id)];
  LOG_INFO("[Worker {}] Started", worker_id);

  RenderTask task;
  int jobs_done = 0;
  while (queue.take(task)) {
    const std::string name = fs::path(task.project.folder).filename().string();
    LOG_PHASE("[Job {}] ---------------------------------------", task.job_id);
    LOG_INFO("[Job {}] {} on worker {} ({} still queued)", task.job_id, name,
             worker_id, queue.pending());

    RenderResult result;
    if (task.project.voiceover.empty() || task.project.images.empty()) {
      LOG_ERROR("[Job {}] {} is missing its voiceover or images", task.job_id,
                name);
      result.folder = task.project.folder;
      result.success = false;
    } else {
      RenderJob job(task.job_id, task.project, settings, limits_);

      ProgressCallback forward = [this](const std::string &folder, int pct,
                                        const std::string &status) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (on_progress_)
          on_progress_(folder, pct, status);
      };
      result = run_guarded(job, *slot.transcriber, forward);
    }

    const bool ok = result.success;
    const std::string output = result.output_path;
    const double seconds = result.processing_time_us / 1000000.0;
    notify_complete(task.job_id, result);
    const int finished = results.add(std::move(result));

    if (ok) {
      LOG_SUCCESS("[Job {}] Completed: {} ({:.1f}s, {}/{} done)", task.job_id,
                  output, seconds, finished, total_jobs);
    } else {
      LOG_ERROR("[Job {}] Failed: {} ({}/{} done, {} failed)", task.job_id,
                name, finished, total_jobs, results.failures());
    }
    ++jobs_done;
  }

  LOG_INFO("[Worker {}] Finished ({} jobs)", worker_id, jobs_done);
}

RenderResult BatchRenderer::run_guarded(RenderJob &job,
                                        TranscriptionService &transcriber,
                                        const ProgressCallback &forward) {
  try {
    return job.run(transcriber, services_, forward);
  } catch (const std::exception &e) {
    LOG_ERROR("[Job {}] Aborted: {}", job.id(), e.what());
  } catch (...) {
    LOG_ERROR("[Job {}] Aborted by a non-standard exception", job.id());
  }
  RenderResult failed;
  failed.folder = job.folder();
  failed.success = false;
  return failed;
}

void BatchRenderer::notify_complete(int job_id, const RenderResult &result) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  if (!on_complete_)
    return;
  try {
    on_complete_(result);
  } catch (const std::exception &e) {
    LOG_WARN("[Job {}] Completion listener failed: {}", job_id, e.what());
  } catch (...) {
    LOG_WARN("[Job {}] Completion listener failed", job_id);
  }
}

void BatchRenderer::print_batch_summary(
    const std::vector<RenderResult> &results, double wall_clock_sec) const {
  int total = static_cast<int>(results.size());
  int failed = count_failures(results);
  int success = total - failed;
  long total_time_us = 0;
  for (const auto &result : results) {
    total_time_us += result.processing_time_us;
  }

  double sum_time_sec = total_time_us / 1000000.0;
  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=============== BATCH RENDER SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Total projects:", total);
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>25}\n", "Parallel workers:", slots_.size());
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of job times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);

  if (total > 0) {
    double avg_time = sum_time_sec / total;
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per job:", avg_time);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed projects:\n");
    for (const auto &result : results) {
      if (!result.success) {
        fmt::print(fg(fmt::color::red), "  - {}\n", result.folder);
      }
    }
  }
  std::fflush(stdout);
}

} // namespace vidcap
