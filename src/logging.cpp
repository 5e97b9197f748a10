/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex
 *
 *          - TimingCollector storage, stage aggregation and the summary
 *            table
 */

#include "vidcap/logging.hpp"

#include <algorithm>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vidcap {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(int job_id, const std::string &stage, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({job_id, stage, us});
}

std::vector<StageStats> TimingCollector::stage_stats() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  std::vector<StageStats> stats;
  for (const auto &e : entries) {
    auto it = std::find_if(stats.begin(), stats.end(),
                           [&](const StageStats &s) { return s.stage == e.stage; });
    if (it == stats.end()) {
      stats.push_back({e.stage, 0, 0, 0});
      it = stats.end() - 1;
    }
    it->count++;
    it->total_us += e.microseconds;
    it->max_us = std::max(it->max_us, e.microseconds);
  }
  return stats;
}

void TimingCollector::print_summary() {
  std::vector<TimingEntry> rows;
  {
    std::lock_guard<std::mutex> lock(timing_mutex);
    rows = entries;
  }
  if (rows.empty())
    return;

  /// Jobs finish out of order; list them by id, stages in recorded order
  std::stable_sort(rows.begin(), rows.end(),
                   [](const TimingEntry &a, const TimingEntry &b) {
                     return a.job_id < b.job_id;
                   });

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== STAGE TIMINGS ====================\n");
  fmt::print("{:<8} {:<14} {:>28}\n", "Job", "Stage", "Time (us) [sec]");
  fmt::print("{:-<8} {:-<14} {:-<28}\n", "", "", "");
  for (const auto &e : rows) {
    std::string job =
        e.job_id == BATCH_TIMING_ID ? "batch" : std::to_string(e.job_id);
    fmt::print("{:<8} {:<14} {:>18} [{:.2f}s]\n", job, e.stage,
               e.microseconds, e.microseconds / 1000000.0);
  }

  fmt::print("\n{:<14} {:>6} {:>14} {:>14}\n", "Stage", "Jobs", "Mean",
             "Max");
  fmt::print("{:-<14} {:-<6} {:-<14} {:-<14}\n", "", "", "", "");
  for (const auto &s : stage_stats()) {
    fmt::print("{:<14} {:>6} {:>13.2f}s {:>13.2f}s\n", s.stage, s.count,
               s.mean_seconds(), s.max_us / 1000000.0);
  }
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace vidcap
