/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END_JOB)
 *
 *          - Thread-safe TimingCollector with per-job rows and per-stage
 *            aggregates (transcribe / encode / total)
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so interleaved worker output stays readable.
 *
 */

#ifndef VIDCAP_LOGGING_HPP
#define VIDCAP_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace vidcap {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vidcap::log_mutex);                       \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vidcap::log_mutex);                       \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vidcap::log_mutex);                       \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vidcap::log_mutex);                       \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(vidcap::log_mutex);                       \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/// Job id used for measurements that belong to the whole batch
constexpr int BATCH_TIMING_ID = -1;

/**
 * @struct TimingEntry
 * @brief One stage duration of one job.
 */
struct TimingEntry {
  int job_id;        //< Batch index, or BATCH_TIMING_ID
  std::string stage; //< "transcribe", "encode", "total", ...
  long microseconds;
};

/**
 * @struct StageStats
 * @brief Aggregate of one stage across every job of a batch.
 */
struct StageStats {
  std::string stage;
  int count = 0;
  long total_us = 0;
  long max_us = 0;

  double mean_seconds() const {
    return count > 0 ? total_us / 1000000.0 / count : 0.0;
  }
};

/**
 * @class TimingCollector
 * @brief Thread-safe store of stage timings for the running batch.
 * @note Workers record concurrently; the summary is printed once the batch
 *       has drained.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(int job_id, const std::string &stage, long us);

  /**
   * @brief Per-stage aggregates in first-recorded order.
   */
  static std::vector<StageStats> stage_stats();

  /**
   * @brief Print per-job rows followed by the per-stage aggregate table.
   */
  static void print_summary();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::high_resolution_clock::now()

/// Record the time since TIMER_START(name) as stage #name of a job
#define TIMER_END_JOB(name, job_id)                                            \
  do {                                                                         \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            std::chrono::high_resolution_clock::now() - timer_start_##name)    \
            .count();                                                          \
    vidcap::TimingCollector::record(job_id, #name, timer_duration_##name);     \
  } while (0)

#define TIMER_END(name) TIMER_END_JOB(name, vidcap::BATCH_TIMING_ID)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END_JOB(name, job_id) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace vidcap

#endif // VIDCAP_LOGGING_HPP
