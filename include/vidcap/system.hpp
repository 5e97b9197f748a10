/**
 * @file system.hpp
 * @brief Host resources: CPU budget for transcription, accelerator probe
 *
 * @details The batch renderer runs up to four projects at once, each with its
 *          own speech model instance. The helpers here decide how many CPU
 *          threads each model may use and whether the hardware encoder and
 *          accelerated inference paths are worth trying.
 */

#ifndef VIDCAP_SYSTEM_HPP
#define VIDCAP_SYSTEM_HPP

#include <string>

namespace vidcap {

// **---- CPU Budget ----**

/**
 * @brief Parse the contents of a cgroup v2 `cpu.max` file.
 * @param contents e.g. "200000 100000" or "max 100000"
 * @return Whole CPUs granted (quota rounded up), or -1 when unlimited or
 *         unreadable
 */
int parse_cgroup_cpu_max(const std::string &contents);

/**
 * @brief Count CPUs in a cpuset list such as "0-3,8,10-11".
 * @return Number of CPUs, or -1 if the list is empty or malformed
 */
int count_cpuset_list(const std::string &list);

/**
 * @brief CPUs this process may actually use.
 *
 * @note Inside a container std::thread::hardware_concurrency() reports the
 *       host's cores. Checked in order: cgroup v2 `cpu.max`, cgroup v1
 *       `cpu.cfs_quota_us`/`cpu.cfs_period_us`, then the effective cpuset.
 *
 * @return Detected limit clamped to [1, 64]
 */
int detect_cpu_limit();

/**
 * @struct WorkerBudget
 * @brief How a batch splits the host between concurrent projects.
 */
struct WorkerBudget {
  int workers = 1;           ///< Projects rendered at once, in [1, 4]
  int inference_threads = 1; ///< Speech model threads per worker
};

/**
 * @brief Split cpu_limit between the workers a batch will actually start.
 *
 * @param requested Worker count asked for (clamped to [1, 4])
 * @param projects Number of projects in the batch; no more workers than this
 * @param cpu_limit CPUs available to the process
 * @param configured_threads Fixed thread count, or 0 to divide cpu_limit
 */
WorkerBudget plan_worker_budget(int requested, int projects, int cpu_limit,
                                int configured_threads);

/// plan_worker_budget() with the detected CPU limit and WHISPER_THREADS
WorkerBudget plan_worker_budget(int requested, int projects);

// **---- Accelerator ----**

/**
 * @brief True if an NVIDIA device answers nvidia-smi and USE_GPU is not 0.
 * @note Probed once per process.
 */
bool gpu_available();

} // namespace vidcap

#endif // VIDCAP_SYSTEM_HPP
