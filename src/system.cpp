/**
 * @file system.cpp
 * @brief Host resource detection
 */

#include "vidcap/system.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

#include "vidcap/config.hpp"
#include "vidcap/logging.hpp"

namespace vidcap {

namespace {

constexpr int MAX_CPU_LIMIT = 64;
constexpr int MAX_WORKERS = 4;

/// Whole CPUs for a CFS quota, rounded up
int cpus_for_quota(long quota, long period) {
  if (quota <= 0 || period <= 0)
    return -1;
  return static_cast<int>((quota + period - 1) / period);
}

std::string read_first_line(const char *path) {
  std::ifstream f(path);
  std::string line;
  if (f)
    std::getline(f, line);
  return line;
}

long read_long(const char *path) {
  std::ifstream f(path);
  long val = -1;
  if (!(f >> val))
    return -1;
  return val;
}

} // anonymous namespace

// **---- CPU Budget ----**

int parse_cgroup_cpu_max(const std::string &contents) {
  std::istringstream in(contents);
  std::string quota, period;
  if (!(in >> quota >> period) || quota == "max")
    return -1;
  try {
    return cpus_for_quota(std::stol(quota), std::stol(period));
  } catch (const std::exception &) {
    return -1;
  }
}

int count_cpuset_list(const std::string &list) {
  int count = 0;
  std::istringstream in(list);
  std::string range;
  while (std::getline(in, range, ',')) {
    if (range.empty())
      continue;
    try {
      auto dash = range.find('-');
      if (dash == std::string::npos) {
        std::stoi(range);
        ++count;
        continue;
      }
      int lo = std::stoi(range.substr(0, dash));
      int hi = std::stoi(range.substr(dash + 1));
      if (hi < lo)
        return -1;
      count += hi - lo + 1;
    } catch (const std::exception &) {
      return -1;
    }
  }
  return count > 0 ? count : -1;
}

int detect_cpu_limit() {
  int limit = parse_cgroup_cpu_max(read_first_line("/sys/fs/cgroup/cpu.max"));

  if (limit <= 0) {
    limit = cpus_for_quota(read_long("/sys/fs/cgroup/cpu/cpu.cfs_quota_us"),
                           read_long("/sys/fs/cgroup/cpu/cpu.cfs_period_us"));
  }
  if (limit <= 0) {
    limit = count_cpuset_list(
        read_first_line("/sys/fs/cgroup/cpuset.cpus.effective"));
  }
  if (limit <= 0) {
    limit = count_cpuset_list(
        read_first_line("/sys/fs/cgroup/cpuset/cpuset.cpus"));
  }
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }
  return std::clamp(limit, 1, MAX_CPU_LIMIT);
}

WorkerBudget plan_worker_budget(int requested, int projects, int cpu_limit,
                                int configured_threads) {
  WorkerBudget budget;
  budget.workers = std::clamp(requested, 1, MAX_WORKERS);
  if (projects > 0)
    budget.workers = std::min(budget.workers, projects);

  if (configured_threads > 0) {
    budget.inference_threads = configured_threads;
  } else {
    budget.inference_threads = std::max(1, cpu_limit / budget.workers);
  }
  return budget;
}

WorkerBudget plan_worker_budget(int requested, int projects) {
  int cpus = detect_cpu_limit();
  WorkerBudget budget =
      plan_worker_budget(requested, projects, cpus, Config::whisper_threads());
  LOG_INFO("CPU limit {}: {} worker(s) x {} inference thread(s)", cpus,
           budget.workers, budget.inference_threads);
  return budget;
}

// **---- Accelerator ----**

bool gpu_available() {
  static const bool available = [] {
    if (!Config::use_gpu()) {
      LOG_INFO("Accelerator disabled by USE_GPU=0");
      return false;
    }
    bool found = std::system("nvidia-smi -L > /dev/null 2>&1") == 0;
    if (found) {
      LOG_INFO("NVIDIA accelerator detected");
    } else {
      LOG_INFO("No accelerator detected, using CPU paths");
    }
    return found;
  }();
  return available;
}

} // namespace vidcap
