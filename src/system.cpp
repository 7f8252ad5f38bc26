/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Encoder thread budgeting
 */

#include "dashcam_merge/system.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <string>
#include <thread>

namespace dashcam_merge {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Strict decimal parse; -1 on anything else
int parse_cpu_id(const std::string &text) {
  if (text.empty() || text.size() > 6)
    return -1;
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return -1;
  }
  return std::stoi(text);
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

} // anonymous namespace

// **---- Cpuset Parsing ----**

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  if (line.empty())
    return cpus;

  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);

    size_t dash = item.find('-');
    if (dash == std::string::npos) {
      /// Single CPU
      int cpu = parse_cpu_id(item);
      if (cpu < 0)
        return {};
      cpus.push_back(cpu);
    } else {
      /// Range like "0-3"
      int start_cpu = parse_cpu_id(item.substr(0, dash));
      int end_cpu = parse_cpu_id(item.substr(dash + 1));
      if (start_cpu < 0 || end_cpu < start_cpu)
        return {};
      for (int cpu = start_cpu; cpu <= end_cpu; ++cpu)
        cpus.push_back(cpu);
    }

    pos = end + 1;
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0)
            limit = static_cast<int>((quota + period - 1) / period);
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 64)
    limit = 64;

  return limit;
}

int threads_per_job(int cpu_limit, int parallel_jobs) {
  if (parallel_jobs <= 0)
    parallel_jobs = 1;
  return std::max(1, cpu_limit / parallel_jobs);
}

} // namespace dashcam_merge
