/**
 * @file system.hpp
 * @brief System utilities: CPU limit detection
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for Docker containers
 *
 *          - Per-job encoder thread budget when several re-encodes may run
 *            at once
 */

#ifndef DASHCAM_MERGE_SYSTEM_HPP
#define DASHCAM_MERGE_SYSTEM_HPP

#include <string>
#include <vector>

namespace dashcam_merge {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In Docker containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset/cpuset.cpus` (counts allowed cores)
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Parse a cpuset list such as "0-3,8,10-11".
 * @return CPU ids in listed order; empty on malformed input
 */
std::vector<int> parse_cpuset_string(const std::string &line);

/**
 * @brief Encoder threads to give each of `parallel_jobs` concurrent jobs.
 * @return max(1, cpu_limit / parallel_jobs)
 */
int threads_per_job(int cpu_limit, int parallel_jobs);

} // namespace dashcam_merge

#endif // DASHCAM_MERGE_SYSTEM_HPP
