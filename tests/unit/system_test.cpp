#include "dashcam_merge/system.hpp"

#include <cassert>
#include <iostream>
#include <vector>

namespace {

using namespace dashcam_merge;

void TestParseCpusetRanges() {
  assert((parse_cpuset_string("0-3") == std::vector<int>{0, 1, 2, 3}));
  assert((parse_cpuset_string("0-1,4,6-7") ==
          std::vector<int>{0, 1, 4, 6, 7}));
  assert((parse_cpuset_string("5") == std::vector<int>{5}));
}

void TestParseCpusetRejectsMalformed() {
  assert(parse_cpuset_string("").empty());
  assert(parse_cpuset_string("a-b").empty());
  assert(parse_cpuset_string("3-1").empty());
  assert(parse_cpuset_string("0,,2").empty());
}

void TestThreadsPerJob() {
  assert(threads_per_job(8, 2) == 4);
  assert(threads_per_job(8, 3) == 2);
  assert(threads_per_job(2, 8) == 1);
  assert(threads_per_job(8, 0) == 8);
}

void TestDetectCpuLimitPositive() { assert(detect_cpu_limit() >= 1); }

} // namespace

int main() {
  TestParseCpusetRanges();
  TestParseCpusetRejectsMalformed();
  TestThreadsPerJob();
  TestDetectCpuLimitPositive();

  std::cout << "dashcam_merge_unit_system: pass\n";
  return 0;
}
