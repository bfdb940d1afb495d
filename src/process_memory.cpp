#include "process_memory.hpp"
#include <fstream>
#include <unistd.h>

namespace logowatch {

bool residentMemoryMb(double& megabytes) {
  std::ifstream statm("/proc/self/statm");
  if (!statm.is_open()) {
    return false;
  }

  long totalPages = 0;
  long residentPages = 0;
  if (!(statm >> totalPages >> residentPages)) {
    return false;
  }

  long pageSize = sysconf(_SC_PAGESIZE);
  if (pageSize <= 0) {
    return false;
  }

  megabytes = static_cast<double>(residentPages) *
              static_cast<double>(pageSize) / (1024.0 * 1024.0);
  return true;
}

} // namespace logowatch
