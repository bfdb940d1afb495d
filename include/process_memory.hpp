#ifndef PROCESS_MEMORY_HPP
#define PROCESS_MEMORY_HPP

namespace logowatch {

// Resident set size of this process in MB; false where /proc is unavailable
bool residentMemoryMb(double& megabytes);

} // namespace logowatch

#endif // PROCESS_MEMORY_HPP
