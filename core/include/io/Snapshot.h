#ifndef KERNEL_SNAPSHOT_H
#define KERNEL_SNAPSHOT_H

#include "kernel/Kernel.h"
#include <cstdint>
#include <string>
#include <iosfwd>

// JSON export for kernel state
std::string kernelToJson(const Kernel& kernel, bool includePeople = false);

// JSON export of one owner's beliefs, with accuracy and provenance
std::string mindToJson(const Kernel& kernel, std::uint32_t owner);

// CSV metrics logging
void writeMetricsHeader(std::ostream& out);
void logMetrics(const Kernel& kernel, std::ostream& out);

#endif
