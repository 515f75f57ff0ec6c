#ifndef VALIDATION_H
#define VALIDATION_H

#include "kernel/Kernel.h"

// Throw std::invalid_argument naming the first offending parameter
void validateEpistemicConfig(const EpistemicConfig& cfg);
void validateConfig(const KernelConfig& cfg);

#endif
