#ifndef MEMORY_NOISE_MODULE_H
#define MEMORY_NOISE_MODULE_H

#include <cstddef>
#include <cstdint>
#include <random>

class Kernel;

struct DeteriorationSummary {
    std::size_t mutations = 0;
    std::size_t transferences = 0;
    std::size_t confabulations = 0;

    std::size_t total() const { return mutations + transferences + confabulations; }
};

// Unprompted memory noise: misremembering, mixing up subjects, and concocting values
// for forgotten features. Poorer memories deteriorate more.
class MemoryNoiseModule {
public:
    void configure(std::uint64_t seed);

    DeteriorationSummary deteriorate(Kernel& kernel, std::uint32_t owner);

private:
    std::mt19937_64 rng_{};
};

#endif
