#ifndef PERCEPTION_MODULE_H
#define PERCEPTION_MODULE_H

#include <cstddef>
#include <cstdint>
#include <random>

class Kernel;

// First-hand knowledge: looking at oneself, looking around, and implanted backstory
class PerceptionModule {
public:
    void configure(std::uint64_t seed);

    // Returns the number of facets touched
    std::size_t reflect(Kernel& kernel, std::uint32_t person);

    // Observes the current place and, by chance, each person present.
    // Returns the number of observation records created.
    std::size_t observe(Kernel& kernel, std::uint32_t person);

    // Backstory for skipped time: true knowledge of self and of salient entities.
    // Returns the number of implant records created.
    std::size_t implantKnowledge(Kernel& kernel, std::uint32_t owner);

private:
    std::mt19937_64 rng_{};
};

#endif
