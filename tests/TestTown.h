#ifndef TEST_TOWN_H
#define TEST_TOWN_H

#include <string>
#include "kernel/Kernel.h"

// Empty town with nothing random switched on; scenarios add their own places and people
inline KernelConfig emptyTownConfig() {
    KernelConfig cfg;
    cfg.population = 0;
    cfg.residences = 0;
    cfg.businesses = 0;
    cfg.seed = 7;
    cfg.implantAtStart = false;
    cfg.parallelDecay = false;
    cfg.epistemic.chanceEavesdrop = 0.0;
    cfg.epistemic.chanceLie = 0.0;
    return cfg;
}

inline Person townsperson(const std::string& first, const std::string& last, std::int32_t location = -1) {
    Person p;
    p.firstName = first;
    p.lastName = last;
    p.age = 30;
    p.birthYear = 1949;
    p.memory = 0.7;
    p.location = location;
    return p;
}

#endif
