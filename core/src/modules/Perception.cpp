#include "modules/Perception.h"

#include <algorithm>

#include "kernel/Kernel.h"

namespace {
// Below this salience an entity is unlikely to have left any lasting impression
constexpr double kImplantSalienceFloor = 1.01;
}

void PerceptionModule::configure(std::uint64_t seed) {
    rng_.seed(seed);
}

std::size_t PerceptionModule::reflect(Kernel& kernel, std::uint32_t person) {
    const Person& p = kernel.person(person);
    if (!p.present()) {
        return 0;
    }
    const EntityRef self = personRef(person);
    auto evidence = kernel.recordEvidence(self, self, ReflectionDetails{});
    return kernel.buildUp(person, evidence);
}

std::size_t PerceptionModule::observe(Kernel& kernel, std::uint32_t person) {
    const Person& p = kernel.person(person);
    if (!p.present() || p.location < 0) {
        return 0;
    }
    const EntityRef self = personRef(person);
    const auto here = static_cast<std::uint32_t>(p.location);
    std::bernoulli_distribution notice(kernel.epistemic().chanceObserveNearbyEntity);

    std::size_t observations = 0;
    if (notice(rng_)) {
        auto evidence = kernel.recordEvidence(kernel.place(here).ref(), self, ObservationDetails{});
        kernel.buildUp(person, evidence);
        ++observations;
    }

    // Copy: occupancy does not change here, but buildUp may touch kernel state
    const std::vector<std::uint32_t> others = kernel.occupants(here);
    for (std::uint32_t other : others) {
        if (other == person || !notice(rng_)) {
            continue;
        }
        auto evidence = kernel.recordEvidence(personRef(other), self, ObservationDetails{});
        kernel.buildUp(person, evidence);
        ++observations;
    }
    return observations;
}

std::size_t PerceptionModule::implantKnowledge(Kernel& kernel, std::uint32_t owner) {
    const Person& p = kernel.person(owner);
    if (!p.present() || p.age < TuningConstants::kMinImplantAge) {
        return 0;
    }
    const auto& cfg = kernel.epistemic();
    const EntityRef self = personRef(owner);
    std::uniform_real_distribution<double> uni(0.0, 1.0);

    // Self first, then everything the owner cares about, most salient first
    std::vector<EntityRef> candidates{self};
    for (EntityRef e : kernel.mind(owner).salience().ranked()) {
        if (e != self) {
            candidates.push_back(e);
        }
    }

    std::size_t implants = 0;
    for (EntityRef entity : candidates) {
        if (!kernel.exists(entity)) {
            continue;
        }
        const double s = kernel.mind(owner).salience().of(entity);
        bool implant = entity == self || s >= cfg.friendSalienceThreshold;
        if (!implant) {
            implant = uni(rng_) < 1.0 - 1.0 / std::max(kImplantSalienceFloor, s);
        }
        if (!implant) {
            continue;
        }
        auto evidence = kernel.recordEvidence(entity, self, ImplantDetails{s});
        kernel.buildUp(owner, evidence);
        ++implants;
    }
    return implants;
}
