#include "modules/MemoryNoise.h"

#include <algorithm>
#include <vector>

#include "kernel/Kernel.h"

void MemoryNoiseModule::configure(std::uint64_t seed) {
    rng_.seed(seed);
}

DeteriorationSummary MemoryNoiseModule::deteriorate(Kernel& kernel, std::uint32_t owner) {
    DeteriorationSummary summary;
    const Person& p = kernel.person(owner);
    if (!p.present()) {
        return summary;
    }

    const auto& cfg = kernel.epistemic();
    const auto& registry = FeatureRegistry::instance();
    const double frailty = 1.0 - kernel.mind(owner).memory();
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    const EntityRef self = personRef(owner);

    // Deterioration only touches existing facets, but take a copy so ingestion cannot invalidate the walk
    const std::vector<BeliefFacet*> facets = kernel.mind(owner).allFacets();
    for (BeliefFacet* facet : facets) {
        const EntityRef subject = facet->subject();
        const FeatureType feature = facet->feature();

        if (!facet->known()) {
            if (uni(rng_) >= cfg.chanceConfabulation * frailty) {
                continue;
            }
            std::string concocted = registry.plausibleAlternative(kernel, feature, std::string(), rng_);
            if (concocted.empty()) {
                continue;
            }
            auto evidence = kernel.recordEvidence(subject, self, ConfabulationDetails{});
            kernel.ingest(owner, subject, feature, concocted, evidence);
            ++summary.confabulations;
            continue;
        }

        if (uni(rng_) < cfg.chanceMutation * frailty) {
            const std::string from = facet->value();
            std::string to = registry.plausibleAlternative(kernel, feature, from, rng_);
            if (!to.empty()) {
                auto evidence = kernel.recordEvidence(subject, self, MutationDetails{from});
                kernel.ingest(owner, subject, feature, to, evidence);
                ++summary.mutations;
                continue;
            }
        }

        if (uni(rng_) < cfg.chanceTransference * frailty) {
            // Another subject's value for the same feature, one that differs from this one
            std::vector<const BeliefFacet*> donors;
            for (const BeliefFacet* other : facets) {
                if (other->feature() == feature && other->subject() != subject && other->known() &&
                    other->value() != facet->value() && registry.appliesTo(feature, subject.kind)) {
                    donors.push_back(other);
                }
            }
            if (donors.empty()) {
                continue;
            }
            std::uniform_int_distribution<std::size_t> pick(0, donors.size() - 1);
            const BeliefFacet* donor = donors[pick(rng_)];
            const std::string value = donor->value();
            auto evidence = kernel.recordEvidence(subject, self, TransferenceDetails{donor->key(), donor->strength()});
            kernel.ingest(owner, subject, feature, value, evidence);
            ++summary.transferences;
        }
    }
    return summary;
}
