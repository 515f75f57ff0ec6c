#ifndef MIND_MODULE_H
#define MIND_MODULE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "kernel/Entity.h"
#include "modules/BeliefFacet.h"
#include "modules/EpistemicConfig.h"
#include "modules/MentalModel.h"
#include "modules/Salience.h"

class Kernel;

// ---------- Mind ----------
// One owner's whole belief store. Only evidence about or addressed to this owner writes to it.
class Mind {
public:
    Mind(EntityRef owner, double memory);

    Mind(const Mind&) = delete;
    Mind& operator=(const Mind&) = delete;
    Mind(Mind&&) = default;
    Mind& operator=(Mind&&) = default;

    EntityRef owner() const { return owner_; }
    double memory() const { return memory_; }

    // `base` carries the run-wide context; owner memory, source credibility and the facet
    // registry are filled in here
    IngestOutcome considerNewEvidence(EntityRef subject, FeatureType feature, const std::string& proposedValue,
                                      const EvidencePtr& evidence, const IngestContext& base);
    std::size_t buildUp(const Kernel& kernel, const EvidencePtr& evidence, const IngestContext& base);

    bool knows(EntityRef subject) const { return models_.count(subject) > 0; }
    const MentalModel* model(EntityRef subject) const;
    std::size_t modelCount() const { return models_.size(); }
    std::vector<EntityRef> knownSubjects() const;

    const BeliefFacet* facet(EntityRef subject, FeatureType feature) const;
    const std::vector<BeliefFacet*>& allFacets() const { return all_facets_; }

    // Everyone who supplied evidence about `subject` (optionally one feature), most frequent first
    std::vector<EntityRef> sources(EntityRef subject, std::optional<FeatureType> feature = std::nullopt) const;

    SalienceMap& salience() { return salience_; }
    const SalienceMap& salience() const { return salience_; }

    double credibilityOf(EntityRef source, const EpistemicConfig& cfg) const;
    void distrust(EntityRef source) { distrusted_.insert(source); }
    bool distrusts(EntityRef source) const { return distrusted_.count(source) > 0; }
    const std::set<EntityRef>& distrusted() const { return distrusted_; }

    double dailyRetention(const EpistemicConfig& cfg) const;

    // Recompute every facet's strength for `day`. Returns the facets that fell to the floor,
    // in acquisition order; recording their forgetting is left to the caller.
    std::vector<BeliefFacet*> decayStrengths(std::uint64_t day, const EpistemicConfig& cfg);

private:
    MentalModel& modelFor(EntityRef subject);
    void absorbExposedLiars(BeliefFacet& facet, const Evidence& evidence, const IngestContext& ctx);

    EntityRef owner_;
    double memory_ = 0.7;
    std::unordered_map<EntityRef, MentalModel, EntityRefHash> models_;
    std::vector<BeliefFacet*> all_facets_;
    SalienceMap salience_;
    std::set<EntityRef> distrusted_;
};

#endif
