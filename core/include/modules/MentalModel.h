#ifndef MENTAL_MODEL_H
#define MENTAL_MODEL_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "kernel/Entity.h"
#include "modules/BeliefFacet.h"
#include "modules/EpistemicConfig.h"
#include "modules/Evidence.h"

class EventLog;
class Kernel;
class Mind;

// Everything a facet update needs besides the evidence itself. The kernel fills in the
// run-wide parts, the owning mind fills in the owner-specific parts.
struct IngestContext {
    const EpistemicConfig* config = nullptr;
    const EvidenceWeighting* weighting = nullptr;
    EventLog* log = nullptr;
    std::uint64_t day = 0;

    double ownerMemory = 0.7;
    double sourceCredibility = 1.0;
    std::vector<BeliefFacet*>* registry = nullptr;   // newly created facets are appended here

    FacetLimits limits() const;
};

// ---------- Mental Model ----------
// Everything one owner believes about one subject, feature by feature
class MentalModel {
public:
    MentalModel(EntityRef owner, EntityRef subject);

    EntityRef owner() const { return owner_; }
    EntityRef subject() const { return subject_; }

    BeliefFacet& getOrCreateFacet(FeatureType feature, std::vector<BeliefFacet*>* registry);
    const BeliefFacet* facet(FeatureType feature) const;
    const std::map<FeatureType, std::unique_ptr<BeliefFacet>>& facets() const { return facets_; }
    std::size_t size() const { return facets_.size(); }

    IngestOutcome considerNewEvidence(FeatureType feature, const std::string& proposedValue,
                                      const EvidencePtr& evidence, const IngestContext& ctx);

    // Routes reflection, observation and implant evidence to every feature it reveals, carrying
    // the subject's true values. Returns the number of facets touched.
    std::size_t buildUp(const Kernel& kernel, const EvidencePtr& evidence, const IngestContext& ctx);

    // Weight of `evidence` as support for `feature`, given what this model already holds
    double evidenceWeight(FeatureType feature, const Evidence& evidence, const IngestContext& ctx) const;

    // People the owner believes work here; empty unless the subject is a business
    std::vector<EntityRef> employees(const Mind& mind, const Kernel& kernel) const;

private:
    double transmittedStrength(FeatureType feature, const Evidence& evidence, double cap) const;

    EntityRef owner_;
    EntityRef subject_;
    std::map<FeatureType, std::unique_ptr<BeliefFacet>> facets_;
};

#endif
