#ifndef BELIEF_FACET_H
#define BELIEF_FACET_H

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "kernel/Entity.h"
#include "modules/Evidence.h"
#include "modules/Features.h"

class Kernel;

// What ingesting one piece of evidence did to a facet
enum class IngestOutcome : std::uint8_t {
    Created = 0,    // first value for this (owner, subject, feature)
    Reinforced,     // same value, strength went up
    Supplanted,     // new value replaced the old one
    Resisted,       // contradiction logged, old value kept
    Forgotten,      // value replaced by the unknown marker
    Reinstated      // a superseded value came back, seeded from its frozen strength
};

const char* ingestOutcomeName(IngestOutcome outcome);

// ---------- Evidence weighting ----------
// Inputs to the single scoring function that turns a piece of evidence into a weight
struct EvidenceWeightInputs {
    EvidenceKind kind = EvidenceKind::Observation;
    double kindBaseStrength = 0.0;      // per-kind trust multiplier from configuration
    double sourceCredibility = 1.0;     // 0..1, how far the owner trusts the source
    double transmittedStrength = 1.0;   // 0..1, teller's (or prior) strength relative to the cap
    double ownerMemory = 0.7;           // 0.1..0.9
};

using EvidenceWeighting = std::function<double(const EvidenceWeightInputs&)>;

// base * credibility * transmitted * (0.5 + 0.5 * memory)
double defaultEvidenceWeight(const EvidenceWeightInputs& in);

// Strength bounds and contradiction tuning applied by every facet
struct FacetLimits {
    double floor = 1.0;
    double cap = 100.0;
    double contradictionErosion = 0.25;
};

// A value this facet used to hold, with the strength it had when it was superseded
struct SupersededBelief {
    std::string value;
    double frozenStrength = 0.0;
    std::uint64_t supersededAtEvent = 0;
};

// One piece of evidence as this facet saw it
struct FacetEvidence {
    EvidencePtr evidence;
    std::string proposedValue;
    IngestOutcome outcome = IngestOutcome::Created;
};

// Distinct entries of `appearances`, most frequent first; ties keep first-appearance order
std::vector<EntityRef> rankByFrequency(const std::vector<EntityRef>& appearances);

// ---------- Belief Facet ----------
// What one owner believes about one feature of one subject. The empty string is the unknown marker.
class BeliefFacet {
public:
    BeliefFacet(EntityRef owner, EntityRef subject, FeatureType feature);

    IngestOutcome considerNewEvidence(const std::string& proposedValue, const EvidencePtr& evidence,
                                      double weight, const FacetLimits& limits, std::uint64_t day);

    // Recompute strength for `day`. Returns true when the value has decayed to the floor and
    // should now be forgotten; the caller records the forgetting.
    bool decayStrength(std::uint64_t day, double dailyRetention, const FacetLimits& limits);

    const FacetKey& key() const { return key_; }
    EntityRef owner() const { return key_.owner; }
    EntityRef subject() const { return key_.subject; }
    FeatureType feature() const { return key_.feature; }

    const std::string& value() const { return value_; }
    bool known() const { return !value_.empty(); }
    double strength() const { return strength_; }
    std::uint64_t lastSupportDay() const { return anchor_day_; }

    const std::vector<FacetEvidence>& evidence() const { return evidence_; }
    const std::vector<SupersededBelief>& history() const { return history_; }
    const FacetEvidence* latestSupport() const;

    // Compared against the subject's live ground truth; false when nothing is believed
    bool accurate(const Kernel& kernel) const;
    bool inaccurate(const Kernel& kernel) const;

    // Everyone who ever supplied evidence here, most frequent first, first appearance breaking ties
    std::vector<EntityRef> sources() const;
    std::optional<EntityRef> topSource() const;

    // Liars whose lies the current value had rested on before it was supplanted
    const std::vector<EntityRef>& exposedLiars() const { return exposed_liars_; }
    void clearExposedLiars() { exposed_liars_.clear(); }

private:
    IngestOutcome forget(const EvidencePtr& forgetting, const FacetLimits& limits, std::uint64_t day);
    IngestOutcome establish(const std::string& value, double strength, const EvidencePtr& evidence,
                            std::uint64_t day, bool reinstated, const FacetLimits& limits);
    const SupersededBelief* lastSuperseded(const std::string& value) const;
    void supersedeCurrent(std::uint64_t eventNumber);
    void collectLiesBehindCurrent();
    void setStrength(double strength, std::uint64_t day, const FacetLimits& limits);

    FacetKey key_;
    std::string value_;
    double strength_ = 0.0;
    double anchor_strength_ = 0.0;      // strength at the last supporting evidence
    std::uint64_t anchor_day_ = 0;
    std::vector<FacetEvidence> evidence_;
    std::vector<SupersededBelief> history_;
    std::vector<EntityRef> exposed_liars_;
};

#endif
