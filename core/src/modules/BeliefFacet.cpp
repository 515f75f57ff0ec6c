#include "modules/BeliefFacet.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include "kernel/Kernel.h"

namespace {
// Corroboration with diminishing returns: never exceeds the cap, never lowers strength
double corroborate(double strength, double weight, double cap) {
    if (strength >= cap) {
        return cap;
    }
    return std::min(cap, strength + weight * (1.0 - strength / cap));
}
}

const char* ingestOutcomeName(IngestOutcome outcome) {
    switch (outcome) {
        case IngestOutcome::Created: return "created";
        case IngestOutcome::Reinforced: return "reinforced";
        case IngestOutcome::Supplanted: return "supplanted";
        case IngestOutcome::Resisted: return "resisted";
        case IngestOutcome::Forgotten: return "forgotten";
        case IngestOutcome::Reinstated: return "reinstated";
    }
    return "unknown";
}

double defaultEvidenceWeight(const EvidenceWeightInputs& in) {
    const double credibility = std::clamp(in.sourceCredibility, 0.0, 1.0);
    const double transmitted = std::clamp(in.transmittedStrength, 0.0, 1.0);
    const double memory = std::clamp(in.ownerMemory, 0.0, 1.0);
    return in.kindBaseStrength * credibility * transmitted * (0.5 + 0.5 * memory);
}

std::vector<EntityRef> rankByFrequency(const std::vector<EntityRef>& appearances) {
    std::vector<EntityRef> distinct;
    std::vector<std::size_t> counts;
    for (const auto& e : appearances) {
        auto it = std::find(distinct.begin(), distinct.end(), e);
        if (it == distinct.end()) {
            distinct.push_back(e);
            counts.push_back(1);
        } else {
            counts[static_cast<std::size_t>(it - distinct.begin())]++;
        }
    }

    std::vector<std::size_t> order(distinct.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&counts](std::size_t a, std::size_t b) { return counts[a] > counts[b]; });

    std::vector<EntityRef> ranked;
    ranked.reserve(order.size());
    for (auto i : order) {
        ranked.push_back(distinct[i]);
    }
    return ranked;
}

BeliefFacet::BeliefFacet(EntityRef owner, EntityRef subject, FeatureType feature) {
    key_.owner = owner;
    key_.subject = subject;
    key_.feature = feature;
}

IngestOutcome BeliefFacet::considerNewEvidence(const std::string& proposedValue, const EvidencePtr& evidence,
                                               double weight, const FacetLimits& limits, std::uint64_t day) {
    if (!evidence) {
        throw ContractViolation("a belief facet cannot consider missing evidence");
    }
    if (evidence->kind() == EvidenceKind::Forgetting) {
        if (!proposedValue.empty()) {
            throw ContractViolation("forgetting may only support the unknown marker");
        }
        return forget(evidence, limits, day);
    }
    if (proposedValue.empty()) {
        throw ContractViolation(std::string("only forgetting may propose the unknown marker, not ") +
                                evidenceKindName(evidence->kind()));
    }
    weight = std::max(0.0, weight);

    // First evidence ever
    if (evidence_.empty()) {
        return establish(proposedValue, weight, evidence, day, false, limits);
    }

    // Nothing currently believed: the marker gives way to any value
    if (!known()) {
        if (const SupersededBelief* prior = lastSuperseded(proposedValue)) {
            return establish(proposedValue, corroborate(prior->frozenStrength, weight, limits.cap), evidence, day,
                             true, limits);
        }
        return establish(proposedValue, weight, evidence, day, false, limits);
    }

    if (proposedValue == value_) {
        setStrength(corroborate(strength_, weight, limits.cap), day, limits);
        evidence_.push_back({evidence, proposedValue, IngestOutcome::Reinforced});
        return IngestOutcome::Reinforced;
    }

    // Contradiction: only the new evidence's own weight competes with a held value
    if (evidence->deterioration() || weight > strength_) {
        if (evidence->firsthand()) {
            collectLiesBehindCurrent();
        }
        supersedeCurrent(evidence->eventNumber());
        return establish(proposedValue, weight, evidence, day, false, limits);
    }

    const double eroded = std::max(limits.floor, strength_ - weight * limits.contradictionErosion);
    if (strength_ > 0.0) {
        anchor_strength_ *= eroded / strength_;
    }
    strength_ = eroded;
    evidence_.push_back({evidence, proposedValue, IngestOutcome::Resisted});
    return IngestOutcome::Resisted;
}

bool BeliefFacet::decayStrength(std::uint64_t day, double dailyRetention, const FacetLimits& limits) {
    if (!known() || day <= anchor_day_) {
        return false;
    }
    const double elapsed = static_cast<double>(day - anchor_day_);
    const double decayed = anchor_strength_ * std::pow(dailyRetention, elapsed);
    if (decayed <= limits.floor) {
        strength_ = limits.floor;
        return true;
    }
    strength_ = std::min(limits.cap, decayed);
    return false;
}

const FacetEvidence* BeliefFacet::latestSupport() const {
    for (auto it = evidence_.rbegin(); it != evidence_.rend(); ++it) {
        if (it->outcome != IngestOutcome::Resisted) {
            return &*it;
        }
    }
    return nullptr;
}

bool BeliefFacet::accurate(const Kernel& kernel) const {
    return known() && value_ == FeatureRegistry::instance().trueValue(kernel, key_.subject, key_.feature);
}

bool BeliefFacet::inaccurate(const Kernel& kernel) const {
    return known() && value_ != FeatureRegistry::instance().trueValue(kernel, key_.subject, key_.feature);
}

std::vector<EntityRef> BeliefFacet::sources() const {
    std::vector<EntityRef> appearances;
    appearances.reserve(evidence_.size());
    for (const auto& fe : evidence_) {
        appearances.push_back(fe.evidence->source());
    }
    return rankByFrequency(appearances);
}

std::optional<EntityRef> BeliefFacet::topSource() const {
    auto ranked = sources();
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front();
}

IngestOutcome BeliefFacet::forget(const EvidencePtr& forgetting, const FacetLimits& limits, std::uint64_t day) {
    const double before = strength_;
    if (known()) {
        supersedeCurrent(forgetting->eventNumber());
    }
    if (!forgetting->adjustedStrength()) {
        forgetting->setAdjustedStrength(before);
    }
    value_.clear();
    strength_ = limits.floor;
    anchor_strength_ = limits.floor;
    anchor_day_ = day;
    evidence_.push_back({forgetting, std::string(), IngestOutcome::Forgotten});
    return IngestOutcome::Forgotten;
}

IngestOutcome BeliefFacet::establish(const std::string& value, double strength, const EvidencePtr& evidence,
                                     std::uint64_t day, bool reinstated, const FacetLimits& limits) {
    const IngestOutcome outcome = evidence_.empty() ? IngestOutcome::Created
                                  : reinstated       ? IngestOutcome::Reinstated
                                                     : IngestOutcome::Supplanted;
    value_ = value;
    setStrength(strength, day, limits);
    evidence_.push_back({evidence, value, outcome});
    return outcome;
}

const SupersededBelief* BeliefFacet::lastSuperseded(const std::string& value) const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        if (it->value == value) {
            return &*it;
        }
    }
    return nullptr;
}

void BeliefFacet::supersedeCurrent(std::uint64_t eventNumber) {
    history_.push_back({value_, strength_, eventNumber});
}

void BeliefFacet::collectLiesBehindCurrent() {
    for (const auto& fe : evidence_) {
        if (fe.evidence->kind() != EvidenceKind::Lie || fe.proposedValue != value_) {
            continue;
        }
        const EntityRef liar = fe.evidence->source();
        if (std::find(exposed_liars_.begin(), exposed_liars_.end(), liar) == exposed_liars_.end()) {
            exposed_liars_.push_back(liar);
        }
    }
}

void BeliefFacet::setStrength(double strength, std::uint64_t day, const FacetLimits& limits) {
    strength_ = std::clamp(strength, limits.floor, limits.cap);
    anchor_strength_ = strength_;
    anchor_day_ = day;
}
