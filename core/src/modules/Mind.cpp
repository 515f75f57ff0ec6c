#include "modules/Mind.h"

#include <algorithm>
#include <utility>

#include "kernel/Kernel.h"
#include "utils/EventLog.h"

Mind::Mind(EntityRef owner, double memory) : owner_(owner), memory_(memory) {}

IngestOutcome Mind::considerNewEvidence(EntityRef subject, FeatureType feature, const std::string& proposedValue,
                                        const EvidencePtr& evidence, const IngestContext& base) {
    IngestContext ctx = base;
    ctx.ownerMemory = memory_;
    ctx.sourceCredibility = credibilityOf(evidence->source(), *base.config);
    ctx.registry = &all_facets_;

    MentalModel& model = modelFor(subject);
    const IngestOutcome outcome = model.considerNewEvidence(feature, proposedValue, evidence, ctx);
    if (evidence->firsthand()) {
        absorbExposedLiars(model.getOrCreateFacet(feature, nullptr), *evidence, ctx);
    }
    return outcome;
}

std::size_t Mind::buildUp(const Kernel& kernel, const EvidencePtr& evidence, const IngestContext& base) {
    IngestContext ctx = base;
    ctx.ownerMemory = memory_;
    ctx.sourceCredibility = credibilityOf(evidence->source(), *base.config);
    ctx.registry = &all_facets_;

    MentalModel& model = modelFor(evidence->subject());
    const std::size_t touched = model.buildUp(kernel, evidence, ctx);
    if (evidence->firsthand()) {
        for (const auto& [feature, facet] : model.facets()) {
            (void)feature;
            absorbExposedLiars(*facet, *evidence, ctx);
        }
    }
    return touched;
}

const MentalModel* Mind::model(EntityRef subject) const {
    auto it = models_.find(subject);
    return it == models_.end() ? nullptr : &it->second;
}

std::vector<EntityRef> Mind::knownSubjects() const {
    std::vector<EntityRef> out;
    out.reserve(models_.size());
    for (const auto& [subject, model] : models_) {
        (void)model;
        out.push_back(subject);
    }
    std::sort(out.begin(), out.end());
    return out;
}

const BeliefFacet* Mind::facet(EntityRef subject, FeatureType feature) const {
    const MentalModel* m = model(subject);
    return m ? m->facet(feature) : nullptr;
}

std::vector<EntityRef> Mind::sources(EntityRef subject, std::optional<FeatureType> feature) const {
    const MentalModel* m = model(subject);
    if (!m) {
        return {};
    }
    if (feature) {
        const BeliefFacet* f = m->facet(*feature);
        return f ? f->sources() : std::vector<EntityRef>{};
    }

    // One vote per evidence record, however many features it touched, in creation order
    std::vector<std::pair<std::uint64_t, EntityRef>> records;
    for (const auto& [type, facet] : m->facets()) {
        (void)type;
        for (const auto& fe : facet->evidence()) {
            records.emplace_back(fe.evidence->eventNumber(), fe.evidence->source());
        }
    }
    std::sort(records.begin(), records.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    records.erase(std::unique(records.begin(), records.end(),
                              [](const auto& a, const auto& b) { return a.first == b.first; }),
                  records.end());

    std::vector<EntityRef> appearances;
    appearances.reserve(records.size());
    for (const auto& r : records) {
        appearances.push_back(r.second);
    }
    return rankByFrequency(appearances);
}

double Mind::credibilityOf(EntityRef source, const EpistemicConfig& cfg) const {
    if (source == owner_) {
        return 1.0;
    }
    const double s = salience_.of(source);
    double credibility = cfg.unknownSourceCredibility + (1.0 - cfg.unknownSourceCredibility) * s / (s + 1.0);
    if (distrusts(source)) {
        credibility *= cfg.liarDistrustMultiplier;
    }
    return credibility;
}

double Mind::dailyRetention(const EpistemicConfig& cfg) const {
    return std::clamp(1.0 - cfg.baseDailyDecay * (1.0 - memory_), 0.0, 1.0);
}

std::vector<BeliefFacet*> Mind::decayStrengths(std::uint64_t day, const EpistemicConfig& cfg) {
    FacetLimits limits;
    limits.floor = cfg.strengthFloor;
    limits.cap = cfg.strengthCap;
    limits.contradictionErosion = cfg.contradictionErosion;
    const double retention = dailyRetention(cfg);

    std::vector<BeliefFacet*> expired;
    for (BeliefFacet* facet : all_facets_) {
        if (facet->decayStrength(day, retention, limits)) {
            expired.push_back(facet);
        }
    }
    return expired;
}

MentalModel& Mind::modelFor(EntityRef subject) {
    auto it = models_.find(subject);
    if (it == models_.end()) {
        it = models_.emplace(subject, MentalModel(owner_, subject)).first;
    }
    return it->second;
}

void Mind::absorbExposedLiars(BeliefFacet& facet, const Evidence& evidence, const IngestContext& ctx) {
    for (EntityRef liar : facet.exposedLiars()) {
        if (liar == owner_ || distrusts(liar)) {
            continue;
        }
        distrust(liar);
        if (ctx.log) {
            ctx.log->logDistrust(evidence.stamp().tick, evidence.eventNumber(), owner_, liar);
        }
    }
    facet.clearExposedLiars();
}
