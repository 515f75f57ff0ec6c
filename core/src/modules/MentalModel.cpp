#include "modules/MentalModel.h"

#include <algorithm>

#include "kernel/Kernel.h"
#include "modules/Mind.h"
#include "utils/EventLog.h"

namespace {
// Strength assumed for conveyed features the teller did not attach a strength to
constexpr double kUnstatedTellerShare = 0.5;
// Share of the cap a concocted value starts from
constexpr double kConfabulationShare = 0.5;

EventType eventFor(IngestOutcome outcome) {
    switch (outcome) {
        case IngestOutcome::Supplanted: return EventType::Supplanted;
        case IngestOutcome::Forgotten: return EventType::Forgotten;
        case IngestOutcome::Reinstated: return EventType::Reinstated;
        default: break;
    }
    return EventType::COUNT;
}

bool atWorkplace(const Person& p) {
    return p.workplace >= 0 && p.location == p.workplace;
}
}

FacetLimits IngestContext::limits() const {
    FacetLimits l;
    if (config) {
        l.floor = config->strengthFloor;
        l.cap = config->strengthCap;
        l.contradictionErosion = config->contradictionErosion;
    }
    return l;
}

MentalModel::MentalModel(EntityRef owner, EntityRef subject) : owner_(owner), subject_(subject) {}

BeliefFacet& MentalModel::getOrCreateFacet(FeatureType feature, std::vector<BeliefFacet*>* registry) {
    auto it = facets_.find(feature);
    if (it != facets_.end()) {
        return *it->second;
    }
    if (!FeatureRegistry::instance().appliesTo(feature, subject_.kind)) {
        throw ContractViolation(std::string("feature '") + featureName(feature) + "' does not apply to a " +
                                entityKindName(subject_.kind));
    }
    auto facet = std::make_unique<BeliefFacet>(owner_, subject_, feature);
    BeliefFacet& ref = *facet;
    facets_.emplace(feature, std::move(facet));
    if (registry) {
        registry->push_back(&ref);
    }
    return ref;
}

const BeliefFacet* MentalModel::facet(FeatureType feature) const {
    auto it = facets_.find(feature);
    return it == facets_.end() ? nullptr : it->second.get();
}

IngestOutcome MentalModel::considerNewEvidence(FeatureType feature, const std::string& proposedValue,
                                               const EvidencePtr& evidence, const IngestContext& ctx) {
    if (!evidence) {
        throw ContractViolation("a mental model cannot consider missing evidence");
    }
    if (evidence->subject() != subject_) {
        throw ContractViolation("evidence about one subject routed to the mental model of another");
    }

    BeliefFacet& facet = getOrCreateFacet(feature, ctx.registry);
    const double weight = evidenceWeight(feature, *evidence, ctx);
    const IngestOutcome outcome = facet.considerNewEvidence(proposedValue, evidence, weight, ctx.limits(), ctx.day);

    const EventType logged = eventFor(outcome);
    if (ctx.log && logged != EventType::COUNT) {
        ctx.log->logBeliefChange(logged, evidence->stamp().tick, evidence->eventNumber(), owner_, subject_,
                                 static_cast<std::uint8_t>(feature), facet.value());
    }
    return outcome;
}

std::size_t MentalModel::buildUp(const Kernel& kernel, const EvidencePtr& evidence, const IngestContext& ctx) {
    const auto& registry = FeatureRegistry::instance();
    const std::vector<FeatureType>* features = nullptr;

    switch (evidence->kind()) {
        case EvidenceKind::Reflection:
        case EvidenceKind::Implant:
            features = &registry.featuresFor(subject_.kind);
            break;
        case EvidenceKind::Observation: {
            const bool working = subject_.isPerson() && atWorkplace(kernel.person(subject_.id));
            features = &registry.observableFor(subject_.kind, working);
            break;
        }
        default:
            throw ContractViolation(std::string("cannot build up a mental model from ") +
                                    evidenceKindName(evidence->kind()) + " evidence");
    }

    for (FeatureType f : *features) {
        considerNewEvidence(f, registry.trueValue(kernel, subject_, f), evidence, ctx);
    }
    return features->size();
}

double MentalModel::evidenceWeight(FeatureType feature, const Evidence& evidence, const IngestContext& ctx) const {
    if (!ctx.config || !ctx.weighting || !*ctx.weighting) {
        throw ContractViolation("evidence weighting requires a configuration and a scoring function");
    }
    EvidenceWeightInputs in;
    in.kind = evidence.kind();
    in.kindBaseStrength = ctx.config->base(evidence.kind());
    in.sourceCredibility = ctx.sourceCredibility;
    in.ownerMemory = ctx.ownerMemory;

    const double cap = ctx.config->strengthCap;
    switch (evidence.kind()) {
        // Self-reinforcement and misremembering scale with how strongly the value was already held
        case EvidenceKind::Declaration:
        case EvidenceKind::Mutation: {
            const BeliefFacet* existing = facet(feature);
            in.transmittedStrength = existing && existing->known() ? existing->strength() / cap : kUnstatedTellerShare;
            break;
        }
        default:
            in.transmittedStrength = transmittedStrength(feature, evidence, cap);
            break;
    }
    return std::max(0.0, (*ctx.weighting)(in));
}

double MentalModel::transmittedStrength(FeatureType feature, const Evidence& evidence, double cap) const {
    switch (evidence.kind()) {
        case EvidenceKind::Reflection:
        case EvidenceKind::Observation:
            return 1.0;
        case EvidenceKind::Lie:
        case EvidenceKind::Statement:
        case EvidenceKind::Eavesdropping: {
            const auto told = evidence.tellerStrengthFor(feature);
            return told ? std::clamp(*told / cap, 0.0, 1.0) : kUnstatedTellerShare;
        }
        case EvidenceKind::Confabulation:
            return kConfabulationShare;
        case EvidenceKind::Transference:
            return std::clamp(evidence.detailsAs<TransferenceDetails>()->transferredStrength / cap, 0.0, 1.0);
        case EvidenceKind::Implant: {
            const double s = evidence.detailsAs<ImplantDetails>()->salienceOfSubject;
            return s / (s + 1.0);
        }
        case EvidenceKind::Forgetting:
            return 0.0;
        default:
            break;
    }
    return 1.0;
}

std::vector<EntityRef> MentalModel::employees(const Mind& mind, const Kernel& kernel) const {
    std::vector<EntityRef> out;
    if (subject_.kind != EntityKind::Business) {
        return out;
    }
    const std::string& company = kernel.place(subject_.id).name;
    for (EntityRef subject : mind.knownSubjects()) {
        if (!subject.isPerson()) {
            continue;
        }
        const BeliefFacet* workplace = mind.facet(subject, FeatureType::Workplace);
        if (workplace && workplace->known() && workplace->value() == company) {
            out.push_back(subject);
        }
    }
    return out;
}
