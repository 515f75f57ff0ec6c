#include "modules/Evidence.h"

#include <sstream>

#include "kernel/Clock.h"
#include "kernel/Kernel.h"

namespace {
void require(bool condition, const std::string& message) {
    if (!condition) {
        throw ContractViolation(message);
    }
}

std::string nameOf(const Kernel& kernel, EntityRef e) {
    return kernel.entityName(e);
}

void requireFeaturesApply(const TellerStrengths& strengths, EntityRef subject) {
    const auto& registry = FeatureRegistry::instance();
    for (const auto& [feature, strength] : strengths) {
        require(registry.appliesTo(feature, subject.kind),
                std::string("feature '") + registry.name(feature) + "' does not apply to a " +
                    entityKindName(subject.kind));
        require(strength >= 0.0, "teller belief strength must be non-negative");
    }
}

void requireConversation(const Kernel& kernel, EntityRef source, EntityRef recipient, const char* what) {
    require(recipient.isPerson() && kernel.exists(recipient),
            std::string(what) + " recipient must be an existing person");
    require(recipient != source,
            nameOf(kernel, source) + " attempted a " + what + " addressed to themself");
}
}

const char* evidenceKindName(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::Reflection: return "reflection";
        case EvidenceKind::Observation: return "observation";
        case EvidenceKind::Confabulation: return "confabulation";
        case EvidenceKind::Lie: return "lie";
        case EvidenceKind::Statement: return "statement";
        case EvidenceKind::Declaration: return "declaration";
        case EvidenceKind::Eavesdropping: return "eavesdropping";
        case EvidenceKind::Mutation: return "mutation";
        case EvidenceKind::Transference: return "transference";
        case EvidenceKind::Forgetting: return "forgetting";
        case EvidenceKind::Implant: return "implant";
        case EvidenceKind::COUNT: break;
    }
    return "unknown";
}

Evidence::Evidence(EntityRef subject, EntityRef source, EvidenceDetails details, const EvidenceStamp& stamp)
    : subject_(subject), source_(source), details_(std::move(details)), stamp_(stamp) {}

std::optional<EntityRef> Evidence::recipient() const {
    if (const auto* d = detailsAs<LieDetails>()) return d->recipient;
    if (const auto* d = detailsAs<StatementDetails>()) return d->recipient;
    if (const auto* d = detailsAs<DeclarationDetails>()) return d->recipient;
    if (const auto* d = detailsAs<EavesdroppingDetails>()) return d->recipient;
    return std::nullopt;
}

std::optional<EntityRef> Evidence::eavesdropper() const {
    if (const auto* d = detailsAs<EavesdroppingDetails>()) return d->eavesdropper;
    return std::nullopt;
}

const FacetKey* Evidence::transferredFrom() const {
    const auto* d = detailsAs<TransferenceDetails>();
    return d ? &d->transferredFrom : nullptr;
}

const TellerStrengths* Evidence::tellerBeliefStrength() const {
    if (const auto* d = detailsAs<LieDetails>()) return &d->tellerBeliefStrength;
    if (const auto* d = detailsAs<StatementDetails>()) return &d->tellerBeliefStrength;
    if (const auto* d = detailsAs<EavesdroppingDetails>()) return &d->tellerBeliefStrength;
    return nullptr;
}

std::optional<double> Evidence::tellerStrengthFor(FeatureType f) const {
    const TellerStrengths* strengths = tellerBeliefStrength();
    if (!strengths) {
        return std::nullopt;
    }
    auto it = strengths->find(f);
    if (it == strengths->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Evidence::firsthand() const {
    const EvidenceKind k = kind();
    return k == EvidenceKind::Reflection || k == EvidenceKind::Observation;
}

bool Evidence::deterioration() const {
    const EvidenceKind k = kind();
    return k == EvidenceKind::Mutation || k == EvidenceKind::Transference ||
           k == EvidenceKind::Confabulation || k == EvidenceKind::Forgetting;
}

void Evidence::setAdjustedStrength(double strength) {
    if (kind() != EvidenceKind::Forgetting) {
        throw ContractViolation("adjusted strength is only frozen onto forgetting evidence");
    }
    if (adjusted_strength_) {
        throw ContractViolation("adjusted strength is write-once");
    }
    adjusted_strength_ = strength;
}

void validateEvidence(const Kernel& kernel, EntityRef subject, EntityRef source, const EvidenceDetails& details) {
    require(source.isPerson() && kernel.exists(source), "evidence source must be an existing person");
    require(kernel.exists(subject), "evidence subject does not exist");

    const auto kind = static_cast<EvidenceKind>(details.index());
    switch (kind) {
        case EvidenceKind::Reflection:
            require(subject == source,
                    nameOf(kernel, source) + " attempted to reflect about " + nameOf(kernel, subject) +
                        ", who is not themself");
            break;

        case EvidenceKind::Observation: {
            const std::int32_t here = kernel.person(source.id).location;
            require(here >= 0, nameOf(kernel, source) + " attempted to observe while located nowhere");
            if (subject.isPerson()) {
                require(subject != source, nameOf(kernel, source) + " attempted to observe themself");
                require(kernel.person(subject.id).location == here,
                        nameOf(kernel, source) + " attempted to observe " + nameOf(kernel, subject) +
                            ", who is in a different location");
            } else {
                require(static_cast<std::uint32_t>(here) == subject.id,
                        nameOf(kernel, source) + " attempted to observe " + nameOf(kernel, subject) +
                            ", but they are not located there");
            }
            break;
        }

        case EvidenceKind::Lie: {
            const auto& d = std::get<LieDetails>(details);
            requireConversation(kernel, source, d.recipient, "lie");
            requireFeaturesApply(d.tellerBeliefStrength, subject);
            break;
        }

        case EvidenceKind::Statement: {
            const auto& d = std::get<StatementDetails>(details);
            requireConversation(kernel, source, d.recipient, "statement");
            requireFeaturesApply(d.tellerBeliefStrength, subject);
            break;
        }

        case EvidenceKind::Declaration: {
            const auto& d = std::get<DeclarationDetails>(details);
            requireConversation(kernel, source, d.recipient, "declaration");
            break;
        }

        case EvidenceKind::Eavesdropping: {
            const auto& d = std::get<EavesdroppingDetails>(details);
            requireConversation(kernel, source, d.recipient, "statement");
            require(d.eavesdropper.isPerson() && kernel.exists(d.eavesdropper),
                    "eavesdropper must be an existing person");
            require(d.eavesdropper != source && d.eavesdropper != d.recipient,
                    "an eavesdropper cannot be a party to the conversation");
            requireFeaturesApply(d.tellerBeliefStrength, subject);
            break;
        }

        case EvidenceKind::Mutation:
            require(!std::get<MutationDetails>(details).mutatedFrom.empty(),
                    "a mutation must replace a value that was held");
            break;

        case EvidenceKind::Transference: {
            const auto& d = std::get<TransferenceDetails>(details);
            require(d.transferredFrom.owner == source,
                    "transference must draw on the transferring person's own belief");
            require(d.transferredFrom.subject != subject,
                    "transference must come from a belief about a different subject");
            require(FeatureRegistry::instance().appliesTo(d.transferredFrom.feature, subject.kind),
                    "transferred feature does not apply to the subject");
            break;
        }

        case EvidenceKind::Implant:
            require(std::get<ImplantDetails>(details).salienceOfSubject >= 0.0,
                    "implant salience must be non-negative");
            break;

        case EvidenceKind::Confabulation:
        case EvidenceKind::Forgetting:
        case EvidenceKind::COUNT:
            break;
    }
}

std::string describe(const Evidence& evidence, const Kernel& kernel) {
    const EvidenceStamp& stamp = evidence.stamp();
    std::ostringstream where;
    where << "at "
          << (stamp.location >= 0 ? kernel.place(static_cast<std::uint32_t>(stamp.location)).name
                                  : std::string("an unknown place"))
          << " on the " << (stamp.night ? "night" : "day") << " of day "
          << (stamp.ordinalDate % SimClock::kDaysPerYear) + 1 << ", " << stamp.ordinalDate / SimClock::kDaysPerYear;
    const std::string when = where.str();

    const std::string source = nameOf(kernel, evidence.source());
    const std::string subject = nameOf(kernel, evidence.subject());
    std::ostringstream os;

    switch (evidence.kind()) {
        case EvidenceKind::Reflection:
            os << source << "'s reflection about themself " << when;
            break;
        case EvidenceKind::Observation:
            os << source << "'s observation of " << subject << " " << when;
            break;
        case EvidenceKind::Confabulation:
            os << source << "'s confabulation about " << subject << " " << when;
            break;
        case EvidenceKind::Lie:
            os << source << "'s lie to " << nameOf(kernel, *evidence.recipient()) << " about " << subject << " "
               << when;
            break;
        case EvidenceKind::Statement:
            os << source << "'s statement to " << nameOf(kernel, *evidence.recipient()) << " about " << subject
               << " " << when;
            break;
        case EvidenceKind::Declaration:
            os << source << "'s own statement (declaration) to " << nameOf(kernel, *evidence.recipient())
               << " about " << subject << " " << when;
            break;
        case EvidenceKind::Eavesdropping:
            os << nameOf(kernel, *evidence.eavesdropper()) << "'s eavesdropping of " << source
               << "'s statement to " << nameOf(kernel, *evidence.recipient()) << " about " << subject << " "
               << when;
            break;
        case EvidenceKind::Mutation:
            os << source << "'s mutation of their mental model of " << subject << " " << when;
            break;
        case EvidenceKind::Transference:
            os << source << "'s transference from their mental model of "
               << nameOf(kernel, evidence.transferredFrom()->subject) << " to their mental model of " << subject
               << " " << when;
            break;
        case EvidenceKind::Forgetting:
            os << source << "'s forgetting of knowledge about " << subject << " " << when;
            break;
        case EvidenceKind::Implant:
            os << source << "'s implanted knowledge of " << subject << " " << when;
            break;
        case EvidenceKind::COUNT:
            break;
    }
    return os.str();
}

EvidencePtr EvidenceLedger::record(const Kernel& kernel, SimClock& clock, EntityRef subject, EntityRef source,
                                   EvidenceDetails details) {
    validateEvidence(kernel, subject, source, details);

    EvidenceStamp stamp;
    stamp.location = kernel.person(source.id).location;
    stamp.ordinalDate = clock.ordinalDate();
    stamp.night = clock.night();
    stamp.tick = clock.tick();
    stamp.eventNumber = clock.assignEventNumber();

    auto evidence = std::make_shared<Evidence>(subject, source, std::move(details), stamp);
    counts_[static_cast<std::size_t>(evidence->kind())]++;
    records_.push_back(evidence);
    return evidence;
}

void EvidenceLedger::clear() {
    records_.clear();
    for (auto& c : counts_) {
        c = 0;
    }
}
