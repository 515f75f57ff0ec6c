#include "modules/Transmission.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

#include "kernel/Kernel.h"

namespace {
// Extroversion in [-1, 1] contributes 0..2 topics per participant
double topicShare(const Person& p) {
    return p.personality.extroversion + 1.0;
}

struct Conveyed {
    FeatureType feature;
    std::string value;
};
}

void TransmissionModule::configure(std::uint64_t seed) {
    rng_.seed(seed);
    eavesdropped_ = 0;
}

int TransmissionModule::topicCount(const Kernel& kernel, std::uint32_t a, std::uint32_t b) const {
    const auto& cfg = kernel.epistemic();
    const Person& pa = kernel.person(a);
    const Person& pb = kernel.person(b);

    double k = topicShare(pa) + topicShare(pb);
    const bool friends = kernel.mind(a).salience().of(personRef(b)) >= cfg.friendSalienceThreshold ||
                         kernel.mind(b).salience().of(personRef(a)) >= cfg.friendSalienceThreshold;
    if (friends) {
        k += cfg.friendshipTopicBonus;
    }
    return std::max(cfg.topicsFloor, static_cast<int>(std::floor(k)));
}

std::vector<EntityRef> TransmissionModule::selectTopics(const Kernel& kernel, std::uint32_t a,
                                                        std::uint32_t b) const {
    if (a == b) {
        return {};
    }
    const Mind& ma = kernel.mind(a);
    const Mind& mb = kernel.mind(b);

    // std::map keeps EntityRef order, which the stable sort preserves for equal scores
    std::map<EntityRef, double> scores;
    for (EntityRef e : ma.knownSubjects()) {
        scores[e] = 0.0;
    }
    for (EntityRef e : mb.knownSubjects()) {
        scores[e] = 0.0;
    }
    for (auto& [entity, score] : scores) {
        score = ma.salience().of(entity) + mb.salience().of(entity);
    }

    std::vector<std::pair<EntityRef, double>> ranked(scores.begin(), scores.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& x, const auto& y) { return x.second > y.second; });

    const auto k = static_cast<std::size_t>(topicCount(kernel, a, b));
    std::vector<EntityRef> topics;
    for (std::size_t i = 0; i < ranked.size() && i < k; ++i) {
        topics.push_back(ranked[i].first);
    }
    return topics;
}

ExchangeSummary TransmissionModule::exchangeInformation(Kernel& kernel, std::uint32_t a, std::uint32_t b) {
    ExchangeSummary summary;
    if (a == b) {
        return summary;
    }
    const std::size_t overheardBefore = eavesdropped_;
    const auto topics = selectTopics(kernel, a, b);
    summary.topics = topics.size();
    for (EntityRef subject : topics) {
        talkAbout(kernel, a, b, subject, summary);
        talkAbout(kernel, b, a, subject, summary);
    }
    summary.overheard = eavesdropped_ - overheardBefore;
    return summary;
}

void TransmissionModule::talkAbout(Kernel& kernel, std::uint32_t talker, std::uint32_t listener, EntityRef subject,
                                   ExchangeSummary& summary) {
    const auto& cfg = kernel.epistemic();
    const auto& registry = FeatureRegistry::instance();
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    const double pLie = lieChance(kernel, talker);

    std::vector<FeatureType> truthful;
    std::vector<Conveyed> lies;
    for (FeatureType f : registry.featuresFor(subject.kind)) {
        if (uni(rng_) >= cfg.chanceFeatureComesUp[featureIndex(f)]) {
            continue;
        }
        const BeliefFacet* facet = kernel.mind(talker).facet(subject, f);
        if (!facet || !facet->known()) {
            continue;
        }
        if (uni(rng_) < pLie) {
            std::string alternative = registry.plausibleAlternative(kernel, f, facet->value(), rng_);
            if (!alternative.empty()) {
                lies.push_back({f, std::move(alternative)});
                continue;
            }
        }
        truthful.push_back(f);
    }

    if (!truthful.empty() && makeStatement(kernel, talker, listener, subject, truthful) > 0) {
        ++summary.statements;
    }
    for (const auto& lie : lies) {
        tellLie(kernel, talker, listener, subject, lie.feature, lie.value);
        ++summary.lies;
    }
}

std::size_t TransmissionModule::makeStatement(Kernel& kernel, std::uint32_t talker, std::uint32_t listener,
                                              EntityRef subject, const std::vector<FeatureType>& features) {
    // Snapshot what is conveyed before anyone ingests anything
    std::vector<Conveyed> conveyed;
    TellerStrengths strengths;
    for (FeatureType f : features) {
        const BeliefFacet* facet = kernel.mind(talker).facet(subject, f);
        if (!facet || !facet->known()) {
            continue;
        }
        conveyed.push_back({f, facet->value()});
        strengths[f] = facet->strength();
    }
    if (conveyed.empty()) {
        return 0;
    }

    const EntityRef talkerRef = personRef(talker);
    const EntityRef listenerRef = personRef(listener);

    auto statement = kernel.recordEvidence(subject, talkerRef, StatementDetails{listenerRef, strengths});
    for (const auto& c : conveyed) {
        kernel.ingest(listener, subject, c.feature, c.value, statement);
    }

    auto declaration = kernel.recordEvidence(subject, talkerRef, DeclarationDetails{listenerRef});
    for (const auto& c : conveyed) {
        kernel.ingest(talker, subject, c.feature, c.value, declaration);
    }

    if (auto eavesdropper = pickEavesdropper(kernel, talker, listener)) {
        auto overheard = kernel.recordEvidence(
            subject, talkerRef, EavesdroppingDetails{listenerRef, personRef(*eavesdropper), strengths});
        for (const auto& c : conveyed) {
            kernel.ingest(*eavesdropper, subject, c.feature, c.value, overheard);
        }
        ++eavesdropped_;
    }
    return conveyed.size();
}

void TransmissionModule::tellLie(Kernel& kernel, std::uint32_t liar, std::uint32_t recipient, EntityRef subject,
                                 FeatureType feature, const std::string& falseValue) {
    if (falseValue.empty()) {
        throw ContractViolation("a lie must assert a value");
    }
    const BeliefFacet* own = kernel.mind(liar).facet(subject, feature);
    if (own && own->known() && own->value() == falseValue) {
        throw ContractViolation(kernel.entityName(personRef(liar)) + " attempted to lie with a value they believe");
    }

    // The liar sells the lie with their own confidence, or a plausible one when they have none
    const auto& cfg = kernel.epistemic();
    const double sold = own && own->known() ? own->strength() : cfg.strengthCap * TuningConstants::kLieConfidence;
    TellerStrengths strengths{{feature, sold}};

    const EntityRef liarRef = personRef(liar);
    const EntityRef recipientRef = personRef(recipient);
    auto lie = kernel.recordEvidence(subject, liarRef, LieDetails{recipientRef, strengths});
    kernel.ingest(recipient, subject, feature, falseValue, lie);

    if (auto eavesdropper = pickEavesdropper(kernel, liar, recipient)) {
        auto overheard = kernel.recordEvidence(
            subject, liarRef, EavesdroppingDetails{recipientRef, personRef(*eavesdropper), strengths});
        kernel.ingest(*eavesdropper, subject, feature, falseValue, overheard);
        ++eavesdropped_;
    }
}

std::optional<std::uint32_t> TransmissionModule::pickEavesdropper(const Kernel& kernel, std::uint32_t talker,
                                                                  std::uint32_t listener) {
    std::bernoulli_distribution overhear(kernel.epistemic().chanceEavesdrop);
    if (!overhear(rng_)) {
        return std::nullopt;
    }
    const Person& t = kernel.person(talker);
    if (t.location < 0) {
        return std::nullopt;
    }
    std::vector<std::uint32_t> inEarshot;
    for (std::uint32_t id : kernel.occupants(static_cast<std::uint32_t>(t.location))) {
        if (id != talker && id != listener) {
            inEarshot.push_back(id);
        }
    }
    if (inEarshot.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<std::size_t> pick(0, inEarshot.size() - 1);
    return inEarshot[pick(rng_)];
}

// Disagreeable people lie more: agreeableness -1 doubles the base chance, +1 removes it
double TransmissionModule::lieChance(const Kernel& kernel, std::uint32_t talker) const {
    const double agreeableness = kernel.person(talker).personality.agreeableness;
    return std::clamp(kernel.epistemic().chanceLie * (1.0 - agreeableness), 0.0, 1.0);
}
