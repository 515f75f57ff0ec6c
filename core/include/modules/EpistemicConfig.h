#ifndef EPISTEMIC_CONFIG_H
#define EPISTEMIC_CONFIG_H

#include <array>

#include "modules/Evidence.h"
#include "modules/Features.h"

// Base strength each kind of evidence contributes before scaling, on the [floor, cap] scale
inline std::array<double, kEvidenceKindCount> defaultBaseStrengths() {
    std::array<double, kEvidenceKindCount> s{};
    s[static_cast<std::size_t>(EvidenceKind::Reflection)] = 100.0;
    s[static_cast<std::size_t>(EvidenceKind::Observation)] = 50.0;
    s[static_cast<std::size_t>(EvidenceKind::Confabulation)] = 5.0;
    s[static_cast<std::size_t>(EvidenceKind::Lie)] = 30.0;
    s[static_cast<std::size_t>(EvidenceKind::Statement)] = 30.0;
    s[static_cast<std::size_t>(EvidenceKind::Declaration)] = 5.0;
    s[static_cast<std::size_t>(EvidenceKind::Eavesdropping)] = 15.0;
    s[static_cast<std::size_t>(EvidenceKind::Mutation)] = 10.0;
    s[static_cast<std::size_t>(EvidenceKind::Transference)] = 10.0;
    s[static_cast<std::size_t>(EvidenceKind::Forgetting)] = 0.0;
    s[static_cast<std::size_t>(EvidenceKind::Implant)] = 40.0;
    return s;
}

// Chance each feature comes up when someone is talked about
inline std::array<double, kFeatureCount> defaultConversationChances() {
    std::array<double, kFeatureCount> c{};
    c.fill(0.1);
    c[featureIndex(FeatureType::Status)] = 0.5;
    c[featureIndex(FeatureType::FirstName)] = 0.6;
    c[featureIndex(FeatureType::LastName)] = 0.5;
    c[featureIndex(FeatureType::MiddleName)] = 0.05;
    c[featureIndex(FeatureType::Suffix)] = 0.02;
    c[featureIndex(FeatureType::MaritalStatus)] = 0.3;
    c[featureIndex(FeatureType::Workplace)] = 0.4;
    c[featureIndex(FeatureType::JobTitle)] = 0.3;
    c[featureIndex(FeatureType::JobStatus)] = 0.3;
    c[featureIndex(FeatureType::Home)] = 0.3;
    c[featureIndex(FeatureType::HomeAddress)] = 0.15;
    c[featureIndex(FeatureType::HairColor)] = 0.15;
    c[featureIndex(FeatureType::PlaceAddress)] = 0.3;
    c[featureIndex(FeatureType::PlaceBlock)] = 0.2;
    return c;
}

// ---------- Epistemic Configuration ----------
// Tunable tables consumed by the belief and transmission modules
struct EpistemicConfig {
    // Strength scale
    double strengthFloor = 1.0;             // at or below this a belief is forgotten
    double strengthCap = 100.0;
    std::array<double, kEvidenceKindCount> baseStrength = defaultBaseStrengths();

    // Dynamics
    double baseDailyDecay = 0.02;           // daily loss fraction at memory 0
    double contradictionErosion = 0.25;     // share of a resisted contradiction's weight lost
    double liarDistrustMultiplier = 0.25;   // credibility kept by a source caught lying
    double unknownSourceCredibility = 0.5;  // credibility of a stranger

    // Perception
    double chanceObserveNearbyEntity = 0.75;
    double chanceReflectPerDay = 0.05;

    // Conversation
    std::array<double, kFeatureCount> chanceFeatureComesUp = defaultConversationChances();
    double chanceEavesdrop = 0.05;
    double chanceLie = 0.03;                // scaled up by low agreeableness
    int topicsFloor = 1;
    double friendSalienceThreshold = 3.0;
    double friendshipTopicBonus = 2.0;

    // Instigating interaction
    double instigationFloor = 0.05;
    double instigationCap = 0.9;
    double friendshipInstigationBonus = 0.3;

    // Memory noise, per known facet per day, scaled by (1 - memory)
    double chanceMutation = 0.0005;
    double chanceTransference = 0.0002;
    double chanceConfabulation = 0.002;     // per forgotten facet per day

    // Salience increments
    double salienceSelf = 10.0;
    double salienceHousehold = 4.0;
    double salienceCoworker = 1.5;
    double salienceHome = 2.0;
    double salienceWorkplace = 2.0;
    double saliencePerInteraction = 0.05;

    double base(EvidenceKind kind) const { return baseStrength[static_cast<std::size_t>(kind)]; }
};

#endif
