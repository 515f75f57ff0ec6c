#include "utils/Validation.h"

#include <stdexcept>
#include <string>

namespace {
void requireProbability(double p, const std::string& name) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument(name + " must be a probability in [0, 1] (got " + std::to_string(p) + ")");
    }
}

void requireNonNegative(double v, const std::string& name) {
    if (!(v >= 0.0)) {
        throw std::invalid_argument(name + " must be >= 0 (got " + std::to_string(v) + ")");
    }
}
}

void validateEpistemicConfig(const EpistemicConfig& cfg) {
    if (!(cfg.strengthFloor > 0.0)) {
        throw std::invalid_argument("strengthFloor must be > 0 (got " + std::to_string(cfg.strengthFloor) + ")");
    }
    if (!(cfg.strengthCap > cfg.strengthFloor)) {
        throw std::invalid_argument("strengthCap must exceed strengthFloor (got cap " +
                                    std::to_string(cfg.strengthCap) + ", floor " +
                                    std::to_string(cfg.strengthFloor) + ")");
    }
    for (std::size_t k = 0; k < kEvidenceKindCount; ++k) {
        requireNonNegative(cfg.baseStrength[k],
                           std::string("base strength of ") + evidenceKindName(static_cast<EvidenceKind>(k)));
    }
    if (!(cfg.baseDailyDecay > 0.0 && cfg.baseDailyDecay < 1.0)) {
        throw std::invalid_argument("baseDailyDecay must be in (0, 1) (got " + std::to_string(cfg.baseDailyDecay) +
                                    ")");
    }
    requireNonNegative(cfg.contradictionErosion, "contradictionErosion");
    requireProbability(cfg.liarDistrustMultiplier, "liarDistrustMultiplier");
    requireProbability(cfg.unknownSourceCredibility, "unknownSourceCredibility");

    requireProbability(cfg.chanceObserveNearbyEntity, "chanceObserveNearbyEntity");
    requireProbability(cfg.chanceReflectPerDay, "chanceReflectPerDay");
    for (std::size_t f = 0; f < kFeatureCount; ++f) {
        requireProbability(cfg.chanceFeatureComesUp[f],
                           std::string("chance '") + featureName(static_cast<FeatureType>(f)) + "' comes up");
    }
    requireProbability(cfg.chanceEavesdrop, "chanceEavesdrop");
    requireProbability(cfg.chanceLie, "chanceLie");
    if (cfg.topicsFloor < 1) {
        throw std::invalid_argument("topicsFloor must be >= 1 (got " + std::to_string(cfg.topicsFloor) + ")");
    }
    requireNonNegative(cfg.friendSalienceThreshold, "friendSalienceThreshold");
    requireNonNegative(cfg.friendshipTopicBonus, "friendshipTopicBonus");

    requireProbability(cfg.instigationFloor, "instigationFloor");
    requireProbability(cfg.instigationCap, "instigationCap");
    if (cfg.instigationFloor > cfg.instigationCap) {
        throw std::invalid_argument("instigationFloor must not exceed instigationCap");
    }
    requireProbability(cfg.friendshipInstigationBonus, "friendshipInstigationBonus");

    requireProbability(cfg.chanceMutation, "chanceMutation");
    requireProbability(cfg.chanceTransference, "chanceTransference");
    requireProbability(cfg.chanceConfabulation, "chanceConfabulation");

    requireNonNegative(cfg.salienceSelf, "salienceSelf");
    requireNonNegative(cfg.salienceHousehold, "salienceHousehold");
    requireNonNegative(cfg.salienceCoworker, "salienceCoworker");
    requireNonNegative(cfg.salienceHome, "salienceHome");
    requireNonNegative(cfg.salienceWorkplace, "salienceWorkplace");
    requireNonNegative(cfg.saliencePerInteraction, "saliencePerInteraction");
}

void validateConfig(const KernelConfig& cfg) {
    if (cfg.population > 0 && cfg.residences == 0) {
        throw std::invalid_argument("a populated town needs at least one residence");
    }
    requireProbability(cfg.employmentRate, "employmentRate");
    validateEpistemicConfig(cfg.epistemic);
}
