#include "modules/Salience.h"

#include <algorithm>

void SalienceMap::increment(EntityRef entity, double amount) {
    double& w = weights_[entity];
    w = std::max(0.0, w + amount);
}

void SalienceMap::set(EntityRef entity, double weight) {
    weights_[entity] = std::max(0.0, weight);
}

double SalienceMap::of(EntityRef entity) const {
    auto it = weights_.find(entity);
    return it == weights_.end() ? 0.0 : it->second;
}

std::vector<EntityRef> SalienceMap::ranked() const {
    std::vector<std::pair<EntityRef, double>> entries(weights_.begin(), weights_.end());
    // map iteration is already in EntityRef order, so a stable sort keeps it for ties
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    std::vector<EntityRef> out;
    out.reserve(entries.size());
    for (const auto& [entity, weight] : entries) {
        (void)weight;
        out.push_back(entity);
    }
    return out;
}
