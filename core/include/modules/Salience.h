#ifndef SALIENCE_MODULE_H
#define SALIENCE_MODULE_H

#include <cstddef>
#include <map>
#include <vector>

#include "kernel/Entity.h"

// How much each entity matters to one owner. Weights never go below 0.
class SalienceMap {
public:
    void increment(EntityRef entity, double amount);
    void set(EntityRef entity, double weight);
    double of(EntityRef entity) const;
    bool contains(EntityRef entity) const { return weights_.count(entity) > 0; }

    const std::map<EntityRef, double>& weights() const { return weights_; }
    std::size_t size() const { return weights_.size(); }

    // Entities ordered by descending weight, EntityRef order breaking ties
    std::vector<EntityRef> ranked() const;

private:
    std::map<EntityRef, double> weights_;
};

#endif
