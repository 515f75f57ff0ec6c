#ifndef ENTITY_H
#define ENTITY_H

#include <cstdint>
#include <cstddef>
#include <string>

// Anything a person can hold beliefs about
enum class EntityKind : std::uint8_t {
    Person = 0,
    Residence = 1,
    Business = 2
};

// Typed handle: people index the person table, residences and businesses index the place table
struct EntityRef {
    EntityKind kind = EntityKind::Person;
    std::uint32_t id = 0;

    bool isPerson() const { return kind == EntityKind::Person; }
    bool isPlace() const { return kind != EntityKind::Person; }

    bool operator==(const EntityRef& other) const {
        return kind == other.kind && id == other.id;
    }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
    bool operator<(const EntityRef& other) const {
        if (kind != other.kind) return kind < other.kind;
        return id < other.id;
    }
};

struct EntityRefHash {
    std::size_t operator()(const EntityRef& e) const {
        std::uint64_t combined = (static_cast<std::uint64_t>(e.kind) << 32) | e.id;
        combined ^= (combined >> 33);
        combined *= 0xff51afd7ed558ccdULL;
        combined ^= (combined >> 33);
        return static_cast<std::size_t>(combined);
    }
};

inline EntityRef personRef(std::uint32_t id) {
    return EntityRef{EntityKind::Person, id};
}

inline const char* entityKindName(EntityKind kind) {
    switch (kind) {
        case EntityKind::Person: return "person";
        case EntityKind::Residence: return "residence";
        case EntityKind::Business: return "business";
    }
    return "unknown";
}

// ---------- Places ----------
struct Place {
    std::uint32_t id = 0;
    EntityKind kind = EntityKind::Residence;
    std::string name;
    std::string address;
    int block = 0;
    bool apartment = false;   // residences only

    EntityRef ref() const { return EntityRef{kind, id}; }
};

#endif
