#ifndef FEATURES_MODULE_H
#define FEATURES_MODULE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "kernel/Entity.h"

class Kernel;

// Every believable attribute of a person or place
enum class FeatureType : std::uint8_t {
    // Person: identity
    Sex = 0,
    Status,
    MaritalStatus,
    BirthYear,
    ApproximateAge,
    FirstName,
    MiddleName,
    LastName,
    Suffix,
    // Person: work and home
    Workplace,
    JobTitle,
    JobShift,
    WorkplaceAddress,
    JobStatus,
    Home,
    HomeAddress,
    // Person: appearance
    SkinColor,
    HairLength,
    HairColor,
    EyeColor,
    FacialHairStyle,
    Glasses,
    Tattoo,
    Scar,
    // Places
    PlaceAddress,
    PlaceBlock,
    HomeIsApartment,
    COUNT
};

constexpr std::size_t kFeatureCount = static_cast<std::size_t>(FeatureType::COUNT);

inline std::size_t featureIndex(FeatureType f) { return static_cast<std::size_t>(f); }

// Reads the live ground-truth value of one feature; never returns the empty string
using FeatureAccessor = std::string (*)(const Kernel& kernel, EntityRef subject);

struct FeatureSpec {
    FeatureType type = FeatureType::Sex;
    const char* name = "";
    bool person = false;                // applies to people
    bool residence = false;             // applies to residences
    bool business = false;              // applies to businesses
    bool visible = false;               // learned by looking at the subject
    bool workVisible = false;           // learned by seeing the subject at work
    FeatureAccessor accessor = nullptr;
    std::vector<std::string> pool;      // plausible values; empty means "values seen in town"
};

// Dispatch table from feature kind to accessor and metadata, built once
class FeatureRegistry {
public:
    static const FeatureRegistry& instance();

    const FeatureSpec& spec(FeatureType f) const { return specs_[featureIndex(f)]; }
    const char* name(FeatureType f) const { return spec(f).name; }
    std::optional<FeatureType> fromName(const std::string& name) const;

    bool appliesTo(FeatureType f, EntityKind kind) const;
    const std::vector<FeatureType>& featuresFor(EntityKind kind) const;
    const std::vector<FeatureType>& observableFor(EntityKind kind, bool atWork) const;

    std::string trueValue(const Kernel& kernel, EntityRef subject, FeatureType f) const;

    // A value other than `avoid` that someone could plausibly believe; empty if none exists
    std::string plausibleAlternative(const Kernel& kernel, FeatureType f,
                                     const std::string& avoid, std::mt19937_64& rng) const;

private:
    FeatureRegistry();

    std::array<FeatureSpec, kFeatureCount> specs_{};
    std::array<std::vector<FeatureType>, 3> by_kind_{};
    std::vector<FeatureType> person_visible_;
    std::vector<FeatureType> person_visible_at_work_;
    std::array<std::vector<FeatureType>, 3> place_visible_{};
};

inline const char* featureName(FeatureType f) {
    return FeatureRegistry::instance().name(f);
}

#endif
