#include "modules/Features.h"

#include <algorithm>
#include <set>

#include "kernel/Kernel.h"

namespace {
const Person& subjectPerson(const Kernel& kernel, EntityRef subject) {
    return kernel.person(subject.id);
}

const Place* workplaceOf(const Kernel& kernel, const Person& p) {
    return p.workplace >= 0 ? &kernel.place(static_cast<std::uint32_t>(p.workplace)) : nullptr;
}

const Place* homeOf(const Kernel& kernel, const Person& p) {
    return p.home >= 0 ? &kernel.place(static_cast<std::uint32_t>(p.home)) : nullptr;
}

// Features whose true value is "no value" use the literal "None", since the empty string marks forgetting
std::string orNone(const std::string& value) {
    return value.empty() ? "None" : value;
}

std::string sexOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).female ? "f" : "m"; }

std::string statusOf(const Kernel& k, EntityRef s) {
    switch (subjectPerson(k, s).status) {
        case LifeStatus::Alive: return "alive";
        case LifeStatus::Dead: return "dead";
        case LifeStatus::Departed: return "departed";
    }
    return "alive";
}

std::string maritalStatusOf(const Kernel& k, EntityRef s) {
    switch (subjectPerson(k, s).marital) {
        case MaritalStatus::Single: return "single";
        case MaritalStatus::Married: return "married";
        case MaritalStatus::Widowed: return "widowed";
        case MaritalStatus::Divorced: return "divorced";
    }
    return "single";
}

std::string birthYearOf(const Kernel& k, EntityRef s) { return std::to_string(subjectPerson(k, s).birthYear); }

std::string approximateAgeOf(const Kernel& k, EntityRef s) {
    return std::to_string(subjectPerson(k, s).age / 10) + "0s";
}

std::string firstNameOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).firstName; }
std::string middleNameOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).middleName; }
std::string lastNameOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).lastName; }
std::string suffixOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).suffix; }

std::string workplaceNameOf(const Kernel& k, EntityRef s) {
    const Place* w = workplaceOf(k, subjectPerson(k, s));
    return w ? w->name : "None";
}

std::string jobTitleOf(const Kernel& k, EntityRef s) {
    const Person& p = subjectPerson(k, s);
    return p.workplace >= 0 ? orNone(p.jobTitle) : "None";
}

std::string jobShiftOf(const Kernel& k, EntityRef s) {
    const Person& p = subjectPerson(k, s);
    return p.workplace >= 0 ? orNone(p.jobShift) : "None";
}

std::string workplaceAddressOf(const Kernel& k, EntityRef s) {
    const Place* w = workplaceOf(k, subjectPerson(k, s));
    return w ? w->address : "None";
}

std::string jobStatusOf(const Kernel& k, EntityRef s) {
    const Person& p = subjectPerson(k, s);
    if (p.workplace >= 0) return "employed";
    if (p.retired) return "retired";
    return "unemployed";
}

std::string homeNameOf(const Kernel& k, EntityRef s) {
    const Place* h = homeOf(k, subjectPerson(k, s));
    return h ? h->name : "None";
}

std::string homeAddressOf(const Kernel& k, EntityRef s) {
    const Place* h = homeOf(k, subjectPerson(k, s));
    return h ? h->address : "None";
}

std::string skinColorOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.skinColor; }
std::string hairLengthOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.hairLength; }
std::string hairColorOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.hairColor; }
std::string eyeColorOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.eyeColor; }
std::string facialHairOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.facialHairStyle; }
std::string glassesOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.glasses; }
std::string tattooOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.tattoo; }
std::string scarOf(const Kernel& k, EntityRef s) { return subjectPerson(k, s).appearance.scar; }

std::string placeAddressOf(const Kernel& k, EntityRef s) { return k.place(s.id).address; }
std::string placeBlockOf(const Kernel& k, EntityRef s) { return std::to_string(k.place(s.id).block); }
std::string apartmentOf(const Kernel& k, EntityRef s) { return k.place(s.id).apartment ? "yes" : "no"; }

FeatureSpec personFeature(FeatureType t, const char* name, FeatureAccessor accessor,
                          bool visible = false, std::vector<std::string> pool = {}) {
    FeatureSpec s;
    s.type = t;
    s.name = name;
    s.person = true;
    s.visible = visible;
    s.accessor = accessor;
    s.pool = std::move(pool);
    return s;
}

FeatureSpec workFeature(FeatureType t, const char* name, FeatureAccessor accessor) {
    FeatureSpec s = personFeature(t, name, accessor);
    s.workVisible = true;
    return s;
}

FeatureSpec placeFeature(FeatureType t, const char* name, FeatureAccessor accessor,
                         bool business, std::vector<std::string> pool = {}) {
    FeatureSpec s;
    s.type = t;
    s.name = name;
    s.residence = true;
    s.business = business;
    s.visible = true;
    s.accessor = accessor;
    s.pool = std::move(pool);
    return s;
}

// No default branch: adding a FeatureType without a spec is a -Wswitch warning
FeatureSpec makeSpec(FeatureType t) {
    switch (t) {
        case FeatureType::Sex: return personFeature(t, "sex", sexOf, true, {"m", "f"});
        case FeatureType::Status: return personFeature(t, "status", statusOf, false, {"alive", "dead", "departed"});
        case FeatureType::MaritalStatus:
            return personFeature(t, "marital status", maritalStatusOf, false,
                                 {"single", "married", "widowed", "divorced"});
        case FeatureType::BirthYear: return personFeature(t, "birth year", birthYearOf);
        case FeatureType::ApproximateAge: return personFeature(t, "approximate age", approximateAgeOf, true);
        case FeatureType::FirstName: return personFeature(t, "first name", firstNameOf);
        case FeatureType::MiddleName: return personFeature(t, "middle name", middleNameOf);
        case FeatureType::LastName: return personFeature(t, "last name", lastNameOf);
        case FeatureType::Suffix: return personFeature(t, "suffix", suffixOf, false, {"None", "Jr.", "Sr.", "III"});
        case FeatureType::Workplace: return workFeature(t, "workplace", workplaceNameOf);
        case FeatureType::JobTitle: return workFeature(t, "job title", jobTitleOf);
        case FeatureType::JobShift: return workFeature(t, "job shift", jobShiftOf);
        case FeatureType::WorkplaceAddress: return personFeature(t, "workplace address", workplaceAddressOf);
        case FeatureType::JobStatus:
            return personFeature(t, "job status", jobStatusOf, false, {"employed", "unemployed", "retired"});
        case FeatureType::Home: return personFeature(t, "home", homeNameOf);
        case FeatureType::HomeAddress: return personFeature(t, "home address", homeAddressOf);
        case FeatureType::SkinColor:
            return personFeature(t, "skin color", skinColorOf, true,
                                 {"black", "brown", "beige", "pink", "white"});
        case FeatureType::HairLength:
            return personFeature(t, "hair length", hairLengthOf, true, {"bald", "short", "medium", "long"});
        case FeatureType::HairColor:
            return personFeature(t, "hair color", hairColorOf, true,
                                 {"black", "brown", "blond", "red", "gray", "white"});
        case FeatureType::EyeColor:
            return personFeature(t, "eye color", eyeColorOf, true, {"black", "brown", "blue", "green", "gray"});
        case FeatureType::FacialHairStyle:
            return personFeature(t, "facial hair style", facialHairOf, true,
                                 {"none", "mustache", "goatee", "sideburns", "beard"});
        case FeatureType::Glasses: return personFeature(t, "glasses", glassesOf, true, {"yes", "no"});
        case FeatureType::Tattoo: return personFeature(t, "tattoo", tattooOf, true, {"yes", "no"});
        case FeatureType::Scar: return personFeature(t, "scar", scarOf, true, {"yes", "no"});
        case FeatureType::PlaceAddress: return placeFeature(t, "address", placeAddressOf, true);
        case FeatureType::PlaceBlock: return placeFeature(t, "block", placeBlockOf, true);
        case FeatureType::HomeIsApartment: return placeFeature(t, "home is apartment", apartmentOf, false, {"yes", "no"});
        case FeatureType::COUNT: break;
    }
    return FeatureSpec{};
}

std::size_t kindSlot(EntityKind kind) {
    return static_cast<std::size_t>(kind);
}
}

const FeatureRegistry& FeatureRegistry::instance() {
    static const FeatureRegistry registry;
    return registry;
}

FeatureRegistry::FeatureRegistry() {
    for (std::size_t i = 0; i < kFeatureCount; ++i) {
        const auto type = static_cast<FeatureType>(i);
        specs_[i] = makeSpec(type);
        const FeatureSpec& s = specs_[i];

        if (s.person) {
            by_kind_[kindSlot(EntityKind::Person)].push_back(type);
            if (s.visible) {
                person_visible_.push_back(type);
                person_visible_at_work_.push_back(type);
            } else if (s.workVisible) {
                person_visible_at_work_.push_back(type);
            }
        }
        if (s.residence) {
            by_kind_[kindSlot(EntityKind::Residence)].push_back(type);
            place_visible_[kindSlot(EntityKind::Residence)].push_back(type);
        }
        if (s.business) {
            by_kind_[kindSlot(EntityKind::Business)].push_back(type);
            place_visible_[kindSlot(EntityKind::Business)].push_back(type);
        }
    }
}

std::optional<FeatureType> FeatureRegistry::fromName(const std::string& name) const {
    for (const auto& s : specs_) {
        if (name == s.name) {
            return s.type;
        }
    }
    return std::nullopt;
}

bool FeatureRegistry::appliesTo(FeatureType f, EntityKind kind) const {
    const FeatureSpec& s = spec(f);
    switch (kind) {
        case EntityKind::Person: return s.person;
        case EntityKind::Residence: return s.residence;
        case EntityKind::Business: return s.business;
    }
    return false;
}

const std::vector<FeatureType>& FeatureRegistry::featuresFor(EntityKind kind) const {
    return by_kind_[kindSlot(kind)];
}

const std::vector<FeatureType>& FeatureRegistry::observableFor(EntityKind kind, bool atWork) const {
    if (kind == EntityKind::Person) {
        return atWork ? person_visible_at_work_ : person_visible_;
    }
    return place_visible_[kindSlot(kind)];
}

std::string FeatureRegistry::trueValue(const Kernel& kernel, EntityRef subject, FeatureType f) const {
    if (!appliesTo(f, subject.kind)) {
        return std::string();
    }
    // Unset ground truth reads as "None" so it never collides with the unknown marker
    return orNone(spec(f).accessor(kernel, subject));
}

std::string FeatureRegistry::plausibleAlternative(const Kernel& kernel, FeatureType f,
                                                  const std::string& avoid, std::mt19937_64& rng) const {
    const FeatureSpec& s = spec(f);
    std::vector<std::string> candidates;

    if (!s.pool.empty()) {
        for (const auto& v : s.pool) {
            if (v != avoid) candidates.push_back(v);
        }
    } else {
        // Draw from values that actually occur in town, in a stable order
        std::set<std::string> seen;
        if (s.person) {
            for (const auto& p : kernel.people()) {
                seen.insert(s.accessor(kernel, personRef(p.id)));
            }
        }
        if (s.residence || s.business) {
            for (const auto& place : kernel.places()) {
                if (appliesTo(f, place.kind)) {
                    seen.insert(s.accessor(kernel, place.ref()));
                }
            }
        }
        seen.erase(avoid);
        seen.erase(std::string());
        candidates.assign(seen.begin(), seen.end());
    }

    if (candidates.empty()) {
        return std::string();
    }
    std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
    return candidates[pick(rng)];
}
