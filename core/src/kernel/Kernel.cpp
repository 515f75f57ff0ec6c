#include "kernel/Kernel.h"
#include "utils/Validation.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>

namespace {
    const std::vector<std::string> kMaleFirstNames = {
        "Abner", "Albert", "Arthur", "Bernard", "Calvin", "Chester", "Clarence", "Dale", "Earl", "Edgar",
        "Floyd", "Frank", "Gilbert", "Harold", "Homer", "Irving", "Jasper", "Leon", "Lloyd", "Marvin",
        "Milton", "Norman", "Otis", "Percy", "Ralph", "Roy", "Silas", "Vernon", "Walter", "Wesley"};
    const std::vector<std::string> kFemaleFirstNames = {
        "Ada", "Agnes", "Beatrice", "Bertha", "Clara", "Cora", "Doris", "Edith", "Elsie", "Esther",
        "Ethel", "Flora", "Gladys", "Hazel", "Ida", "Irene", "June", "Lena", "Lottie", "Mabel",
        "Maude", "Minnie", "Nellie", "Opal", "Pearl", "Ruth", "Stella", "Thelma", "Vera", "Viola"};
    const std::vector<std::string> kLastNames = {
        "Abbott", "Barlow", "Carver", "Dawson", "Ellis", "Fletcher", "Garner", "Hale", "Ingram", "Jessup",
        "Keller", "Lowry", "Mercer", "Nash", "Oakley", "Pruitt", "Quinlan", "Rhodes", "Sutter", "Tolliver",
        "Underwood", "Vance", "Whitley", "Yates", "Zeller", "Bright", "Crowe", "Dunn", "Ford", "Hart"};
    const std::vector<std::string> kStreets = {
        "Main Street", "Elm Street", "Oak Avenue", "Mill Road", "Church Street", "Maple Avenue",
        "Railroad Street", "Water Street", "Hill Road", "Union Street"};
    const std::vector<std::string> kBusinessTypes = {
        "Bakery", "Barbershop", "Bank", "Diner", "Hardware Store", "Tavern", "Grocery", "Pharmacy",
        "Tailor Shop", "Print Shop", "Garage", "Feed Store", "Dry Goods", "Shoe Repair", "Lumber Yard"};
    const std::vector<std::string> kJobTitles = {
        "clerk", "cashier", "cook", "mechanic", "manager", "bookkeeper", "janitor", "baker", "teller", "laborer"};

    template <typename T>
    const T& pickFrom(const std::vector<T>& pool, std::mt19937_64& rng) {
        std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
        return pool[pick(rng)];
    }

    // Appearance values come from the same pools the belief layer draws plausible values from
    std::string drawFeature(FeatureType f, std::mt19937_64& rng) {
        return pickFrom(FeatureRegistry::instance().spec(f).pool, rng);
    }
}

Kernel::Kernel(const KernelConfig& cfg) : cfg_(cfg), rng_(cfg.seed) {
    reset(cfg);
}

void Kernel::reset(const KernelConfig& cfg) {
    validateConfig(cfg);
    cfg_ = cfg;
    rng_.seed(cfg.seed);
    clock_.reset(cfg_.startYear);
    ledger_.clear();
    event_log_.clear();
    interacted_.clear();
    weighting_ = defaultEvidenceWeight;

    perception_.configure(cfg_.seed ^ 0x9E3779B97F4A7C15ULL);
    transmission_.configure(cfg_.seed ^ 0xBF58476D1CE4E5B9ULL);
    memory_noise_.configure(cfg_.seed ^ 0x94D049BB133111EBULL);

    people_.clear();
    places_.clear();
    occupants_.clear();
    minds_.clear();

    initTown();
    initSalience();
    placePeople();

    if (cfg_.implantAtStart) {
        for (std::uint32_t id = 0; id < people_.size(); ++id) {
            implantKnowledge(id);
        }
    }
}

void Kernel::initTown() {
    std::uniform_int_distribution<int> blockDist(1, TuningConstants::kBlocks);
    std::uniform_int_distribution<int> numberDist(1, 99);
    std::uniform_real_distribution<double> uni(0.0, 1.0);
    std::set<std::string> usedAddresses;

    auto makeAddress = [&](int block) {
        std::string address;
        do {
            address = std::to_string(block * 100 + numberDist(rng_)) + " " + pickFrom(kStreets, rng_);
        } while (!usedAddresses.insert(address).second);
        return address;
    };

    for (std::uint32_t r = 0; r < cfg_.residences; ++r) {
        const int block = blockDist(rng_);
        const bool apartment = uni(rng_) < TuningConstants::kApartmentShare;
        const std::string address = makeAddress(block);
        addPlace(EntityKind::Residence, (apartment ? "Apartments at " : "House at ") + address, address, block,
                 apartment);
    }

    // Business names must be unique: belief about a workplace is belief about its name
    std::set<std::string> usedNames;
    std::vector<std::uint32_t> businesses;
    for (std::uint32_t b = 0; b < cfg_.businesses; ++b) {
        const int block = blockDist(rng_);
        std::string name = pickFrom(kLastNames, rng_) + "'s " + pickFrom(kBusinessTypes, rng_);
        for (int n = 2; usedNames.count(name) > 0; ++n) {
            name = pickFrom(kLastNames, rng_) + "'s " + pickFrom(kBusinessTypes, rng_) + " No. " + std::to_string(n);
        }
        usedNames.insert(name);
        businesses.push_back(addPlace(EntityKind::Business, name, makeAddress(block), block));
    }

    if (cfg_.population == 0) {
        return;
    }

    std::normal_distribution<double> traitDist(0.0, 0.4);
    std::normal_distribution<double> memoryDist(0.6, 0.15);
    std::uniform_int_distribution<int> householdDist(1, TuningConstants::kMaxHouseholdSize);
    std::uniform_int_distribution<int> adultAgeDist(20, 80);
    std::uniform_int_distribution<int> childAgeDist(0, 17);
    std::bernoulli_distribution sexDist(0.5);

    std::uint32_t households = 0;
    while (people_.size() < cfg_.population) {
        const auto home = static_cast<std::int32_t>(households % cfg_.residences);
        ++households;
        const auto remaining = static_cast<int>(cfg_.population - people_.size());
        const int size = std::min(householdDist(rng_), remaining);
        const std::string lastName = pickFrom(kLastNames, rng_);
        const std::string skin = drawFeature(FeatureType::SkinColor, rng_);
        bool firstFemale = false;

        for (int k = 0; k < size; ++k) {
            Person p;
            if (k == 0) {
                p.female = sexDist(rng_);
                firstFemale = p.female;
            } else if (k == 1) {
                p.female = !firstFemale;
            } else {
                p.female = sexDist(rng_);
            }

            const bool adult = k < 2;
            p.age = adult ? adultAgeDist(rng_) : childAgeDist(rng_);
            p.birthYear = cfg_.startYear - p.age;

            const auto& names = p.female ? kFemaleFirstNames : kMaleFirstNames;
            p.firstName = pickFrom(names, rng_);
            if (uni(rng_) < 0.7) {
                do {
                    p.middleName = pickFrom(names, rng_);
                } while (p.middleName == p.firstName);
            }
            p.lastName = lastName;
            if (!p.female && !adult && uni(rng_) < 0.05) {
                p.suffix = "Jr.";
            }

            p.marital = (adult && size >= 2) ? MaritalStatus::Married : MaritalStatus::Single;
            if (adult && size == 1 && p.age >= 60 && uni(rng_) < 0.5) {
                p.marital = MaritalStatus::Widowed;
            }

            p.personality.openness = std::clamp(traitDist(rng_), -1.0, 1.0);
            p.personality.conscientiousness = std::clamp(traitDist(rng_), -1.0, 1.0);
            p.personality.extroversion = std::clamp(traitDist(rng_), -1.0, 1.0);
            p.personality.agreeableness = std::clamp(traitDist(rng_), -1.0, 1.0);
            p.personality.neuroticism = std::clamp(traitDist(rng_), -1.0, 1.0);
            p.memory = std::clamp(memoryDist(rng_), 0.1, 0.9);

            p.appearance.skinColor = skin;
            p.appearance.hairLength = drawFeature(FeatureType::HairLength, rng_);
            p.appearance.hairColor = drawFeature(FeatureType::HairColor, rng_);
            p.appearance.eyeColor = drawFeature(FeatureType::EyeColor, rng_);
            p.appearance.facialHairStyle =
                (p.female || p.age < 16) ? "none" : drawFeature(FeatureType::FacialHairStyle, rng_);
            p.appearance.glasses = uni(rng_) < 0.25 ? "yes" : "no";
            p.appearance.tattoo = uni(rng_) < 0.1 ? "yes" : "no";
            p.appearance.scar = uni(rng_) < 0.1 ? "yes" : "no";

            p.home = home;
            if (p.age >= TuningConstants::kRetirementAge) {
                p.retired = true;
            } else if (p.age >= TuningConstants::kMinWorkingAge && !businesses.empty() &&
                       uni(rng_) < cfg_.employmentRate) {
                p.workplace = static_cast<std::int32_t>(pickFrom(businesses, rng_));
                p.jobTitle = pickFrom(kJobTitles, rng_);
                p.jobShift = uni(rng_) < TuningConstants::kChanceNightShift ? "night" : "day";
            }
            addPerson(std::move(p));
        }
    }

    if (households > cfg_.residences) {
        std::cerr << "[Kernel] " << households << " households share " << cfg_.residences << " residences\n";
    }
}

void Kernel::initSalience() {
    const auto& cfg = cfg_.epistemic;
    std::map<std::int32_t, std::vector<std::uint32_t>> byWorkplace;
    for (const auto& p : people_) {
        if (p.workplace >= 0) {
            byWorkplace[p.workplace].push_back(p.id);
        }
    }

    for (const auto& p : people_) {
        SalienceMap& salience = minds_[p.id].salience();
        for (std::uint32_t other : household(p.id)) {
            salience.increment(personRef(other), cfg.salienceHousehold);
        }
        if (p.home >= 0) {
            salience.increment(place(static_cast<std::uint32_t>(p.home)).ref(), cfg.salienceHome);
        }
        if (p.workplace >= 0) {
            salience.increment(place(static_cast<std::uint32_t>(p.workplace)).ref(), cfg.salienceWorkplace);
            for (std::uint32_t coworker : byWorkplace[p.workplace]) {
                if (coworker != p.id) {
                    salience.increment(personRef(coworker), cfg.salienceCoworker);
                }
            }
        }
    }
}

// Night: home, or at work for the night shift. Day: at work, otherwise home or out at a business.
void Kernel::placePeople() {
    const bool night = clock_.night();
    std::vector<std::uint32_t> businesses;
    for (const auto& pl : places_) {
        if (pl.kind == EntityKind::Business) {
            businesses.push_back(pl.id);
        }
    }
    std::uniform_real_distribution<double> uni(0.0, 1.0);

    for (auto& p : people_) {
        if (!p.present()) {
            continue;
        }
        std::int32_t destination = p.home;
        const bool onShift = p.workplace >= 0 && (p.jobShift == "night") == night;
        if (onShift) {
            destination = p.workplace;
        } else if (!night && !businesses.empty() && uni(rng_) >= TuningConstants::kChanceStayHomeByDay) {
            destination = static_cast<std::int32_t>(pickFrom(businesses, rng_));
        }
        moveTo(p.id, destination);
    }
}

void Kernel::step() {
    clock_.advance();
    interacted_.clear();
    placePeople();

    std::bernoulli_distribution reflectRoll(cfg_.epistemic.chanceReflectPerDay);
    const auto n = static_cast<std::uint32_t>(people_.size());
    for (std::uint32_t id = 0; id < n; ++id) {
        if (!people_[id].present()) {
            continue;
        }
        if (!clock_.night() && reflectRoll(rng_)) {
            reflect(id);
        }
        observe(id);
        socialize(id, 1);
    }

    // Memory noise once per day, then decay over settled evidence
    if (!clock_.night()) {
        for (std::uint32_t id = 0; id < n; ++id) {
            deteriorate(id);
        }
    }
    decayAll();
}

void Kernel::stepN(int n) {
    for (int i = 0; i < n; ++i) {
        step();
    }
}

void Kernel::fastForward(int days) {
    if (days <= 0) {
        return;
    }
    clock_.advanceDays(days);
    interacted_.clear();
    placePeople();

    const auto n = static_cast<std::uint32_t>(people_.size());
    for (std::uint32_t id = 0; id < n; ++id) {
        socialize(id, days);
    }
    decayAll();
    for (std::uint32_t id = 0; id < n; ++id) {
        implantKnowledge(id);
    }
}

// ---------- World ----------

void Kernel::checkPerson(std::uint32_t id) const {
    if (id >= people_.size()) {
        throw std::out_of_range("no person with id " + std::to_string(id));
    }
}

const Person& Kernel::person(std::uint32_t id) const {
    checkPerson(id);
    return people_[id];
}

Person& Kernel::personMut(std::uint32_t id) {
    checkPerson(id);
    return people_[id];
}

const Place& Kernel::place(std::uint32_t id) const {
    if (id >= places_.size()) {
        throw std::out_of_range("no place with id " + std::to_string(id));
    }
    return places_[id];
}

const std::vector<std::uint32_t>& Kernel::occupants(std::uint32_t placeId) const {
    place(placeId);
    return occupants_[placeId];
}

std::vector<std::uint32_t> Kernel::household(std::uint32_t personId) const {
    const Person& p = person(personId);
    std::vector<std::uint32_t> out;
    if (p.home < 0) {
        return out;
    }
    for (const auto& other : people_) {
        if (other.id != personId && other.home == p.home && other.present()) {
            out.push_back(other.id);
        }
    }
    return out;
}

std::optional<std::uint32_t> Kernel::businessNamed(const std::string& name) const {
    for (const auto& pl : places_) {
        if (pl.kind == EntityKind::Business && pl.name == name) {
            return pl.id;
        }
    }
    return std::nullopt;
}

bool Kernel::exists(EntityRef e) const {
    if (e.isPerson()) {
        return e.id < people_.size();
    }
    return e.id < places_.size() && places_[e.id].kind == e.kind;
}

std::optional<EntityRef> Kernel::entityFromToken(const std::string& token) const {
    if (token.empty()) {
        return std::nullopt;
    }
    EntityKind kind = EntityKind::Person;
    std::string digits = token;
    if (token[0] == 'p' || token[0] == 'r' || token[0] == 'b') {
        kind = token[0] == 'p' ? EntityKind::Person : token[0] == 'r' ? EntityKind::Residence : EntityKind::Business;
        digits = token.substr(1);
    }
    const bool numeric = std::all_of(digits.begin(), digits.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
    if (digits.empty() || digits.size() > 9 || !numeric) {
        return std::nullopt;
    }
    EntityRef e{kind, static_cast<std::uint32_t>(std::stoul(digits))};
    if (!exists(e)) {
        return std::nullopt;
    }
    return e;
}

std::string Kernel::entityName(EntityRef e) const {
    if (!exists(e)) {
        throw std::out_of_range(std::string("no ") + entityKindName(e.kind) + " with id " + std::to_string(e.id));
    }
    return e.isPerson() ? people_[e.id].name() : places_[e.id].name;
}

std::string Kernel::trueFeature(EntityRef subject, FeatureType feature) const {
    if (!exists(subject)) {
        throw std::out_of_range(std::string("no ") + entityKindName(subject.kind) + " with id " +
                                std::to_string(subject.id));
    }
    return FeatureRegistry::instance().trueValue(*this, subject, feature);
}

std::uint32_t Kernel::addPlace(EntityKind kind, const std::string& name, const std::string& address, int block,
                               bool apartment) {
    if (kind == EntityKind::Person) {
        throw std::invalid_argument("a place must be a residence or a business");
    }
    Place pl;
    pl.id = static_cast<std::uint32_t>(places_.size());
    pl.kind = kind;
    pl.name = name;
    pl.address = address;
    pl.block = block;
    pl.apartment = kind == EntityKind::Residence && apartment;
    places_.push_back(pl);
    occupants_.emplace_back();
    return pl.id;
}

std::uint32_t Kernel::addPerson(Person p) {
    if (p.firstName.empty() || p.lastName.empty()) {
        throw std::invalid_argument("a person needs a first and last name");
    }
    for (std::int32_t pid : {p.home, p.workplace, p.location}) {
        if (pid >= 0) {
            place(static_cast<std::uint32_t>(pid));
        }
    }
    const std::int32_t location = p.location;
    p.id = static_cast<std::uint32_t>(people_.size());
    p.location = -1;
    people_.push_back(std::move(p));

    const std::uint32_t id = people_.back().id;
    minds_.emplace_back(personRef(id), people_.back().memory);
    minds_.back().salience().set(personRef(id), cfg_.epistemic.salienceSelf);
    if (people_.back().present()) {
        moveTo(id, location);
    }
    return id;
}

void Kernel::moveTo(std::uint32_t personId, std::int32_t placeId) {
    Person& p = personMut(personId);
    if (placeId >= 0) {
        place(static_cast<std::uint32_t>(placeId));
    }
    if (p.location == placeId) {
        return;
    }
    if (p.location >= 0) {
        auto& here = occupants_[static_cast<std::size_t>(p.location)];
        here.erase(std::remove(here.begin(), here.end(), personId), here.end());
    }
    if (placeId >= 0) {
        auto& there = occupants_[static_cast<std::size_t>(placeId)];
        there.insert(std::lower_bound(there.begin(), there.end(), personId), personId);
    }
    p.location = placeId;
}

void Kernel::setLifeStatus(std::uint32_t personId, LifeStatus status) {
    personMut(personId).status = status;
    if (status != LifeStatus::Alive) {
        moveTo(personId, -1);
    }
}

// ---------- Epistemics: inbound ----------

IngestContext Kernel::ingestContext() {
    IngestContext ctx;
    ctx.config = &cfg_.epistemic;
    ctx.weighting = &weighting_;
    ctx.log = &event_log_;
    ctx.day = clock_.ordinalDate();
    return ctx;
}

void Kernel::setWeighting(EvidenceWeighting weighting) {
    if (!weighting) {
        throw std::invalid_argument("evidence weighting must be callable");
    }
    weighting_ = std::move(weighting);
}

EvidencePtr Kernel::recordEvidence(EntityRef subject, EntityRef source, EvidenceDetails details) {
    auto evidence = ledger_.record(*this, clock_, subject, source, std::move(details));
    event_log_.logEvidence(evidence->stamp().tick, evidence->eventNumber(),
                           static_cast<std::uint8_t>(evidence->kind()), source, subject);
    return evidence;
}

IngestOutcome Kernel::ingest(std::uint32_t owner, EntityRef subject, FeatureType feature, const std::string& value,
                             const EvidencePtr& evidence) {
    return mindMut(owner).considerNewEvidence(subject, feature, value, evidence, ingestContext());
}

std::size_t Kernel::buildUp(std::uint32_t owner, const EvidencePtr& evidence) {
    return mindMut(owner).buildUp(*this, evidence, ingestContext());
}

std::size_t Kernel::reflect(std::uint32_t personId) {
    return perception_.reflect(*this, personId);
}

std::size_t Kernel::observe(std::uint32_t personId) {
    return perception_.observe(*this, personId);
}

ExchangeSummary Kernel::socialize(std::uint32_t a, std::uint32_t b, int missingDays) {
    const Person& pa = person(a);
    const Person& pb = person(b);
    ExchangeSummary summary;
    if (a == b || missingDays < 1 || !pa.present() || !pb.present() ||
        pa.age < TuningConstants::kMinSocialAge || pb.age < TuningConstants::kMinSocialAge) {
        return summary;
    }

    const double bump = cfg_.epistemic.saliencePerInteraction * missingDays;
    minds_[a].salience().increment(personRef(b), bump);
    minds_[b].salience().increment(personRef(a), bump);
    interacted_.insert(std::minmax(a, b));

    // Skipped days only progress the relationship
    if (missingDays == 1) {
        summary = transmission_.exchangeInformation(*this, a, b);
    }
    return summary;
}

std::size_t Kernel::socialize(std::uint32_t a, int missingDays) {
    const Person& pa = person(a);
    if (!pa.present() || pa.age < TuningConstants::kMinSocialAge) {
        return 0;
    }

    const std::vector<std::uint32_t> family = household(a);
    std::set<std::uint32_t> candidates(family.begin(), family.end());
    if (pa.location >= 0) {
        const auto& here = occupants_[static_cast<std::size_t>(pa.location)];
        candidates.insert(here.begin(), here.end());
    }

    std::uniform_real_distribution<double> uni(0.0, 1.0);
    std::size_t interactions = 0;
    for (std::uint32_t other : candidates) {
        const Person& po = people_[other];
        if (other == a || !po.present() || po.age < TuningConstants::kMinSocialAge) {
            continue;
        }
        if (interacted_.count(std::minmax(a, other)) > 0) {
            continue;
        }
        const bool kin = std::find(family.begin(), family.end(), other) != family.end();
        if (!kin && uni(rng_) >= instigationChance(a, other)) {
            continue;
        }
        socialize(a, other, missingDays);
        ++interactions;
    }
    return interactions;
}

// Extroverts start conversations; strangers need openness, friends need little encouragement
double Kernel::instigationChance(std::uint32_t a, std::uint32_t b) const {
    const auto& cfg = cfg_.epistemic;
    const Personality& traits = people_[a].personality;
    double chance = TuningConstants::kInstigationBase + TuningConstants::kExtroversionInstigationWeight * traits.extroversion;

    const double familiarity = minds_[a].salience().of(personRef(b));
    if (familiarity >= cfg.friendSalienceThreshold) {
        chance += cfg.friendshipInstigationBonus;
    } else if (familiarity <= 0.0) {
        chance += TuningConstants::kOpennessStrangerWeight * (traits.openness - 1.0);
    }
    return std::clamp(chance, cfg.instigationFloor, cfg.instigationCap);
}

std::size_t Kernel::decayAll(std::uint32_t owner) {
    if (!person(owner).present()) {
        return 0;
    }
    auto expired = minds_[owner].decayStrengths(clock_.ordinalDate(), cfg_.epistemic);
    forget(owner, expired);
    return expired.size();
}

std::size_t Kernel::decayAll() {
    const auto n = static_cast<std::int64_t>(people_.size());
    const std::uint64_t day = clock_.ordinalDate();
    std::vector<std::vector<BeliefFacet*>> expired(people_.size());

    // Parallel phase only recomputes strengths inside each mind; no evidence is created here
    #pragma omp parallel for schedule(dynamic) if(cfg_.parallelDecay)
    for (std::int64_t i = 0; i < n; ++i) {
        if (people_[static_cast<std::size_t>(i)].present()) {
            expired[static_cast<std::size_t>(i)] =
                minds_[static_cast<std::size_t>(i)].decayStrengths(day, cfg_.epistemic);
        }
    }

    // Forgetting is recorded serially, in owner order, so event numbers stay deterministic
    std::size_t total = 0;
    for (std::size_t i = 0; i < expired.size(); ++i) {
        forget(static_cast<std::uint32_t>(i), expired[i]);
        total += expired[i].size();
    }
    return total;
}

void Kernel::forget(std::uint32_t owner, const std::vector<BeliefFacet*>& expired) {
    const EntityRef self = personRef(owner);
    for (BeliefFacet* facet : expired) {
        const EntityRef subject = facet->subject();
        const FeatureType feature = facet->feature();
        auto evidence = recordEvidence(subject, self, ForgettingDetails{});
        ingest(owner, subject, feature, std::string(), evidence);
    }
}

std::size_t Kernel::implantKnowledge(std::uint32_t owner) {
    return perception_.implantKnowledge(*this, owner);
}

DeteriorationSummary Kernel::deteriorate(std::uint32_t owner) {
    return memory_noise_.deteriorate(*this, owner);
}

std::size_t Kernel::makeStatement(std::uint32_t talker, std::uint32_t listener, EntityRef subject,
                                  const std::vector<FeatureType>& features) {
    return transmission_.makeStatement(*this, talker, listener, subject, features);
}

void Kernel::tellLie(std::uint32_t liar, std::uint32_t recipient, EntityRef subject, FeatureType feature,
                     const std::string& falseValue) {
    transmission_.tellLie(*this, liar, recipient, subject, feature, falseValue);
}

// ---------- Epistemics: queries ----------

const Mind& Kernel::mind(std::uint32_t owner) const {
    checkPerson(owner);
    return minds_[owner];
}

Mind& Kernel::mindMut(std::uint32_t owner) {
    checkPerson(owner);
    return minds_[owner];
}

std::optional<std::string> Kernel::belief(std::uint32_t owner, EntityRef subject, FeatureType feature) const {
    const BeliefFacet* facet = mind(owner).facet(subject, feature);
    if (!facet) {
        return std::nullopt;
    }
    return facet->value();
}

bool Kernel::accurateBelief(std::uint32_t owner, EntityRef subject, FeatureType feature) const {
    const BeliefFacet* facet = mind(owner).facet(subject, feature);
    return facet && facet->accurate(*this);
}

bool Kernel::inaccurateBelief(std::uint32_t owner, EntityRef subject, FeatureType feature) const {
    const BeliefFacet* facet = mind(owner).facet(subject, feature);
    return facet && facet->inaccurate(*this);
}

std::vector<EntityRef> Kernel::sources(std::uint32_t owner, EntityRef subject,
                                       std::optional<FeatureType> feature) const {
    return mind(owner).sources(subject, feature);
}

std::optional<EntityRef> Kernel::topSource(std::uint32_t owner, EntityRef subject,
                                           std::optional<FeatureType> feature) const {
    auto ranked = sources(owner, subject, feature);
    if (ranked.empty()) {
        return std::nullopt;
    }
    return ranked.front();
}

std::vector<std::uint32_t> Kernel::peopleIBelieveWorkAt(std::uint32_t owner, std::uint32_t company) const {
    const Place& business = place(company);
    const Mind& m = mind(owner);
    std::vector<std::uint32_t> out;
    if (business.kind != EntityKind::Business) {
        return out;
    }
    const MentalModel* model = m.model(business.ref());
    if (!model) {
        return out;
    }

    auto employees = model->employees(m, *this);
    std::stable_sort(employees.begin(), employees.end(), [&m](EntityRef x, EntityRef y) {
        return m.salience().of(x) > m.salience().of(y);
    });
    for (EntityRef e : employees) {
        out.push_back(e.id);
    }
    return out;
}

std::optional<std::uint32_t> Kernel::mostSalientPersonIBelieveWorksAt(std::uint32_t owner,
                                                                      std::uint32_t company) const {
    auto employees = peopleIBelieveWorkAt(owner, company);
    if (employees.empty()) {
        return std::nullopt;
    }
    return employees.front();
}

std::vector<std::uint32_t> Kernel::peopleIBelieveAreNamed(std::uint32_t owner,
                                                          const std::optional<std::string>& firstName,
                                                          const std::optional<std::string>& lastName,
                                                          const std::optional<std::string>& sex) const {
    const Mind& m = mind(owner);
    auto believes = [&m](EntityRef subject, FeatureType f, const std::optional<std::string>& wanted) {
        if (!wanted) {
            return true;
        }
        const BeliefFacet* facet = m.facet(subject, f);
        return facet && facet->known() && facet->value() == *wanted;
    };

    std::vector<std::uint32_t> out;
    for (EntityRef subject : m.knownSubjects()) {
        if (subject.isPerson() && believes(subject, FeatureType::FirstName, firstName) &&
            believes(subject, FeatureType::LastName, lastName) && believes(subject, FeatureType::Sex, sex)) {
            out.push_back(subject.id);
        }
    }
    return out;
}

Kernel::Metrics Kernel::computeMetrics() const {
    Metrics m;
    m.people = people_.size();
    m.minds = minds_.size();
    m.evidence = ledger_.size();

    double strengthSum = 0.0;
    for (const auto& mind : minds_) {
        m.distrustPairs += mind.distrusted().size();
        for (const BeliefFacet* facet : mind.allFacets()) {
            ++m.facets;
            if (!facet->known()) {
                ++m.forgottenFacets;
                continue;
            }
            ++m.knownFacets;
            strengthSum += facet->strength();
            if (facet->accurate(*this)) {
                ++m.accurateFacets;
            }
        }
    }
    if (m.knownFacets > 0) {
        m.accurateShare = static_cast<double>(m.accurateFacets) / static_cast<double>(m.knownFacets);
        m.meanStrength = strengthSum / static_cast<double>(m.knownFacets);
    }
    if (m.facets > 0) {
        m.forgottenShare = static_cast<double>(m.forgottenFacets) / static_cast<double>(m.facets);
    }
    return m;
}
