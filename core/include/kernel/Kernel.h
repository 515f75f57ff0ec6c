#ifndef KERNEL_H
#define KERNEL_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "kernel/Clock.h"
#include "kernel/Entity.h"
#include "kernel/Person.h"
#include "modules/BeliefFacet.h"
#include "modules/EpistemicConfig.h"
#include "modules/Evidence.h"
#include "modules/Features.h"
#include "modules/MemoryNoise.h"
#include "modules/Mind.h"
#include "modules/Perception.h"
#include "modules/Transmission.h"
#include "utils/EventLog.h"

// ---------- Tuning Constants ----------
// These constants control emergent behavior dynamics and have been empirically tuned.
// Changing these affects simulation outcomes - document rationale for any changes.
namespace TuningConstants {
    // Ages
    constexpr int kMinSocialAge = 5;                // younger children do not converse
    constexpr int kMinImplantAge = 4;               // earliest age with retained backstory
    constexpr int kMinWorkingAge = 18;
    constexpr int kRetirementAge = 65;

    // Daily routine
    constexpr double kChanceNightShift = 0.2;
    constexpr double kChanceStayHomeByDay = 0.35;   // for people with nowhere to work

    // Social instigation
    constexpr double kInstigationBase = 0.5;
    constexpr double kExtroversionInstigationWeight = 0.25;
    constexpr double kOpennessStrangerWeight = 0.25;

    // Lies
    constexpr double kLieConfidence = 0.6;          // share of the cap a liar sells an unheld value with

    // Town layout
    constexpr int kMaxHouseholdSize = 5;
    constexpr double kApartmentShare = 0.3;
    constexpr int kBlocks = 12;
}

// ---------- Configuration ----------
struct KernelConfig {
    std::uint32_t population = 120;
    std::uint32_t residences = 40;
    std::uint32_t businesses = 10;
    std::uint64_t seed = 42;
    int startYear = 1979;
    double employmentRate = 0.8;        // share of working-age adults with a job
    bool implantAtStart = true;         // seed every mind with backstory knowledge
    bool parallelDecay = true;          // run the decay pass across minds with OpenMP

    EpistemicConfig epistemic;
};

// ---------- Kernel Engine ----------
// Owns the ground-truth town, the clock, the evidence ledger and one mind per person
class Kernel {
public:
    explicit Kernel(const KernelConfig& cfg);

    // Lifecycle
    void reset(const KernelConfig& cfg);
    void step();
    void stepN(int n);
    // Low-fidelity skip: relationships progress, nothing is said, backstory is implanted
    void fastForward(int days);

    // World
    const Person& person(std::uint32_t id) const;
    Person& personMut(std::uint32_t id);
    const Place& place(std::uint32_t id) const;
    const std::vector<Person>& people() const { return people_; }
    const std::vector<Place>& places() const { return places_; }
    const std::vector<std::uint32_t>& occupants(std::uint32_t placeId) const;
    std::vector<std::uint32_t> household(std::uint32_t personId) const;
    std::optional<std::uint32_t> businessNamed(const std::string& name) const;

    bool exists(EntityRef e) const;
    // "p12", "r3", "b0" or a bare person id; nullopt unless it names an existing entity
    std::optional<EntityRef> entityFromToken(const std::string& token) const;
    std::string entityName(EntityRef e) const;
    std::string trueFeature(EntityRef subject, FeatureType feature) const;

    // World edits for scenario setup
    std::uint32_t addPlace(EntityKind kind, const std::string& name, const std::string& address, int block,
                           bool apartment = false);
    std::uint32_t addPerson(Person p);
    void moveTo(std::uint32_t personId, std::int32_t placeId);
    void setLifeStatus(std::uint32_t personId, LifeStatus status);

    // Epistemics: inbound
    EvidencePtr recordEvidence(EntityRef subject, EntityRef source, EvidenceDetails details);
    IngestOutcome ingest(std::uint32_t owner, EntityRef subject, FeatureType feature, const std::string& value,
                         const EvidencePtr& evidence);
    std::size_t buildUp(std::uint32_t owner, const EvidencePtr& evidence);

    std::size_t reflect(std::uint32_t personId);
    std::size_t observe(std::uint32_t personId);
    ExchangeSummary socialize(std::uint32_t a, std::uint32_t b, int missingDays);
    std::size_t socialize(std::uint32_t a, int missingDays);
    std::size_t decayAll(std::uint32_t owner);
    std::size_t decayAll();
    std::size_t implantKnowledge(std::uint32_t owner);
    DeteriorationSummary deteriorate(std::uint32_t owner);
    std::size_t makeStatement(std::uint32_t talker, std::uint32_t listener, EntityRef subject,
                              const std::vector<FeatureType>& features);
    void tellLie(std::uint32_t liar, std::uint32_t recipient, EntityRef subject, FeatureType feature,
                 const std::string& falseValue);

    // Epistemics: queries. nullopt means no belief was ever formed; "" means it was forgotten.
    std::optional<std::string> belief(std::uint32_t owner, EntityRef subject, FeatureType feature) const;
    bool accurateBelief(std::uint32_t owner, EntityRef subject, FeatureType feature) const;
    bool inaccurateBelief(std::uint32_t owner, EntityRef subject, FeatureType feature) const;
    std::vector<EntityRef> sources(std::uint32_t owner, EntityRef subject,
                                   std::optional<FeatureType> feature = std::nullopt) const;
    std::optional<EntityRef> topSource(std::uint32_t owner, EntityRef subject,
                                       std::optional<FeatureType> feature = std::nullopt) const;
    std::vector<std::uint32_t> peopleIBelieveWorkAt(std::uint32_t owner, std::uint32_t company) const;
    std::optional<std::uint32_t> mostSalientPersonIBelieveWorksAt(std::uint32_t owner, std::uint32_t company) const;
    std::vector<std::uint32_t> peopleIBelieveAreNamed(std::uint32_t owner,
                                                      const std::optional<std::string>& firstName,
                                                      const std::optional<std::string>& lastName,
                                                      const std::optional<std::string>& sex = std::nullopt) const;

    // Access
    const Mind& mind(std::uint32_t owner) const;
    Mind& mindMut(std::uint32_t owner);
    const SimClock& clock() const { return clock_; }
    const EvidenceLedger& ledger() const { return ledger_; }
    const KernelConfig& config() const { return cfg_; }
    const EpistemicConfig& epistemic() const { return cfg_.epistemic; }
    std::uint64_t generation() const { return clock_.tick(); }

    void setWeighting(EvidenceWeighting weighting);
    const EvidenceWeighting& weighting() const { return weighting_; }

    // Event log access
    EventLog& eventLog() { return event_log_; }
    const EventLog& eventLog() const { return event_log_; }

    // Metrics (lightweight for logging)
    struct Metrics {
        std::size_t people = 0;
        std::size_t minds = 0;
        std::size_t facets = 0;
        std::size_t knownFacets = 0;
        std::size_t accurateFacets = 0;
        std::size_t forgottenFacets = 0;
        std::size_t evidence = 0;
        std::size_t distrustPairs = 0;
        double accurateShare = 0.0;     // of known facets
        double forgottenShare = 0.0;    // of all facets
        double meanStrength = 0.0;      // of known facets
    };
    Metrics computeMetrics() const;

private:
    void initTown();
    void initSalience();
    void placePeople();
    void forget(std::uint32_t owner, const std::vector<BeliefFacet*>& expired);
    double instigationChance(std::uint32_t a, std::uint32_t b) const;
    IngestContext ingestContext();
    void checkPerson(std::uint32_t id) const;

    KernelConfig cfg_;
    std::vector<Person> people_;
    std::vector<Place> places_;
    std::vector<std::vector<std::uint32_t>> occupants_;    // place -> present person ids, ascending
    std::vector<Mind> minds_;                               // indexed by person id
    std::set<std::pair<std::uint32_t, std::uint32_t>> interacted_;  // pairs that met this timestep

    SimClock clock_;
    EvidenceLedger ledger_;
    EvidenceWeighting weighting_;
    std::mt19937_64 rng_;

    PerceptionModule perception_;
    TransmissionModule transmission_;
    MemoryNoiseModule memory_noise_;
    EventLog event_log_;  // Event tracking system
};

#endif
