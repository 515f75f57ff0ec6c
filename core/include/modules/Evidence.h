#ifndef EVIDENCE_MODULE_H
#define EVIDENCE_MODULE_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "kernel/Entity.h"
#include "modules/Features.h"

class Kernel;
class SimClock;

// How an item of knowledge arose. Order matches the EvidenceDetails alternatives.
enum class EvidenceKind : std::uint8_t {
    Reflection = 0,
    Observation,
    Confabulation,
    Lie,
    Statement,
    Declaration,
    Eavesdropping,
    Mutation,
    Transference,
    Forgetting,
    Implant,
    COUNT
};

constexpr std::size_t kEvidenceKindCount = static_cast<std::size_t>(EvidenceKind::COUNT);

const char* evidenceKindName(EvidenceKind kind);

// Structurally invalid evidence: a bug in the caller, not a recoverable condition
class ContractViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Identifies one belief facet: what `owner` believes about `subject`'s `feature`
struct FacetKey {
    EntityRef owner;
    EntityRef subject;
    FeatureType feature = FeatureType::Sex;

    bool operator==(const FacetKey& other) const {
        return owner == other.owner && subject == other.subject && feature == other.feature;
    }
};

// Feature -> strength of belief the teller conveyed (sold, in the case of a lie)
using TellerStrengths = std::map<FeatureType, double>;

// ---------- Per-kind payloads ----------
struct ReflectionDetails {};
struct ObservationDetails {};
struct ConfabulationDetails {};

struct LieDetails {
    EntityRef recipient;
    TellerStrengths tellerBeliefStrength;
};

struct StatementDetails {
    EntityRef recipient;
    TellerStrengths tellerBeliefStrength;
};

// The teller's own act of telling `recipient`; reinforces the teller's belief
struct DeclarationDetails {
    EntityRef recipient;
};

struct EavesdroppingDetails {
    EntityRef recipient;
    EntityRef eavesdropper;
    TellerStrengths tellerBeliefStrength;
};

struct MutationDetails {
    std::string mutatedFrom;
};

struct TransferenceDetails {
    FacetKey transferredFrom;
    double transferredStrength = 0.0;   // strength of that facet when it was cross-applied
};

struct ForgettingDetails {};

// Knowledge standing in for skipped (low-fidelity) years
struct ImplantDetails {
    double salienceOfSubject = 0.0;
};

using EvidenceDetails = std::variant<
    ReflectionDetails,
    ObservationDetails,
    ConfabulationDetails,
    LieDetails,
    StatementDetails,
    DeclarationDetails,
    EavesdroppingDetails,
    MutationDetails,
    TransferenceDetails,
    ForgettingDetails,
    ImplantDetails>;

static_assert(std::variant_size<EvidenceDetails>::value == kEvidenceKindCount,
              "every evidence kind needs exactly one payload type");

// Where and when the evidence arose; filled in by the ledger
struct EvidenceStamp {
    std::int32_t location = -1;         // place id of the source, -1 when nowhere
    std::uint64_t ordinalDate = 0;
    bool night = false;
    std::uint64_t tick = 0;
    std::uint64_t eventNumber = 0;
};

// ---------- Evidence ----------
// Write-once record. The only post-construction change is adjusted strength.
class Evidence {
public:
    Evidence(EntityRef subject, EntityRef source, EvidenceDetails details, const EvidenceStamp& stamp);

    EvidenceKind kind() const { return static_cast<EvidenceKind>(details_.index()); }
    EntityRef subject() const { return subject_; }
    EntityRef source() const { return source_; }
    const EvidenceStamp& stamp() const { return stamp_; }
    std::uint64_t eventNumber() const { return stamp_.eventNumber; }
    std::uint64_t ordinalDate() const { return stamp_.ordinalDate; }
    const EvidenceDetails& details() const { return details_; }

    template <typename T>
    const T* detailsAs() const { return std::get_if<T>(&details_); }

    std::optional<EntityRef> recipient() const;
    std::optional<EntityRef> eavesdropper() const;
    const FacetKey* transferredFrom() const;
    const TellerStrengths* tellerBeliefStrength() const;
    std::optional<double> tellerStrengthFor(FeatureType f) const;

    // Perceived directly rather than heard or misremembered
    bool firsthand() const;
    // Memory noise: always replaces the value it touches
    bool deterioration() const;

    std::optional<double> adjustedStrength() const { return adjusted_strength_; }
    void setAdjustedStrength(double strength);

private:
    EntityRef subject_;
    EntityRef source_;
    EvidenceDetails details_;
    EvidenceStamp stamp_;
    std::optional<double> adjusted_strength_;
};

using EvidencePtr = std::shared_ptr<Evidence>;

// Throws ContractViolation when the payload's invariants do not hold in the current world
void validateEvidence(const Kernel& kernel, EntityRef subject, EntityRef source, const EvidenceDetails& details);

// Human-readable provenance line, e.g. "Ann Ford's lie to Bo Lee about Cy Hart at Town Bank on day 3, 1979"
std::string describe(const Evidence& evidence, const Kernel& kernel);

// ---------- Evidence Ledger ----------
// Creates, stamps and retains every evidence record in creation order
class EvidenceLedger {
public:
    EvidencePtr record(const Kernel& kernel, SimClock& clock, EntityRef subject, EntityRef source,
                       EvidenceDetails details);

    const std::vector<EvidencePtr>& records() const { return records_; }
    std::size_t size() const { return records_.size(); }
    std::size_t count(EvidenceKind kind) const { return counts_[static_cast<std::size_t>(kind)]; }
    void clear();

private:
    std::vector<EvidencePtr> records_;
    std::size_t counts_[kEvidenceKindCount] = {};
};

#endif
