#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include "kernel/Kernel.h"
#include "io/Snapshot.h"
#include "utils/Validation.h"
#include "TestTown.h"

// Basic kernel initialization test
TEST(KernelTest, Initialization) {
    KernelConfig cfg;
    cfg.population = 120;
    cfg.residences = 40;
    cfg.businesses = 10;
    cfg.seed = 42;

    Kernel kernel(cfg);

    EXPECT_EQ(kernel.people().size(), cfg.population);
    EXPECT_EQ(kernel.places().size(), cfg.residences + cfg.businesses);
    EXPECT_EQ(kernel.generation(), 0u);

    // Backstory: everyone old enough knows who they are
    for (const auto& p : kernel.people()) {
        if (p.age >= TuningConstants::kMinImplantAge) {
            EXPECT_EQ(kernel.belief(p.id, personRef(p.id), FeatureType::FirstName), std::optional<std::string>(p.firstName));
        }
    }
}

TEST(KernelTest, HouseholdsShareAResidence) {
    KernelConfig cfg;
    Kernel kernel(cfg);
    for (const auto& p : kernel.people()) {
        ASSERT_GE(p.home, 0);
        EXPECT_EQ(kernel.place(static_cast<std::uint32_t>(p.home)).kind, EntityKind::Residence);
        for (std::uint32_t other : kernel.household(p.id)) {
            EXPECT_EQ(kernel.person(other).home, p.home);
        }
    }
}

TEST(KernelTest, BusinessNamesAreUnique) {
    KernelConfig cfg;
    cfg.businesses = 30;
    Kernel kernel(cfg);
    for (const auto& pl : kernel.places()) {
        if (pl.kind == EntityKind::Business) {
            EXPECT_EQ(kernel.businessNamed(pl.name), std::optional<std::uint32_t>(pl.id));
        }
    }
    EXPECT_FALSE(kernel.businessNamed("Nowhere In Particular").has_value());
}

// Evidence determinism test
TEST(KernelTest, DeterministicUpdates) {
    KernelConfig cfg;
    cfg.population = 60;
    cfg.residences = 20;
    cfg.businesses = 5;
    cfg.seed = 12345;

    Kernel kernel1(cfg);
    Kernel kernel2(cfg);
    kernel1.stepN(10);
    kernel2.stepN(10);

    ASSERT_EQ(kernel1.ledger().size(), kernel2.ledger().size());
    for (std::size_t i = 0; i < kernel1.ledger().size(); ++i) {
        const auto& a = kernel1.ledger().records()[i];
        const auto& b = kernel2.ledger().records()[i];
        EXPECT_EQ(a->kind(), b->kind());
        EXPECT_EQ(a->eventNumber(), b->eventNumber());
        EXPECT_EQ(a->subject(), b->subject());
    }
    for (std::uint32_t id = 0; id < cfg.population; ++id) {
        EXPECT_EQ(mindToJson(kernel1, id), mindToJson(kernel2, id));
    }
}

TEST(KernelTest, ResetRestartsTheRun) {
    KernelConfig cfg;
    cfg.population = 30;
    cfg.residences = 10;
    cfg.businesses = 3;
    Kernel kernel(cfg);
    const std::string fresh = kernelToJson(kernel, true);
    kernel.stepN(4);
    EXPECT_NE(kernelToJson(kernel, true), fresh);

    kernel.reset(cfg);
    EXPECT_EQ(kernel.generation(), 0u);
    EXPECT_EQ(kernelToJson(kernel, true), fresh);
}

TEST(KernelTest, TwoTimestepsPerDay) {
    Kernel kernel(emptyTownConfig());
    const auto day = kernel.clock().ordinalDate();
    EXPECT_FALSE(kernel.clock().night());
    kernel.step();
    EXPECT_TRUE(kernel.clock().night());
    EXPECT_EQ(kernel.clock().ordinalDate(), day);
    kernel.step();
    EXPECT_FALSE(kernel.clock().night());
    EXPECT_EQ(kernel.clock().ordinalDate(), day + 1);
    EXPECT_EQ(kernel.generation(), 2u);

    kernel.fastForward(10);
    EXPECT_EQ(kernel.clock().ordinalDate(), day + 11);
}

// Metrics computation test
TEST(KernelTest, MetricsComputation) {
    KernelConfig cfg;
    cfg.population = 80;
    cfg.residences = 25;
    cfg.businesses = 6;

    Kernel kernel(cfg);
    kernel.stepN(10);

    auto metrics = kernel.computeMetrics();

    // Basic sanity checks
    EXPECT_EQ(metrics.people, cfg.population);
    EXPECT_EQ(metrics.minds, cfg.population);
    EXPECT_EQ(metrics.facets, metrics.knownFacets + metrics.forgottenFacets);
    EXPECT_GE(metrics.accurateShare, 0.0);
    EXPECT_LE(metrics.accurateShare, 1.0);
    EXPECT_GE(metrics.forgottenShare, 0.0);
    EXPECT_LE(metrics.forgottenShare, 1.0);
    EXPECT_GE(metrics.meanStrength, kernel.epistemic().strengthFloor);
    EXPECT_LE(metrics.meanStrength, kernel.epistemic().strengthCap);
    EXPECT_EQ(metrics.evidence, kernel.ledger().size());
}

TEST(KernelTest, ValidationRejectsBadConfigs) {
    EXPECT_NO_THROW(validateConfig(KernelConfig{}));

    KernelConfig homeless;
    homeless.residences = 0;
    EXPECT_THROW(Kernel{homeless}, std::invalid_argument);

    KernelConfig liar;
    liar.epistemic.chanceLie = 1.5;
    EXPECT_THROW(Kernel{liar}, std::invalid_argument);

    KernelConfig inverted;
    inverted.epistemic.strengthFloor = 50.0;
    inverted.epistemic.strengthCap = 10.0;
    EXPECT_THROW(validateConfig(inverted), std::invalid_argument);

    KernelConfig frozen;
    frozen.epistemic.baseDailyDecay = 0.0;
    EXPECT_THROW(validateConfig(frozen), std::invalid_argument);

    KernelConfig silent;
    silent.epistemic.topicsFloor = 0;
    EXPECT_THROW(validateConfig(silent), std::invalid_argument);

    KernelConfig pushy;
    pushy.epistemic.instigationFloor = 0.8;
    pushy.epistemic.instigationCap = 0.4;
    EXPECT_THROW(validateConfig(pushy), std::invalid_argument);
}

TEST(KernelTest, LookupsOutOfRange) {
    Kernel kernel(emptyTownConfig());
    EXPECT_THROW(kernel.person(0), std::out_of_range);
    EXPECT_THROW(kernel.place(0), std::out_of_range);
    EXPECT_THROW(kernel.entityName(personRef(3)), std::out_of_range);
    EXPECT_THROW(kernel.addPlace(EntityKind::Person, "Ann", "", 1), std::invalid_argument);

    Person lost = townsperson("Lou", "Vance", 5);
    EXPECT_THROW(kernel.addPerson(lost), std::out_of_range);
}

class ScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        house = kernel.addPlace(EntityKind::Residence, "House at 120 Oak Avenue", "120 Oak Avenue", 1);
        const auto here = static_cast<std::int32_t>(house);
        Person forgetful = townsperson("Dee", "Nash", here);
        forgetful.memory = 0.1;
        dee = kernel.addPerson(forgetful);
        eli = kernel.addPerson(townsperson("Eli", "Crowe", here));
    }

    EvidencePtr observe(std::uint32_t who, EntityRef what) {
        auto ev = kernel.recordEvidence(what, personRef(who), ObservationDetails{});
        kernel.buildUp(who, ev);
        return ev;
    }

    Kernel kernel{emptyTownConfig()};
    std::uint32_t house = 0;
    std::uint32_t dee = 0, eli = 0;
};

TEST_F(ScenarioTest, DecayWithoutElapsedTimeIsANoOp) {
    observe(dee, personRef(eli));
    const double before = kernel.mind(dee).facet(personRef(eli), FeatureType::HairColor)->strength();
    EXPECT_EQ(kernel.decayAll(), 0u);
    EXPECT_EQ(kernel.decayAll(dee), 0u);
    EXPECT_DOUBLE_EQ(kernel.mind(dee).facet(personRef(eli), FeatureType::HairColor)->strength(), before);
}

TEST_F(ScenarioTest, UnrefreshedKnowledgeIsEventuallyForgotten) {
    observe(dee, personRef(eli));
    const std::size_t observed = kernel.mind(dee).model(personRef(eli))->size();
    const std::size_t evidenceBefore = kernel.ledger().size();

    // Nobody has a home to go to, so nobody meets during the skip
    kernel.fastForward(400);

    EXPECT_EQ(kernel.belief(dee, personRef(eli), FeatureType::HairColor), std::optional<std::string>(""));
    EXPECT_FALSE(kernel.accurateBelief(dee, personRef(eli), FeatureType::HairColor));
    EXPECT_FALSE(kernel.inaccurateBelief(dee, personRef(eli), FeatureType::HairColor));
    EXPECT_EQ(kernel.ledger().count(EvidenceKind::Forgetting), observed);
    EXPECT_EQ(kernel.eventLog().count(EventType::Forgotten), observed);
    EXPECT_GT(kernel.ledger().size(), evidenceBefore);

    const BeliefFacet* facet = kernel.mind(dee).facet(personRef(eli), FeatureType::HairColor);
    ASSERT_NE(facet, nullptr);
    const auto& forgetting = facet->evidence().back().evidence;
    EXPECT_EQ(forgetting->kind(), EvidenceKind::Forgetting);
    EXPECT_EQ(forgetting->source(), personRef(dee));
    EXPECT_TRUE(forgetting->adjustedStrength().has_value());

    // Seeing Eli again brings the old value back
    const double frozen = facet->history().back().frozenStrength;
    kernel.moveTo(dee, static_cast<std::int32_t>(house));
    kernel.moveTo(eli, static_cast<std::int32_t>(house));
    observe(dee, personRef(eli));
    EXPECT_EQ(facet->value(), "brown");
    EXPECT_EQ(facet->evidence().back().outcome, IngestOutcome::Reinstated);
    EXPECT_GE(facet->strength(), frozen);
    EXPECT_EQ(kernel.eventLog().count(EventType::Reinstated), observed);
}

TEST_F(ScenarioTest, DeathMakesBeliefsStale) {
    auto implant = kernel.recordEvidence(personRef(eli), personRef(dee), ImplantDetails{5.0});
    kernel.buildUp(dee, implant);
    EXPECT_TRUE(kernel.accurateBelief(dee, personRef(eli), FeatureType::Status));

    kernel.setLifeStatus(eli, LifeStatus::Dead);
    EXPECT_EQ(kernel.trueFeature(personRef(eli), FeatureType::Status), "dead");
    EXPECT_TRUE(kernel.inaccurateBelief(dee, personRef(eli), FeatureType::Status));
    EXPECT_EQ(kernel.occupants(house), std::vector<std::uint32_t>{dee});
    EXPECT_EQ(kernel.person(eli).location, -1);
}

TEST_F(ScenarioTest, CustomWeightingReplacesTheDefault) {
    kernel.setWeighting([](const EvidenceWeightInputs&) { return 12.0; });
    kernel.reflect(eli);
    EXPECT_DOUBLE_EQ(kernel.mind(eli).facet(personRef(eli), FeatureType::HairColor)->strength(), 12.0);
    EXPECT_THROW(kernel.setWeighting(EvidenceWeighting{}), std::invalid_argument);
}

TEST_F(ScenarioTest, ObservingEveryoneInTheRoom) {
    KernelConfig cfg = emptyTownConfig();
    cfg.epistemic.chanceObserveNearbyEntity = 1.0;
    kernel.reset(cfg);
    SetUp();

    EXPECT_EQ(kernel.observe(dee), 2u);
    EXPECT_TRUE(kernel.mind(dee).knows(kernel.place(house).ref()));
    EXPECT_EQ(kernel.belief(dee, kernel.place(house).ref(), FeatureType::PlaceAddress),
              std::optional<std::string>("120 Oak Avenue"));
    EXPECT_TRUE(kernel.mind(dee).knows(personRef(eli)));
}

TEST_F(ScenarioTest, ImplantsFavorSalientEntities) {
    kernel.mindMut(dee).salience().set(personRef(eli), kernel.epistemic().friendSalienceThreshold);
    EXPECT_EQ(kernel.implantKnowledge(dee), 2u);
    EXPECT_TRUE(kernel.accurateBelief(dee, personRef(eli), FeatureType::LastName));
    EXPECT_TRUE(kernel.accurateBelief(dee, personRef(dee), FeatureType::LastName));

    kernel.personMut(eli).age = 2;
    EXPECT_EQ(kernel.implantKnowledge(eli), 0u);
}

TEST_F(ScenarioTest, MemoryNoiseCorruptsAndConcocts) {
    KernelConfig cfg = emptyTownConfig();
    cfg.epistemic.chanceMutation = 1.0;
    cfg.epistemic.chanceTransference = 0.0;
    cfg.epistemic.chanceConfabulation = 1.0;
    kernel.reset(cfg);
    SetUp();

    // A mind with no memory at all deteriorates at the configured rates
    Person blank = townsperson("Fay", "Oakley", static_cast<std::int32_t>(house));
    blank.memory = 0.0;
    const std::uint32_t fay = kernel.addPerson(blank);
    kernel.reflect(fay);

    DeteriorationSummary noise = kernel.deteriorate(fay);
    EXPECT_GT(noise.mutations, 0u);
    EXPECT_TRUE(kernel.inaccurateBelief(fay, personRef(fay), FeatureType::HairColor));
    EXPECT_EQ(kernel.ledger().count(EvidenceKind::Mutation), noise.mutations);

    auto forgetting = kernel.recordEvidence(personRef(fay), personRef(fay), ForgettingDetails{});
    kernel.ingest(fay, personRef(fay), FeatureType::EyeColor, "", forgetting);
    noise = kernel.deteriorate(fay);
    EXPECT_GE(noise.confabulations, 1u);
    EXPECT_NE(kernel.belief(fay, personRef(fay), FeatureType::EyeColor), std::optional<std::string>(""));
}

TEST_F(ScenarioTest, UnsetDetailsAreBelievedAsNone) {
    EXPECT_THROW(kernel.addPerson(Person{}), std::invalid_argument);
    EXPECT_THROW(kernel.addPerson(townsperson("Fay", "")), std::invalid_argument);
    EXPECT_EQ(kernel.people().size(), 2u);

    kernel.personMut(eli).appearance.hairColor.clear();
    EXPECT_EQ(kernel.trueFeature(personRef(eli), FeatureType::HairColor), "None");
    EXPECT_EQ(kernel.reflect(eli), FeatureRegistry::instance().featuresFor(EntityKind::Person).size());
    EXPECT_EQ(kernel.belief(eli, personRef(eli), FeatureType::HairColor), std::optional<std::string>("None"));
    EXPECT_EQ(kernel.belief(eli, personRef(eli), FeatureType::Suffix), std::optional<std::string>("None"));
    EXPECT_TRUE(kernel.accurateBelief(eli, personRef(eli), FeatureType::HairColor));

    observe(dee, personRef(eli));
    EXPECT_TRUE(kernel.accurateBelief(dee, personRef(eli), FeatureType::HairColor));
}

TEST_F(ScenarioTest, EntityTokens) {
    EXPECT_EQ(kernel.entityFromToken("p1"), personRef(eli));
    EXPECT_EQ(kernel.entityFromToken("0"), personRef(dee));
    EXPECT_EQ(kernel.entityFromToken("r0"), kernel.place(house).ref());

    EXPECT_FALSE(kernel.entityFromToken("").has_value());
    EXPECT_FALSE(kernel.entityFromToken("p").has_value());
    EXPECT_FALSE(kernel.entityFromToken("b0").has_value());
    EXPECT_FALSE(kernel.entityFromToken("p7").has_value());
    EXPECT_FALSE(kernel.entityFromToken("1x").has_value());
    EXPECT_FALSE(kernel.entityFromToken("p99999999999999999999").has_value());
    EXPECT_FALSE(kernel.entityFromToken("p\xc3\xa9").has_value());
}

TEST(InstigationTest, HouseholdsTalkWhoeverElseIsShy) {
    KernelConfig cfg = emptyTownConfig();
    cfg.epistemic.instigationFloor = 0.0;
    cfg.epistemic.instigationCap = 0.0;
    Kernel kernel(cfg);
    const auto house = kernel.addPlace(EntityKind::Residence, "House at 9 Pine Lane", "9 Pine Lane", 2);
    const auto here = static_cast<std::int32_t>(house);
    const auto gus = kernel.addPerson(townsperson("Gus", "Reed", here));
    const auto hal = kernel.addPerson(townsperson("Hal", "Moss", here));

    // Strangers in the same room, nobody willing to start
    EXPECT_EQ(kernel.socialize(gus, 1), 0u);
    EXPECT_DOUBLE_EQ(kernel.mind(gus).salience().of(personRef(hal)), 0.0);

    kernel.personMut(gus).home = here;
    kernel.personMut(hal).home = here;
    EXPECT_EQ(kernel.socialize(gus, 1), 1u);
    EXPECT_GT(kernel.mind(hal).salience().of(personRef(gus)), 0.0);

    // One conversation per pair per timestep
    EXPECT_EQ(kernel.socialize(hal, 1), 0u);
}

TEST(SnapshotTest, JsonAndCsvExports) {
    KernelConfig cfg;
    cfg.population = 10;
    cfg.residences = 4;
    cfg.businesses = 2;
    Kernel kernel(cfg);

    const std::string state = kernelToJson(kernel, true);
    EXPECT_NE(state.find("\"generation\":0"), std::string::npos);
    EXPECT_NE(state.find("\"people\":["), std::string::npos);
    EXPECT_NE(mindToJson(kernel, 0).find("\"feature\":\"first name\""), std::string::npos);

    std::ostringstream metrics;
    writeMetricsHeader(metrics);
    logMetrics(kernel, metrics);
    const std::string csv = metrics.str();
    EXPECT_EQ(csv.rfind("generation,facets,", 0), 0u);
    EXPECT_EQ(std::count(csv.begin(), csv.end(), '\n'), 2);

    std::ostringstream events;
    kernel.eventLog().writeCsv(events);
    EXPECT_EQ(events.str().rfind("tick,event_number,type", 0), 0u);
    EXPECT_EQ(kernel.eventLog().count(EventType::Evidence), kernel.ledger().size());
}
