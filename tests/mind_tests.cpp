#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "TestTown.h"

class MindTest : public ::testing::Test {
protected:
    void SetUp() override {
        home = kernel.addPlace(EntityKind::Residence, "House at 120 Oak Avenue", "120 Oak Avenue", 1);
        bank = kernel.addPlace(EntityKind::Business, "Ford's Bank", "301 Main Street", 3);

        Person teller = townsperson("Ann", "Ford", static_cast<std::int32_t>(bank));
        teller.female = true;
        teller.home = static_cast<std::int32_t>(home);
        teller.workplace = static_cast<std::int32_t>(bank);
        teller.jobTitle = "teller";
        teller.jobShift = "day";
        teller.appearance.hairColor = "red";
        ann = kernel.addPerson(teller);

        bo = kernel.addPerson(townsperson("Bo", "Lee", static_cast<std::int32_t>(bank)));
        cy = kernel.addPerson(townsperson("Cy", "Hart"));
    }

    EvidencePtr observe(std::uint32_t who, EntityRef what) {
        auto ev = kernel.recordEvidence(what, personRef(who), ObservationDetails{});
        kernel.buildUp(who, ev);
        return ev;
    }

    EvidencePtr tell(std::uint32_t teller, std::uint32_t listener, EntityRef subject, FeatureType f,
                     const std::string& value) {
        auto ev = kernel.recordEvidence(subject, personRef(teller),
                                        StatementDetails{personRef(listener), {{f, 50.0}}});
        kernel.ingest(listener, subject, f, value, ev);
        return ev;
    }

    Kernel kernel{emptyTownConfig()};
    std::uint32_t home = 0, bank = 0;
    std::uint32_t ann = 0, bo = 0, cy = 0;
};

TEST_F(MindTest, CredibilityTracksFamiliarityAndDistrust) {
    const auto& cfg = kernel.epistemic();
    Mind& m = kernel.mindMut(bo);
    EXPECT_DOUBLE_EQ(m.credibilityOf(personRef(bo), cfg), 1.0);
    EXPECT_DOUBLE_EQ(m.credibilityOf(personRef(ann), cfg), cfg.unknownSourceCredibility);

    m.salience().set(personRef(ann), 1.0);
    EXPECT_DOUBLE_EQ(m.credibilityOf(personRef(ann), cfg), 0.75);

    m.distrust(personRef(ann));
    EXPECT_TRUE(m.distrusts(personRef(ann)));
    EXPECT_DOUBLE_EQ(m.credibilityOf(personRef(ann), cfg), 0.75 * cfg.liarDistrustMultiplier);
}

TEST_F(MindTest, RetentionFallsWithPoorMemory) {
    const auto& cfg = kernel.epistemic();
    EXPECT_DOUBLE_EQ(kernel.mind(bo).dailyRetention(cfg), 1.0 - cfg.baseDailyDecay * (1.0 - 0.7));

    Mind forgetful(personRef(99), 0.1);
    EXPECT_LT(forgetful.dailyRetention(cfg), kernel.mind(bo).dailyRetention(cfg));
}

TEST_F(MindTest, NewcomersKnowOnlyTheirOwnSalience) {
    const Mind& m = kernel.mind(bo);
    EXPECT_EQ(m.modelCount(), 0u);
    EXPECT_DOUBLE_EQ(m.salience().of(personRef(bo)), kernel.epistemic().salienceSelf);
    EXPECT_FALSE(kernel.belief(bo, personRef(ann), FeatureType::HairColor).has_value());
}

TEST(SalienceMapTest, RankingAndFloor) {
    SalienceMap s;
    s.increment(personRef(3), 2.0);
    s.increment(personRef(1), 2.0);
    s.increment(EntityRef{EntityKind::Business, 0}, 5.0);
    s.increment(personRef(4), -3.0);

    EXPECT_DOUBLE_EQ(s.of(personRef(4)), 0.0);
    EXPECT_DOUBLE_EQ(s.of(personRef(8)), 0.0);
    EXPECT_FALSE(s.contains(personRef(8)));

    const auto ranked = s.ranked();
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0], (EntityRef{EntityKind::Business, 0}));
    EXPECT_EQ(ranked[1], personRef(1));
    EXPECT_EQ(ranked[2], personRef(3));
    EXPECT_EQ(ranked[3], personRef(4));
}

TEST_F(MindTest, ReflectionCoversEveryPersonFeature) {
    const std::size_t touched = kernel.reflect(ann);
    EXPECT_EQ(touched, FeatureRegistry::instance().featuresFor(EntityKind::Person).size());
    EXPECT_EQ(kernel.belief(ann, personRef(ann), FeatureType::FirstName), std::optional<std::string>("Ann"));
    EXPECT_EQ(kernel.belief(ann, personRef(ann), FeatureType::Workplace), std::optional<std::string>("Ford's Bank"));
    EXPECT_TRUE(kernel.accurateBelief(ann, personRef(ann), FeatureType::HairColor));
    EXPECT_FALSE(kernel.inaccurateBelief(ann, personRef(ann), FeatureType::HairColor));
}

TEST_F(MindTest, ObservingSomeoneHairColor) {
    observe(bo, personRef(ann));
    EXPECT_EQ(kernel.belief(bo, personRef(ann), FeatureType::HairColor), std::optional<std::string>("red"));
    EXPECT_TRUE(kernel.accurateBelief(bo, personRef(ann), FeatureType::HairColor));
    EXPECT_EQ(kernel.topSource(bo, personRef(ann), FeatureType::HairColor), personRef(bo));

    // Names are not visible
    EXPECT_FALSE(kernel.belief(bo, personRef(ann), FeatureType::FirstName).has_value());
}

TEST_F(MindTest, WorkplaceIsVisibleOnlyAtWork) {
    observe(bo, personRef(ann));
    EXPECT_EQ(kernel.belief(bo, personRef(ann), FeatureType::Workplace), std::optional<std::string>("Ford's Bank"));

    kernel.moveTo(ann, static_cast<std::int32_t>(home));
    kernel.moveTo(cy, static_cast<std::int32_t>(home));
    observe(cy, personRef(ann));
    EXPECT_TRUE(kernel.belief(cy, personRef(ann), FeatureType::HairColor).has_value());
    EXPECT_FALSE(kernel.belief(cy, personRef(ann), FeatureType::Workplace).has_value());
}

TEST_F(MindTest, EmployeesOfABusiness) {
    observe(bo, personRef(ann));
    observe(bo, kernel.place(bank).ref());

    const auto staff = kernel.peopleIBelieveWorkAt(bo, bank);
    ASSERT_EQ(staff.size(), 1u);
    EXPECT_EQ(staff[0], ann);
    EXPECT_EQ(kernel.mostSalientPersonIBelieveWorksAt(bo, bank), std::optional<std::uint32_t>(ann));

    EXPECT_TRUE(kernel.peopleIBelieveWorkAt(bo, home).empty());
    EXPECT_FALSE(kernel.mostSalientPersonIBelieveWorksAt(cy, bank).has_value());
}

TEST_F(MindTest, PeopleBelievedToHaveAName) {
    tell(cy, bo, personRef(ann), FeatureType::FirstName, "Ann");
    tell(cy, bo, personRef(ann), FeatureType::LastName, "Ford");

    EXPECT_EQ(kernel.peopleIBelieveAreNamed(bo, std::string("Ann"), std::nullopt), std::vector<std::uint32_t>{ann});
    EXPECT_EQ(kernel.peopleIBelieveAreNamed(bo, std::string("Ann"), std::string("Ford")),
              std::vector<std::uint32_t>{ann});
    EXPECT_TRUE(kernel.peopleIBelieveAreNamed(bo, std::string("Ann"), std::string("Hart")).empty());
    // Sex was never learned
    EXPECT_TRUE(kernel.peopleIBelieveAreNamed(bo, std::string("Ann"), std::nullopt, std::string("f")).empty());
}

TEST_F(MindTest, SourcesCountEachRecordOnce) {
    // One observation touches many features; two statements touch one each
    observe(bo, personRef(ann));
    tell(cy, bo, personRef(ann), FeatureType::FirstName, "Ann");
    tell(cy, bo, personRef(ann), FeatureType::LastName, "Ford");

    const auto ranked = kernel.sources(bo, personRef(ann));
    ASSERT_EQ(ranked.size(), 2u);
    EXPECT_EQ(ranked[0], personRef(cy));
    EXPECT_EQ(ranked[1], personRef(bo));

    EXPECT_TRUE(kernel.sources(bo, personRef(cy)).empty());
    EXPECT_TRUE(kernel.sources(bo, personRef(ann), FeatureType::Suffix).empty());
}

TEST_F(MindTest, KnownSubjectsAreOrdered) {
    observe(bo, kernel.place(bank).ref());
    observe(bo, personRef(ann));
    const auto subjects = kernel.mind(bo).knownSubjects();
    ASSERT_EQ(subjects.size(), 2u);
    EXPECT_EQ(subjects[0], personRef(ann));
    EXPECT_EQ(subjects[1], kernel.place(bank).ref());
}

TEST_F(MindTest, FeatureMustApplyToSubject) {
    auto ev = observe(bo, kernel.place(bank).ref());
    EXPECT_THROW(kernel.ingest(bo, kernel.place(bank).ref(), FeatureType::HairColor, "brown", ev), ContractViolation);
}

TEST_F(MindTest, EvidenceMustBeAboutTheSubject) {
    auto ev = observe(bo, kernel.place(bank).ref());
    EXPECT_THROW(kernel.ingest(bo, personRef(ann), FeatureType::HairColor, "brown", ev), ContractViolation);
}

TEST_F(MindTest, OnlyPerceptionBuildsUpModels) {
    auto statement = kernel.recordEvidence(personRef(ann), personRef(cy), StatementDetails{personRef(bo), {}});
    EXPECT_THROW(kernel.buildUp(bo, statement), ContractViolation);
}

TEST_F(MindTest, DecayReportsExpiredFacetsInAcquisitionOrder) {
    observe(bo, personRef(ann));
    Mind& m = kernel.mindMut(bo);
    const auto expired = m.decayStrengths(kernel.clock().ordinalDate() + 100000, kernel.epistemic());
    EXPECT_EQ(expired, m.allFacets());
    for (const BeliefFacet* facet : expired) {
        EXPECT_DOUBLE_EQ(facet->strength(), kernel.epistemic().strengthFloor);
    }
}

TEST_F(MindTest, UnknownPeopleAreOutOfRange) {
    EXPECT_THROW(kernel.mind(42), std::out_of_range);
    EXPECT_THROW(kernel.belief(42, personRef(ann), FeatureType::HairColor), std::out_of_range);
}
