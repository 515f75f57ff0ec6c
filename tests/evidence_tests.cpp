#include <gtest/gtest.h>
#include "kernel/Kernel.h"
#include "TestTown.h"

class EvidenceTest : public ::testing::Test {
protected:
    void SetUp() override {
        bank = kernel.addPlace(EntityKind::Business, "Ford's Bank", "301 Main Street", 3);
        diner = kernel.addPlace(EntityKind::Business, "Hale's Diner", "412 Elm Street", 4);
        ann = kernel.addPerson(townsperson("Ann", "Ford", static_cast<std::int32_t>(bank)));
        bo = kernel.addPerson(townsperson("Bo", "Lee", static_cast<std::int32_t>(bank)));
        cy = kernel.addPerson(townsperson("Cy", "Hart", static_cast<std::int32_t>(diner)));
    }

    Kernel kernel{emptyTownConfig()};
    std::uint32_t bank = 0, diner = 0;
    std::uint32_t ann = 0, bo = 0, cy = 0;
};

TEST_F(EvidenceTest, EventNumbersStrictlyIncrease) {
    auto a = kernel.recordEvidence(personRef(ann), personRef(ann), ReflectionDetails{});
    auto b = kernel.recordEvidence(personRef(bo), personRef(ann), ObservationDetails{});
    auto c = kernel.recordEvidence(personRef(ann), personRef(ann), ForgettingDetails{});

    EXPECT_LT(a->eventNumber(), b->eventNumber());
    EXPECT_LT(b->eventNumber(), c->eventNumber());
    EXPECT_EQ(kernel.ledger().size(), 3u);
    EXPECT_EQ(kernel.ledger().count(EvidenceKind::Observation), 1u);
    EXPECT_EQ(kernel.ledger().records().back(), c);
}

TEST_F(EvidenceTest, StampCarriesSourceLocationAndTime) {
    auto ev = kernel.recordEvidence(personRef(bo), personRef(ann), ObservationDetails{});
    EXPECT_EQ(ev->stamp().location, static_cast<std::int32_t>(bank));
    EXPECT_EQ(ev->ordinalDate(), kernel.clock().ordinalDate());
    EXPECT_FALSE(ev->stamp().night);
}

TEST_F(EvidenceTest, ReflectionMustBeAboutSelf) {
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), ReflectionDetails{}), ContractViolation);
    EXPECT_EQ(kernel.ledger().size(), 0u);
}

TEST_F(EvidenceTest, ObservationRequiresSharedLocation) {
    EXPECT_THROW(kernel.recordEvidence(personRef(cy), personRef(ann), ObservationDetails{}), ContractViolation);
    EXPECT_THROW(kernel.recordEvidence(personRef(ann), personRef(ann), ObservationDetails{}), ContractViolation);
    EXPECT_THROW(kernel.recordEvidence(EntityRef{EntityKind::Business, diner}, personRef(ann), ObservationDetails{}),
                 ContractViolation);
    EXPECT_NO_THROW(kernel.recordEvidence(EntityRef{EntityKind::Business, bank}, personRef(ann), ObservationDetails{}));

    kernel.moveTo(ann, -1);
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), ObservationDetails{}), ContractViolation);
}

TEST_F(EvidenceTest, ConversationNeedsAnotherPerson) {
    EXPECT_THROW(kernel.recordEvidence(personRef(cy), personRef(ann), StatementDetails{personRef(ann), {}}),
                 ContractViolation);
    EXPECT_THROW(kernel.recordEvidence(personRef(cy), personRef(ann), LieDetails{EntityRef{EntityKind::Business, bank}, {}}),
                 ContractViolation);
    EXPECT_THROW(kernel.recordEvidence(personRef(cy), personRef(ann),
                                       EavesdroppingDetails{personRef(bo), personRef(bo), {}}),
                 ContractViolation);
}

TEST_F(EvidenceTest, TellerStrengthsMustFitSubject) {
    TellerStrengths wrong{{FeatureType::HairColor, 50.0}};
    EXPECT_THROW(kernel.recordEvidence(EntityRef{EntityKind::Business, bank}, personRef(ann),
                                       StatementDetails{personRef(bo), wrong}),
                 ContractViolation);
}

TEST_F(EvidenceTest, DeteriorationPayloadsAreChecked) {
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), MutationDetails{""}), ContractViolation);

    FacetKey sameSubject{personRef(ann), personRef(bo), FeatureType::HairColor};
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), TransferenceDetails{sameSubject, 20.0}),
                 ContractViolation);

    FacetKey otherOwner{personRef(cy), personRef(cy), FeatureType::HairColor};
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), TransferenceDetails{otherOwner, 20.0}),
                 ContractViolation);

    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(ann), ImplantDetails{-1.0}), ContractViolation);
}

TEST_F(EvidenceTest, UnknownEntitiesAreRejected) {
    EXPECT_THROW(kernel.recordEvidence(personRef(99), personRef(ann), ImplantDetails{1.0}), ContractViolation);
    EXPECT_THROW(kernel.recordEvidence(personRef(bo), personRef(99), ImplantDetails{1.0}), ContractViolation);
    // A residence id that is really a business
    EXPECT_THROW(kernel.recordEvidence(EntityRef{EntityKind::Residence, bank}, personRef(ann), ImplantDetails{1.0}),
                 ContractViolation);
}

TEST_F(EvidenceTest, KindClassification) {
    auto reflection = kernel.recordEvidence(personRef(ann), personRef(ann), ReflectionDetails{});
    auto statement = kernel.recordEvidence(personRef(cy), personRef(ann), StatementDetails{personRef(bo), {}});
    auto mutation = kernel.recordEvidence(personRef(cy), personRef(ann), MutationDetails{"brown"});

    EXPECT_TRUE(reflection->firsthand());
    EXPECT_FALSE(reflection->deterioration());
    EXPECT_FALSE(statement->firsthand());
    EXPECT_EQ(statement->recipient(), personRef(bo));
    EXPECT_FALSE(statement->eavesdropper().has_value());
    EXPECT_TRUE(mutation->deterioration());
    EXPECT_EQ(evidenceKindName(mutation->kind()), std::string("mutation"));
}

TEST_F(EvidenceTest, TellerStrengthLookup) {
    TellerStrengths told{{FeatureType::HairColor, 64.0}};
    auto lie = kernel.recordEvidence(personRef(cy), personRef(ann), LieDetails{personRef(bo), told});
    ASSERT_TRUE(lie->tellerStrengthFor(FeatureType::HairColor).has_value());
    EXPECT_DOUBLE_EQ(*lie->tellerStrengthFor(FeatureType::HairColor), 64.0);
    EXPECT_FALSE(lie->tellerStrengthFor(FeatureType::EyeColor).has_value());
}

TEST_F(EvidenceTest, AdjustedStrengthIsWriteOnceOnForgetting) {
    auto forgetting = kernel.recordEvidence(personRef(bo), personRef(ann), ForgettingDetails{});
    EXPECT_FALSE(forgetting->adjustedStrength().has_value());
    forgetting->setAdjustedStrength(42.0);
    EXPECT_DOUBLE_EQ(*forgetting->adjustedStrength(), 42.0);
    EXPECT_THROW(forgetting->setAdjustedStrength(10.0), ContractViolation);

    auto observation = kernel.recordEvidence(personRef(bo), personRef(ann), ObservationDetails{});
    EXPECT_THROW(observation->setAdjustedStrength(10.0), ContractViolation);
}

TEST_F(EvidenceTest, DescribeNamesThePartiesAndPlace) {
    auto lie = kernel.recordEvidence(personRef(cy), personRef(ann), LieDetails{personRef(bo), {}});
    const std::string text = describe(*lie, kernel);
    EXPECT_NE(text.find("Ann Ford's lie to Bo Lee about Cy Hart"), std::string::npos);
    EXPECT_NE(text.find("Ford's Bank"), std::string::npos);

    auto eaves = kernel.recordEvidence(personRef(cy), personRef(ann),
                                       EavesdroppingDetails{personRef(bo), personRef(cy), {}});
    EXPECT_NE(describe(*eaves, kernel).find("Cy Hart's eavesdropping of Ann Ford's statement to Bo Lee"),
              std::string::npos);
}
