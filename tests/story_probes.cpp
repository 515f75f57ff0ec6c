#include <gtest/gtest.h>
#include "kernel/Kernel.h"

// Story probe: a town getting to know itself
TEST(StoryProbeTest, TownLearnsAboutItself) {
    KernelConfig cfg;
    cfg.seed = 1979;
    Kernel kernel(cfg);

    // Twenty days of ordinary life
    kernel.stepN(40);

    const auto& ledger = kernel.ledger();
    EXPECT_GT(ledger.count(EvidenceKind::Observation), 0u);
    EXPECT_GT(ledger.count(EvidenceKind::Statement), 0u);
    // Every statement is followed by the talker's own declaration
    EXPECT_EQ(ledger.count(EvidenceKind::Declaration), ledger.count(EvidenceKind::Statement));

    auto metrics = kernel.computeMetrics();
    EXPECT_GT(metrics.knownFacets, 0u);
    // Most of what people believe is true; noise and lies are the exception
    EXPECT_GT(metrics.accurateShare, 0.8);
}

// Story probe: rumors from disagreeable neighbors
TEST(StoryProbeTest, LiarsGetCaught) {
    KernelConfig cfg;
    cfg.seed = 4;
    cfg.epistemic.chanceLie = 0.5;
    Kernel kernel(cfg);

    kernel.stepN(60);

    // People keep seeing the folks they were lied to about
    EXPECT_GT(kernel.ledger().count(EvidenceKind::Lie), 0u);
    EXPECT_GT(kernel.computeMetrics().distrustPairs, 0u);
    EXPECT_EQ(kernel.eventLog().count(EventType::Distrusted), kernel.computeMetrics().distrustPairs);

    // With everyone lying, the town believes less truth than an honest one
    KernelConfig honest = cfg;
    honest.epistemic.chanceLie = 0.0;
    Kernel control(honest);
    control.stepN(60);
    EXPECT_LT(kernel.computeMetrics().accurateShare, control.computeMetrics().accurateShare);
}

// Story probe: a decade away
TEST(StoryProbeTest, StrangersFadeOverTheYears) {
    KernelConfig cfg;
    cfg.seed = 99;
    Kernel kernel(cfg);
    kernel.stepN(10);
    EXPECT_EQ(kernel.ledger().count(EvidenceKind::Forgetting), 0u);

    kernel.fastForward(3650);

    auto metrics = kernel.computeMetrics();
    EXPECT_GT(metrics.forgottenFacets, 0u);
    EXPECT_EQ(kernel.ledger().count(EvidenceKind::Forgetting), kernel.eventLog().count(EventType::Forgotten));

    // Backstory keeps self-knowledge intact
    for (const auto& p : kernel.people()) {
        if (p.age >= TuningConstants::kMinImplantAge) {
            EXPECT_TRUE(kernel.accurateBelief(p.id, personRef(p.id), FeatureType::LastName));
        }
    }
}

// Story probe: decay across threads records the same history as decay on one
TEST(StoryProbeTest, ParallelDecayMatchesSerial) {
    KernelConfig cfg;
    cfg.seed = 2024;
    cfg.population = 90;
    cfg.residences = 30;
    cfg.businesses = 8;
    cfg.epistemic.baseDailyDecay = 0.9;

    KernelConfig serial = cfg;
    serial.parallelDecay = false;

    Kernel threaded(cfg);
    Kernel single(serial);
    threaded.stepN(30);
    single.stepN(30);

    ASSERT_EQ(threaded.ledger().size(), single.ledger().size());
    EXPECT_GT(threaded.ledger().count(EvidenceKind::Forgetting), 0u);
    EXPECT_EQ(threaded.eventLog().size(), single.eventLog().size());
    for (std::size_t i = 0; i < threaded.ledger().size(); ++i) {
        EXPECT_EQ(threaded.ledger().records()[i]->kind(), single.ledger().records()[i]->kind());
    }
}
