// File: tests/learning/reinforcement_learner_test.cpp
#include "learning/reinforcement_learner.hpp"
#include "learning/learning_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <map>

namespace aase {
namespace {

using testing::ContextAt;
using testing::NewMemoryStore;

ReinforcementLearner::Config Greedy() {
    ReinforcementLearner::Config config;
    config.epsilon = 0.0;
    config.seed = 42;
    return config;
}

// ============================================================================
// Construction
// ============================================================================

TEST(ReinforcementLearnerTest, RejectsNullStore) {
    EXPECT_THROW(ReinforcementLearner learner(nullptr), std::invalid_argument);
}

TEST(ReinforcementLearnerTest, RejectsOutOfRangeConfig) {
    auto store = NewMemoryStore();

    ReinforcementLearner::Config bad_alpha;
    bad_alpha.learning_rate = 0.0;
    EXPECT_THROW(ReinforcementLearner learner(store, bad_alpha), std::invalid_argument);

    ReinforcementLearner::Config bad_gamma;
    bad_gamma.discount = 1.5;
    EXPECT_THROW(ReinforcementLearner learner(store, bad_gamma), std::invalid_argument);

    ReinforcementLearner::Config bad_epsilon;
    bad_epsilon.epsilon = -0.1;
    EXPECT_THROW(ReinforcementLearner learner(store, bad_epsilon), std::invalid_argument);
}

// ============================================================================
// Fingerprint
// ============================================================================

TEST(ReinforcementLearnerTest, FingerprintIsSixteenHexDigits) {
    std::string fp = ReinforcementLearner::Fingerprint(ContextAt(4, 23, "", 40), "tired");
    ASSERT_EQ(16u, fp.size());
    EXPECT_EQ(std::string::npos, fp.find_first_not_of("0123456789abcdef"));
}

TEST(ReinforcementLearnerTest, FingerprintIgnoresMinutesAndBatteryWithinTier) {
    ContextSnapshot a = ContextAt(4, 22, "", 40, 5);
    ContextSnapshot b = ContextAt(4, 23, "", 60, 55);
    EXPECT_EQ(ReinforcementLearner::Fingerprint(a, "tired"),
              ReinforcementLearner::Fingerprint(b, "tired"));
}

TEST(ReinforcementLearnerTest, FingerprintSeparatesStates) {
    ContextSnapshot base = ContextAt(4, 23, "", 40);
    std::string fp = ReinforcementLearner::Fingerprint(base, "tired");

    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(base, "bored"));
    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(ContextAt(5, 23, "", 40), "tired"));
    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(ContextAt(4, 9, "", 40), "tired"));
    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(ContextAt(4, 23, "", 20), "tired"));
    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(ContextAt(4, 23, "", 80), "tired"));

    ContextSnapshot charging = base;
    charging.is_charging = true;
    EXPECT_NE(fp, ReinforcementLearner::Fingerprint(charging, "tired"));
}

TEST(ReinforcementLearnerTest, MissingBatteryCountsAsMediumTier) {
    ContextSnapshot unknown = ContextAt(4, 23);
    ContextSnapshot medium = ContextAt(4, 23, "", 50);
    EXPECT_EQ(ReinforcementLearner::Fingerprint(unknown, "tired"),
              ReinforcementLearner::Fingerprint(medium, "tired"));
}

// ============================================================================
// Selection
// ============================================================================

TEST(ReinforcementLearnerTest, NoCandidatesNoPrediction) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    EXPECT_FALSE(learner.SelectAction(ContextAt(4, 23), "tired", {}).has_value());
}

TEST(ReinforcementLearnerTest, UnseenPairsTieToFirstCandidate) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    auto pred = learner.SelectAction(ContextAt(4, 23), "tired", {"music.play", "dnd.on"});

    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("music.play", pred->action);
    EXPECT_EQ(PredictionSource::REINFORCEMENT, pred->source);
    EXPECT_FALSE(pred->explored);
    ASSERT_TRUE(pred->value.has_value());
    EXPECT_DOUBLE_EQ(0.0, *pred->value);
    EXPECT_FLOAT_EQ(0.0f, pred->confidence);
}

TEST(ReinforcementLearnerTest, ExploitsHighestValue) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);

    learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);
    learner.Update(ctx, "tired", "music.play", ActionOutcome::FAILURE);

    auto pred = learner.SelectAction(ctx, "tired", {"music.play", "dnd.on"});
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("dnd.on", pred->action);
    EXPECT_NEAR(0.1, *pred->value, 1e-9);
    EXPECT_NEAR(0.1f, pred->confidence, 1e-6f);
}

TEST(ReinforcementLearnerTest, ConfidenceUsesMagnitudeOfNegativeValue) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);
    learner.Update(ctx, "tired", "music.play", ActionOutcome::CANCELED);

    auto pred = learner.SelectAction(ctx, "tired", {"music.play"});
    ASSERT_TRUE(pred.has_value());
    EXPECT_NEAR(-0.1, *pred->value, 1e-9);
    EXPECT_NEAR(0.1f, pred->confidence, 1e-6f);
}

TEST(ReinforcementLearnerTest, FullExplorationPicksAmongCandidates) {
    ReinforcementLearner::Config config;
    config.epsilon = 1.0;
    config.seed = 7;
    ReinforcementLearner learner(NewMemoryStore(), config);

    std::vector<std::string> candidates{"a", "b", "c"};
    std::map<std::string, int> picks;
    for (int i = 0; i < 300; ++i) {
        auto pred = learner.SelectAction(ContextAt(4, 23), "tired", candidates);
        ASSERT_TRUE(pred.has_value());
        EXPECT_TRUE(pred->explored);
        ++picks[pred->action];
    }

    EXPECT_EQ(3u, picks.size());
    for (const auto& entry : picks) {
        EXPECT_GT(entry.second, 50) << entry.first;
    }
    EXPECT_EQ(300u, learner.GetStats().explorations);
}

TEST(ReinforcementLearnerTest, SeededExplorationIsReproducible) {
    ReinforcementLearner::Config config;
    config.epsilon = 0.5;
    config.seed = 1234;
    ReinforcementLearner a(NewMemoryStore(), config);
    ReinforcementLearner b(NewMemoryStore(), config);

    std::vector<std::string> candidates{"a", "b", "c", "d"};
    for (int i = 0; i < 50; ++i) {
        auto pa = a.SelectAction(ContextAt(4, 23), "tired", candidates);
        auto pb = b.SelectAction(ContextAt(4, 23), "tired", candidates);
        EXPECT_EQ(pa->action, pb->action);
        EXPECT_EQ(pa->explored, pb->explored);
    }
}

// ============================================================================
// Learning
// ============================================================================

TEST(ReinforcementLearnerTest, RewardMapping) {
    ReinforcementLearner learner(NewMemoryStore());
    EXPECT_DOUBLE_EQ(1.0, learner.RewardFor(ActionOutcome::SUCCESS));
    EXPECT_DOUBLE_EQ(-0.5, learner.RewardFor(ActionOutcome::FAILURE));
    EXPECT_DOUBLE_EQ(-1.0, learner.RewardFor(ActionOutcome::CANCELED));
}

TEST(ReinforcementLearnerTest, FirstUpdateFromZero) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);

    EXPECT_NEAR(0.1, learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS), 1e-9);
    EXPECT_NEAR(-0.05, learner.Update(ctx, "tired", "music.play", ActionOutcome::FAILURE), 1e-9);
}

TEST(ReinforcementLearnerTest, RepeatedSuccessIncreasesValueMonotonically) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);

    double previous = 0.0;
    for (int i = 0; i < 50; ++i) {
        double value = learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);
        EXPECT_GT(value, previous);
        previous = value;
    }
    // Fixed point of the self-bootstrapped update is reward / (1 - γ)
    EXPECT_LT(previous, 10.0);
}

TEST(ReinforcementLearnerTest, NextStateMaximumIsDiscounted) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot now = ContextAt(4, 22, "", 40);
    ContextSnapshot later = ContextAt(5, 8, "", 40);

    // Give the next state a known value of 0.1 for "alarm.set"
    learner.Update(later, "tired", "alarm.set", ActionOutcome::SUCCESS);

    // 0 + 0.1 * (1 + 0.9 * 0.1 - 0)
    double value = learner.Update(now, "tired", "dnd.on", ActionOutcome::SUCCESS,
                                  later, {"dnd.on", "alarm.set"});
    EXPECT_NEAR(0.109, value, 1e-9);
}

TEST(ReinforcementLearnerTest, RepeatedUpdatesApproachTargetWithoutOvershoot) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot now = ContextAt(4, 22, "", 40);
    ContextSnapshot later = ContextAt(5, 8, "", 40);

    learner.Update(later, "tired", "alarm.set", ActionOutcome::SUCCESS);
    const double max_next = learner.GetValue(ReinforcementLearner::Fingerprint(later, "tired"),
                                             "alarm.set");
    ASSERT_NEAR(0.1, max_next, 1e-9);
    const double target = 1.0 + 0.9 * max_next;

    double gap = target;
    for (int i = 0; i < 50; ++i) {
        double value = learner.Update(now, "tired", "dnd.on", ActionOutcome::SUCCESS,
                                      later, {"alarm.set"});
        EXPECT_LE(value, target + 1e-9) << "step " << i;
        EXPECT_LT(target - value, gap) << "step " << i;
        gap = target - value;
    }
    // (1 - α)^50 of the initial gap remains
    EXPECT_NEAR(target * std::pow(0.9, 50), gap, 1e-9);
}

TEST(ReinforcementLearnerTest, ValuesPersistThroughStore) {
    auto store = NewMemoryStore();
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);
    std::string fp = ReinforcementLearner::Fingerprint(ctx, "tired");
    {
        ReinforcementLearner learner(store, Greedy());
        learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);
        learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);
    }

    auto values = store->LoadValueTable();
    ASSERT_EQ(1u, values.size());
    EXPECT_EQ(fp, values[0].fingerprint);
    EXPECT_EQ(2u, values[0].update_count);

    ReinforcementLearner reloaded(store, Greedy());
    EXPECT_NEAR(0.199, reloaded.GetValue(fp, "dnd.on"), 1e-9);
    EXPECT_EQ(1u, reloaded.GetStats().table_size);
}

TEST(ReinforcementLearnerTest, ResetClearsValues) {
    auto store = NewMemoryStore();
    ReinforcementLearner learner(store, Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);
    learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);

    EXPECT_TRUE(learner.Reset());
    EXPECT_DOUBLE_EQ(0.0, learner.GetValue(ReinforcementLearner::Fingerprint(ctx, "tired"), "dnd.on"));
    EXPECT_TRUE(store->LoadValueTable().empty());
}

TEST(ReinforcementLearnerTest, StatsCountSelectionsAndUpdates) {
    ReinforcementLearner learner(NewMemoryStore(), Greedy());
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);

    learner.SelectAction(ctx, "tired", {"dnd.on"});
    learner.SelectAction(ctx, "tired", {"dnd.on"});
    learner.Update(ctx, "tired", "dnd.on", ActionOutcome::SUCCESS);

    auto stats = learner.GetStats();
    EXPECT_EQ(2u, stats.exploitations);
    EXPECT_EQ(0u, stats.explorations);
    EXPECT_EQ(1u, stats.updates);
    EXPECT_EQ(0u, stats.failed_writes);
    EXPECT_EQ(1u, stats.table_size);
}

} // namespace
} // namespace aase
