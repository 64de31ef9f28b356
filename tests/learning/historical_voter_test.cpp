// File: tests/learning/historical_voter_test.cpp
#include "learning/historical_voter.hpp"
#include "learning/learning_test_fixtures.hpp"
#include <gtest/gtest.h>

namespace aase {
namespace {

using testing::ContextAt;
using testing::NewMemoryStore;

class HistoricalVoterTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = NewMemoryStore();
        voter_ = std::make_unique<HistoricalVoter>(store_);
        now_ = Timestamp::Now();
    }

    /// Late-night snapshot `hours_ago` before now, on today's weekday
    ContextSnapshot Night(int hours_ago, const std::string& situation = "tired") {
        ContextSnapshot ctx = ContextSnapshot::AtTime(now_ - std::chrono::hours(hours_ago));
        ctx.day_of_week = ContextSnapshot::AtTime(now_).day_of_week;
        ctx.is_weekend = ContextSnapshot::AtTime(now_).is_weekend;
        ctx.hour = 23;
        ctx.time_of_day = TimeOfDay::NIGHT;
        ctx.battery_percent = 40;
        ctx.situation = situation;
        return ctx;
    }

    void Add(const ContextSnapshot& ctx, const std::string& action,
             const ActionParams& params = {},
             ActionOutcome outcome = ActionOutcome::SUCCESS) {
        ASSERT_TRUE(store_->Record(ctx, action, params, outcome,
                                   std::chrono::milliseconds(100)).has_value());
    }

    /// Record one action per minute starting at `start`
    void AddSequence(Timestamp start, const std::vector<std::string>& actions) {
        for (size_t i = 0; i < actions.size(); ++i) {
            ContextSnapshot ctx = ContextSnapshot::AtTime(start + std::chrono::minutes(i));
            ctx.situation = "work";
            Add(ctx, actions[i]);
        }
    }

    std::shared_ptr<SqliteEventStore> store_;
    std::unique_ptr<HistoricalVoter> voter_;
    Timestamp now_;
};

TEST_F(HistoricalVoterTest, RejectsNullStoreAndZeroK) {
    EXPECT_THROW(HistoricalVoter voter(nullptr), std::invalid_argument);

    HistoricalVoter::Config config;
    config.k = 0;
    EXPECT_THROW(HistoricalVoter voter(store_, config), std::invalid_argument);
}

TEST_F(HistoricalVoterTest, RejectsZeroRecordAndOccurrenceMinimums) {
    HistoricalVoter::Config config;
    config.min_records = 0;
    EXPECT_THROW(HistoricalVoter voter(store_, config), std::invalid_argument);

    config = HistoricalVoter::Config{};
    config.workflow_min_occurrences = 0;
    EXPECT_THROW(HistoricalVoter voter(store_, config), std::invalid_argument);
}

TEST_F(HistoricalVoterTest, SingleRecordMinimumOnEmptyStoreAbstains) {
    HistoricalVoter::Config config;
    config.min_records = 1;
    config.workflow_min_occurrences = 1;
    HistoricalVoter voter(store_, config);

    EXPECT_FALSE(voter.Predict("tired", ContextAt(4, 23)).has_value());
    EXPECT_FALSE(voter.DetectWorkflow({"mail.open", "calendar.open"}).has_value());
}

// ============================================================================
// k-NN Vote
// ============================================================================

TEST_F(HistoricalVoterTest, FewerThanThreeRecordsGiveNothing) {
    Add(Night(1), "dnd.on");
    Add(Night(2), "dnd.on");
    EXPECT_FALSE(voter_->Predict("tired", Night(0)).has_value());
}

TEST_F(HistoricalVoterTest, FailedRecordsDoNotCount) {
    Add(Night(1), "dnd.on");
    Add(Night(2), "dnd.on");
    Add(Night(3), "dnd.on", {}, ActionOutcome::FAILURE);
    Add(Night(4), "dnd.on", {}, ActionOutcome::CANCELED);
    EXPECT_FALSE(voter_->Predict("tired", Night(0)).has_value());
}

TEST_F(HistoricalVoterTest, ThreeNightRecordsPredictConfidently) {
    Add(Night(1), "dnd.on");
    Add(Night(2), "dnd.on");
    Add(Night(3), "dnd.on");

    auto pred = voter_->Predict("tired", Night(0));
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("dnd.on", pred->action);
    EXPECT_GE(pred->confidence, 0.7f);
    EXPECT_LE(pred->confidence, 1.0f);
    EXPECT_EQ(PredictionSource::HISTORICAL, pred->source);
    EXPECT_EQ(3u, pred->sample_size);
    EXPECT_EQ("you did this 3/3 times in similar contexts", pred->reason);
}

TEST_F(HistoricalVoterTest, MajorityWinsWithShareAsConfidence) {
    Add(Night(1), "dnd.on");
    Add(Night(2), "music.play");
    Add(Night(3), "dnd.on");
    Add(Night(4), "dnd.on");

    auto pred = voter_->Predict("tired", Night(0));
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("dnd.on", pred->action);
    EXPECT_NEAR(0.75f, pred->confidence, 1e-5f);
    EXPECT_EQ("you did this 3/4 times in similar contexts", pred->reason);
}

TEST_F(HistoricalVoterTest, SplitVoteIsTooWeak) {
    Add(Night(1), "dnd.on");
    Add(Night(2), "music.play");
    Add(Night(3), "dnd.on");
    Add(Night(4), "music.play");
    EXPECT_FALSE(voter_->Predict("tired", Night(0)).has_value());
}

TEST_F(HistoricalVoterTest, OtherSituationsAreIgnored) {
    Add(Night(1, "bored"), "youtube.open");
    Add(Night(2, "bored"), "youtube.open");
    Add(Night(3, "bored"), "youtube.open");
    EXPECT_FALSE(voter_->Predict("tired", Night(0)).has_value());
}

TEST_F(HistoricalVoterTest, OnlyTopKVote) {
    HistoricalVoter::Config config;
    config.k = 3;
    HistoricalVoter voter(store_, config);

    // Three matching night records outrank two afternoon records
    Add(Night(1), "dnd.on");
    Add(Night(2), "dnd.on");
    Add(Night(3), "dnd.on");
    ContextSnapshot afternoon = ContextAt(4, 14, "tired", 90);
    Add(afternoon, "music.play");
    Add(afternoon, "music.play");

    auto pred = voter.Predict("tired", Night(0));
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("dnd.on", pred->action);
    EXPECT_EQ("you did this 3/3 times in similar contexts", pred->reason);
}

TEST_F(HistoricalVoterTest, OldRecordsWeighLess) {
    // Identical contexts sixty days old: recency 1/3
    Timestamp old = now_ - std::chrono::hours(24 * 60);
    for (int i = 0; i < 3; ++i) {
        ContextSnapshot ctx = Night(0);
        ctx.timestamp = old - std::chrono::minutes(i);
        Add(ctx, "dnd.on");
    }
    EXPECT_FALSE(voter_->Predict("tired", Night(0)).has_value());
}

TEST_F(HistoricalVoterTest, WinningParametersAreTheMode) {
    Add(Night(1), "dnd.on", {{"duration", "8h"}, {"mode", "silent"}});
    Add(Night(2), "dnd.on", {{"duration", "1h"}});
    Add(Night(3), "dnd.on", {{"duration", "8h"}});

    auto pred = voter_->Predict("tired", Night(0));
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("8h", pred->params.at("duration"));
    EXPECT_EQ("silent", pred->params.at("mode"));
}

TEST(HistoricalVoterStaticTest, ModeParamsTiesGoToFirstSeen) {
    std::vector<ActionParams> list = {
        {{"volume", "40"}, {"room", "bed"}},
        {{"volume", "60"}},
        {{"volume", "60"}, {"room", "office"}},
        {{"volume", "40"}},
    };
    ActionParams mode = HistoricalVoter::ModeParams(list);
    EXPECT_EQ("40", mode.at("volume"));
    EXPECT_EQ("bed", mode.at("room"));

    EXPECT_TRUE(HistoricalVoter::ModeParams({}).empty());
}

// ============================================================================
// Workflows
// ============================================================================

TEST_F(HistoricalVoterTest, DetectsRoutineIncludingTrailingSequence) {
    Timestamp base = now_ - std::chrono::hours(48);
    for (int i = 0; i < 5; ++i) {
        AddSequence(base + std::chrono::hours(i), {"mail.open", "calendar.open", "chat.open"});
    }

    auto suggestion = voter_->DetectWorkflow({"music.play", "mail.open", "calendar.open"});
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ((std::vector<std::string>{"mail.open", "calendar.open"}), suggestion->pattern);
    EXPECT_EQ("chat.open", suggestion->next_action);
    EXPECT_EQ(5u, suggestion->occurrences);
    EXPECT_EQ(5u, suggestion->matches);
    EXPECT_FLOAT_EQ(1.0f, suggestion->confidence);
}

TEST_F(HistoricalVoterTest, RoutineNeedsFiveOccurrences) {
    Timestamp base = now_ - std::chrono::hours(48);
    for (int i = 0; i < 4; ++i) {
        AddSequence(base + std::chrono::hours(i), {"mail.open", "calendar.open", "chat.open"});
    }
    EXPECT_FALSE(voter_->DetectWorkflow({"mail.open", "calendar.open"}).has_value());
}

TEST_F(HistoricalVoterTest, RoutineVotesOnFollower) {
    Timestamp base = now_ - std::chrono::hours(48);
    for (int i = 0; i < 4; ++i) {
        AddSequence(base + std::chrono::hours(i), {"mail.open", "calendar.open", "chat.open"});
    }
    for (int i = 4; i < 6; ++i) {
        AddSequence(base + std::chrono::hours(i), {"mail.open", "calendar.open", "notes.open"});
    }

    auto suggestion = voter_->DetectWorkflow({"mail.open", "calendar.open"});
    ASSERT_TRUE(suggestion.has_value());
    EXPECT_EQ("chat.open", suggestion->next_action);
    EXPECT_EQ(4u, suggestion->occurrences);
    EXPECT_EQ(6u, suggestion->matches);
    EXPECT_NEAR(4.0f / 6.0f, suggestion->confidence, 1e-6f);
}

TEST_F(HistoricalVoterTest, ShortSequencesAreNotRoutines) {
    Timestamp base = now_ - std::chrono::hours(48);
    for (int i = 0; i < 6; ++i) {
        AddSequence(base + std::chrono::hours(i), {"mail.open", "calendar.open"});
    }
    EXPECT_FALSE(voter_->DetectWorkflow({"mail.open", "calendar.open"}).has_value());
}

TEST_F(HistoricalVoterTest, WorkflowNeedsTwoRecentActions) {
    EXPECT_FALSE(voter_->DetectWorkflow({}).has_value());
    EXPECT_FALSE(voter_->DetectWorkflow({"mail.open"}).has_value());
}

// ============================================================================
// Parameters
// ============================================================================

TEST_F(HistoricalVoterTest, OptimizeParametersUsesSimilarContexts) {
    Add(Night(1), "dnd.on", {{"duration", "8h"}});
    Add(Night(2), "dnd.on", {{"duration", "8h"}});
    Add(Night(3), "dnd.on", {{"duration", "2h"}});

    ActionParams defaults{{"duration", "1h"}};
    ActionParams params = voter_->OptimizeParameters("dnd.on", Night(0), defaults);
    EXPECT_EQ("8h", params.at("duration"));
}

TEST_F(HistoricalVoterTest, OptimizeParametersFallsBackToDefaults) {
    ActionParams defaults{{"duration", "1h"}};

    // Too little history
    Add(Night(1), "dnd.on", {{"duration", "8h"}});
    EXPECT_EQ(defaults, voter_->OptimizeParameters("dnd.on", Night(0), defaults));

    // Enough history, but nothing like a weekday-morning work context
    Add(Night(2), "dnd.on", {{"duration", "8h"}});
    Add(Night(3), "dnd.on", {{"duration", "8h"}});
    ContextSnapshot morning = Night(0, "work");
    morning.hour = 9;
    morning.time_of_day = TimeOfDay::MORNING;
    morning.day_of_week = (morning.day_of_week + 3) % 7;
    morning.battery_percent.reset();
    EXPECT_EQ(defaults, voter_->OptimizeParameters("dnd.on", morning, defaults));
}

} // namespace
} // namespace aase
