// File: tests/learning/active_learner_test.cpp
#include "learning/active_learner.hpp"
#include "learning/learning_test_fixtures.hpp"
#include <gtest/gtest.h>

namespace aase {
namespace {

using testing::ContextAt;
using testing::NewMemoryStore;

Prediction Option(const std::string& action, float confidence,
                  PredictionSource source = PredictionSource::HISTORICAL) {
    Prediction pred;
    pred.action = action;
    pred.confidence = confidence;
    pred.source = source;
    return pred;
}

class ActiveLearnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = NewMemoryStore();
        learner_ = std::make_unique<ActiveLearner>(store_);
        options_ = {Option("dnd.on", 0.55f), Option("music.play", 0.4f),
                    Option("lights.dim", 0.125f)};
    }

    std::shared_ptr<SqliteEventStore> store_;
    std::unique_ptr<ActiveLearner> learner_;
    std::vector<Prediction> options_;
};

TEST_F(ActiveLearnerTest, RejectsNullStoreAndBadOptionCount) {
    EXPECT_THROW(ActiveLearner learner(nullptr), std::invalid_argument);

    ActiveLearner::Config none;
    none.max_options = 0;
    EXPECT_THROW(ActiveLearner learner(store_, none), std::invalid_argument);

    ActiveLearner::Config too_many;
    too_many.max_options = 26;
    EXPECT_THROW(ActiveLearner learner(store_, too_many), std::invalid_argument);
}

// ============================================================================
// ShouldAsk
// ============================================================================

TEST_F(ActiveLearnerTest, NoPredictionsNoQuestion) {
    auto decision = learner_->ShouldAsk({});
    EXPECT_FALSE(decision.should_ask);
    EXPECT_TRUE(decision.options.empty());
}

TEST_F(ActiveLearnerTest, ConfidentBestMeansNoQuestion) {
    auto decision = learner_->ShouldAsk({Option("a", 0.3f), Option("b", 0.6f)});
    EXPECT_FALSE(decision.should_ask);
    EXPECT_TRUE(decision.options.empty());
}

TEST_F(ActiveLearnerTest, UncertainBestAsksWithTopThreeSorted) {
    auto decision = learner_->ShouldAsk({Option("a", 0.2f), Option("b", 0.5f),
                                         Option("c", 0.1f), Option("d", 0.59f)});
    ASSERT_TRUE(decision.should_ask);
    ASSERT_EQ(3u, decision.options.size());
    EXPECT_EQ("d", decision.options[0].action);
    EXPECT_EQ("b", decision.options[1].action);
    EXPECT_EQ("a", decision.options[2].action);
}

TEST_F(ActiveLearnerTest, EqualConfidenceKeepsInputOrder) {
    auto decision = learner_->ShouldAsk({Option("first", 0.3f), Option("second", 0.3f)});
    ASSERT_TRUE(decision.should_ask);
    EXPECT_EQ("first", decision.options[0].action);
    EXPECT_EQ("second", decision.options[1].action);
}

// ============================================================================
// FormatQuery
// ============================================================================

TEST_F(ActiveLearnerTest, FormatQueryLayout) {
    std::string expected =
        "I'm not sure what to do for 'tired'. Should I:\n"
        "  A) dnd.on (confidence: 55%)\n"
        "  B) music.play (confidence: 40%)\n"
        "  C) lights.dim (confidence: 13%)\n"
        "  D) Something else\n"
        "Your choice (A/B/C...):";
    EXPECT_EQ(expected, learner_->FormatQuery("tired", options_));
}

TEST_F(ActiveLearnerTest, FormatQueryWithoutOptionsIsEmpty) {
    EXPECT_EQ("", learner_->FormatQuery("tired", {}));
}

// ============================================================================
// ApplyChoice
// ============================================================================

TEST_F(ActiveLearnerTest, ChoosingBRecordsSuccess) {
    ContextSnapshot ctx = ContextAt(4, 23, "", 40);
    auto pred = learner_->ApplyChoice("tired", ctx, options_, "B");

    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("music.play", pred->action);
    EXPECT_FLOAT_EQ(0.95f, pred->confidence);
    EXPECT_EQ(PredictionSource::USER_TAUGHT, pred->source);
    EXPECT_EQ("chosen by user", pred->reason);

    auto records = store_->RecentActions(10);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("tired", records[0].situation);
    EXPECT_EQ("music.play", records[0].action);
    EXPECT_EQ(ActionOutcome::SUCCESS, records[0].outcome);
    EXPECT_EQ(0, records[0].duration_ms);
}

TEST_F(ActiveLearnerTest, ChoiceIsCaseAndWhitespaceTolerant) {
    auto pred = learner_->ApplyChoice("tired", ContextAt(4, 23), options_, "  c \n");
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("lights.dim", pred->action);
}

TEST_F(ActiveLearnerTest, ChoiceCarriesOptionParams) {
    options_[0].params = {{"duration", "8h"}};
    auto pred = learner_->ApplyChoice("tired", ContextAt(4, 23), options_, "A");
    ASSERT_TRUE(pred.has_value());
    EXPECT_EQ("8h", pred->params.at("duration"));
    EXPECT_EQ("8h", store_->RecentActions(1)[0].params.at("duration"));
}

TEST_F(ActiveLearnerTest, InvalidChoicesReturnNothingAndRecordNothing) {
    ContextSnapshot ctx = ContextAt(4, 23);
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, options_, "D").has_value());   // Something else
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, options_, "Z").has_value());
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, options_, "").has_value());
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, options_, "AB").has_value());
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, options_, "1").has_value());
    EXPECT_FALSE(learner_->ApplyChoice("tired", ctx, {}, "A").has_value());

    EXPECT_TRUE(store_->RecentActions(10).empty());
}

// ============================================================================
// TeachAction
// ============================================================================

TEST_F(ActiveLearnerTest, TeachActionRecordsUnderSituation) {
    ContextSnapshot ctx = ContextAt(4, 15, "something_else", 80);
    EXPECT_TRUE(learner_->TeachAction("bored", ctx, "youtube.open", {{"channel", "news"}}));

    auto records = store_->RecentActions(1);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("bored", records[0].situation);
    EXPECT_EQ("youtube.open", records[0].action);
    EXPECT_EQ("news", records[0].params.at("channel"));
}

TEST_F(ActiveLearnerTest, TeachingEmptyActionFails) {
    EXPECT_FALSE(learner_->TeachAction("bored", ContextAt(4, 15), ""));
    EXPECT_TRUE(store_->RecentActions(1).empty());
}

} // namespace
} // namespace aase
