// File: tests/cli/aase_cli_test.cpp
//
// Tests for the interactive shell

#include "cli/aase_cli.hpp"
#include "learning/learning_test_fixtures.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace aase {
namespace {

using testing::FixedContextProvider;
using testing::NewMemoryStore;
using testing::ScriptedEmbeddingProvider;

class AaseCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig config = EngineConfig::Default();
        config.logging.level = "off";
        config.reinforcement.epsilon = 0.0;
        config.reinforcement.seed = 1;

        store_ = NewMemoryStore();
        engine_ = std::make_unique<HybridEngine>(config, store_,
                                                 std::make_shared<ScriptedEmbeddingProvider>(),
                                                 std::make_shared<FixedContextProvider>());
        cli_ = std::make_unique<AaseCli>(*engine_, out_);
        cli_->SetColorsEnabled(false);
    }

    /// Run one line and return what it printed
    std::string Run(const std::string& line) {
        out_.str("");
        out_.clear();
        cli_->ProcessCommand(line);
        return out_.str();
    }

    static bool Contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    std::shared_ptr<SqliteEventStore> store_;
    std::unique_ptr<HybridEngine> engine_;
    std::ostringstream out_;
    std::unique_ptr<AaseCli> cli_;
};

// ============================================================================
// Session State
// ============================================================================

TEST_F(AaseCliTest, DefaultState) {
    EXPECT_TRUE(cli_->IsRunning());
    EXPECT_EQ("general", cli_->GetSituation());
    EXPECT_TRUE(cli_->GetCandidates().empty());
    EXPECT_FALSE(cli_->HasPendingQuestion());
    EXPECT_EQ(0u, cli_->GetDecisionCount());
}

TEST_F(AaseCliTest, SituationCommand) {
    EXPECT_EQ("Situation: tired\n", Run("/situation tired"));
    EXPECT_EQ("tired", cli_->GetSituation());
    EXPECT_EQ("Current situation: tired\n", Run("/situation"));
}

TEST_F(AaseCliTest, ActionsCommandSplitsOnCommas) {
    EXPECT_EQ("Candidate actions: 3\n", Run("/actions dnd.on, music.play ,,lights.dim"));
    EXPECT_EQ((std::vector<std::string>{"dnd.on", "music.play", "lights.dim"}),
              cli_->GetCandidates());
}

TEST_F(AaseCliTest, BlankLinesAreIgnored) {
    EXPECT_EQ("", Run("   "));
    EXPECT_EQ(0u, cli_->GetDecisionCount());
}

TEST_F(AaseCliTest, UnknownCommand) {
    std::string out = Run("/dance");
    EXPECT_TRUE(Contains(out, "Unknown command: /dance"));
}

TEST_F(AaseCliTest, QuitStopsTheShell) {
    Run("/quit");
    EXPECT_FALSE(cli_->IsRunning());
}

TEST_F(AaseCliTest, RunReadsUntilQuit) {
    std::istringstream in("/situation bored\n/quit\n/situation never\n");
    cli_->Run(in);
    EXPECT_FALSE(cli_->IsRunning());
    EXPECT_EQ("bored", cli_->GetSituation());
    EXPECT_TRUE(Contains(out_.str(), "Goodbye."));
}

TEST_F(AaseCliTest, HelpListsCommands) {
    std::string out = Run("/help");
    EXPECT_TRUE(Contains(out, "/choose <letter>"));
    EXPECT_TRUE(Contains(out, "/outcome <result> [ms]"));
}

// ============================================================================
// Decisions
// ============================================================================

TEST_F(AaseCliTest, NothingKnownYet) {
    std::string out = Run("/decide");
    EXPECT_TRUE(Contains(out, "I don't know what to do for 'general' yet."));
    EXPECT_EQ(1u, cli_->GetDecisionCount());
    EXPECT_FALSE(cli_->GetLastPrediction().has_value());
}

TEST_F(AaseCliTest, UncertainDecisionAsksAndLearnsFromChoice) {
    Run("/situation tired");
    Run("/actions dnd.on,music.play");

    std::string out = Run("/decide");
    EXPECT_TRUE(Contains(out, "I'm not sure what to do for 'tired'"));
    EXPECT_TRUE(Contains(out, "A) dnd.on"));
    EXPECT_TRUE(cli_->HasPendingQuestion());

    EXPECT_EQ("✓ Learned: tired → dnd.on\n", Run("/choose a"));
    EXPECT_FALSE(cli_->HasPendingQuestion());

    auto records = store_->RecentActions(5);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("tired", records[0].situation);
    EXPECT_EQ("dnd.on", records[0].action);
}

TEST_F(AaseCliTest, DeclinedChoiceKeepsQuestionOpen) {
    Run("/situation tired");
    Run("/actions dnd.on,music.play");
    Run("/decide");

    std::string out = Run("/choose z");
    EXPECT_TRUE(Contains(out, "Use /teach <action>"));
    EXPECT_TRUE(cli_->HasPendingQuestion());
}

TEST_F(AaseCliTest, ChooseWithoutQuestion) {
    EXPECT_EQ("There is no open question.\n", Run("/choose A"));
}

TEST_F(AaseCliTest, TaughtActionIsPredicted) {
    Run("/situation tired");
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ("✓ Learned: tired → dnd.on\n", Run("/teach dnd.on"));
    }

    std::string out = Run("i'm exhausted");
    EXPECT_TRUE(Contains(out, "→ dnd.on"));
    EXPECT_TRUE(Contains(out, "knn"));
    ASSERT_TRUE(cli_->GetLastPrediction().has_value());
    EXPECT_EQ("dnd.on", cli_->GetLastPrediction()->action);
}

TEST_F(AaseCliTest, TeachNeedsAnAction) {
    EXPECT_EQ("Usage: /teach <action>\n", Run("/teach"));
}

// ============================================================================
// Outcomes
// ============================================================================

TEST_F(AaseCliTest, OutcomeBeforeDecision) {
    EXPECT_EQ("Nothing to report on; make a decision first.\n", Run("/outcome success"));
}

TEST_F(AaseCliTest, OutcomeIsRecorded) {
    Run("/situation tired");
    for (int i = 0; i < 3; ++i) {
        Run("/teach dnd.on");
    }
    Run("i'm exhausted");

    EXPECT_EQ("Recorded success for dnd.on\n", Run("/outcome success 250"));
    EXPECT_FALSE(cli_->GetLastPrediction().has_value());

    auto last = store_->RecentActions(1);
    ASSERT_EQ(1u, last.size());
    EXPECT_EQ(250, last[0].duration_ms);
    EXPECT_EQ(1u, store_->LoadExemplars().size());
}

TEST_F(AaseCliTest, OutcomeValidatesArguments) {
    Run("/situation tired");
    for (int i = 0; i < 3; ++i) {
        Run("/teach dnd.on");
    }
    Run("/decide");

    EXPECT_TRUE(Contains(Run("/outcome great"), "Usage: /outcome"));
    EXPECT_EQ("Duration must be a number of milliseconds\n", Run("/outcome failure soon"));
    EXPECT_TRUE(cli_->GetLastPrediction().has_value());
}

// ============================================================================
// Inspection
// ============================================================================

TEST_F(AaseCliTest, RecentHistory) {
    EXPECT_EQ("No history yet.\n", Run("/recent"));

    Run("/situation bored");
    Run("/teach youtube.open");
    std::string out = Run("/recent 5");
    EXPECT_TRUE(Contains(out, "bored"));
    EXPECT_TRUE(Contains(out, "youtube.open"));
    EXPECT_TRUE(Contains(out, "success"));

    EXPECT_EQ("Usage: /recent [n]\n", Run("/recent lots"));
}

TEST_F(AaseCliTest, WorkflowWithoutRoutine) {
    EXPECT_EQ("No routine recognised yet.\n", Run("/workflow"));
}

TEST_F(AaseCliTest, StatisticsShowEverySection) {
    std::string out = Run("/stats");
    EXPECT_TRUE(Contains(out, "History:"));
    EXPECT_TRUE(Contains(out, "Reinforcement:"));
    EXPECT_TRUE(Contains(out, "Few-shot:"));
    EXPECT_TRUE(Contains(out, "Decisions:"));
}

TEST_F(AaseCliTest, PruneCommand) {
    EXPECT_EQ("Removed 0 old records\n", Run("/prune"));
    EXPECT_EQ("Removed 0 old records\n", Run("/prune 30"));
    EXPECT_EQ("Retention must be at least one day\n", Run("/prune 0"));
    EXPECT_EQ("Usage: /prune [days]\n", Run("/prune soon"));
}

TEST_F(AaseCliTest, VerboseToggle) {
    EXPECT_EQ("Verbose mode: ON\n", Run("/verbose"));
    EXPECT_EQ("Verbose mode: OFF\n", Run("/verbose"));
}

} // namespace
} // namespace aase
