// File: src/cli/aase_cli.hpp
//
// Interactive shell around a HybridEngine
// Extracted from main for testability

#ifndef AASE_CLI_HPP
#define AASE_CLI_HPP

#include "engine/hybrid_engine.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace aase {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";
    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";
    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Line-oriented driver for the decision engine
///
/// Plain text is treated as something the user said in the current
/// situation and runs a decision. Commands start with '/':
///   /situation <name>        set the current situation
///   /actions <a,b,c>         set the candidate actions
///   /decide                  decide without text
///   /choose <letter>         answer a pending question
///   /outcome <result> [ms]   report how the last action went
///   /teach <action>          tell the engine the right action
///   /workflow                suggest the next action of a routine
///   /recent [n]  /stats  /prune [days]  /verbose  /help  /quit
class AaseCli {
public:
    /// @param engine Engine to drive; must outlive the CLI
    /// @param out Destination of all output
    AaseCli(HybridEngine& engine, std::ostream& out = std::cout);

    /// Read commands from `in` until EOF or /quit
    void Run(std::istream& in = std::cin);

    /// Process a single line
    void ProcessCommand(const std::string& input);

    void SetColorsEnabled(bool enabled) { colors_enabled_ = enabled; }

    // Inspection (tests)
    bool IsRunning() const { return running_; }
    const std::string& GetSituation() const { return situation_; }
    const std::vector<std::string>& GetCandidates() const { return candidates_; }
    const std::optional<Prediction>& GetLastPrediction() const { return last_prediction_; }
    bool HasPendingQuestion() const { return !pending_options_.empty(); }
    size_t GetDecisionCount() const { return decisions_; }

private:
    HybridEngine& engine_;
    std::ostream& out_;

    bool running_ = true;
    bool verbose_ = false;
    bool colors_enabled_ = true;
    std::string prompt_ = "aase> ";

    // Decision state
    std::string situation_ = "general";
    std::vector<std::string> candidates_;
    std::vector<std::string> recent_actions_;
    size_t decisions_ = 0;

    std::string last_text_;
    ContextSnapshot last_context_;
    std::optional<Prediction> last_prediction_;
    std::vector<Prediction> pending_options_;

    void HandleCommand(const std::string& cmd);
    void Decide(const std::string& text);

    // Commands
    void ShowHelp();
    void ShowStatistics();
    void ShowRecent(size_t limit);
    void SetSituation(const std::string& name);
    void SetCandidates(const std::string& list);
    void Choose(const std::string& letter);
    void ReportOutcome(const std::string& result, const std::string& duration);
    void Teach(const std::string& action);
    void SuggestWorkflow();
    void Prune(const std::string& days);

    void PrintPrediction(const Prediction& pred);

    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace aase

#endif // AASE_CLI_HPP
