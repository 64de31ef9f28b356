// File: src/cli/aase_cli.cpp
//
// Interactive shell around a HybridEngine
//
// Features:
// - Decisions from free text in a chosen situation
// - Disambiguation questions answered by letter
// - Outcome feedback and direct teaching
// - History, workflow and statistics inspection

#include "cli/aase_cli.hpp"
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace aase {

namespace {

constexpr size_t kMaxRecentActions = 10;

std::string Trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // namespace

AaseCli::AaseCli(HybridEngine& engine, std::ostream& out)
    : engine_(engine), out_(out) {
}

void AaseCli::Run(std::istream& in) {
    out_ << C(Color::BOLD) << "AASE interactive shell" << C(Color::RESET) << "\n"
         << "Type '/help' for commands, or describe what you need.\n\n";

    std::string line;
    while (running_) {
        out_ << prompt_ << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        ProcessCommand(line);
    }

    out_ << "\nDecisions made: " << decisions_ << "\nGoodbye.\n";
}

void AaseCli::ProcessCommand(const std::string& raw) {
    std::string input = Trim(raw);
    if (input.empty()) return;

    if (input[0] == '/') {
        HandleCommand(input.substr(1));
    } else {
        Decide(input);
    }
}

void AaseCli::HandleCommand(const std::string& cmd) {
    std::istringstream iss(cmd);
    std::string command;
    iss >> command;

    std::string rest;
    std::getline(iss, rest);
    rest = Trim(rest);

    if (command == "help") {
        ShowHelp();
    } else if (command == "quit" || command == "exit") {
        running_ = false;
    } else if (command == "situation") {
        SetSituation(rest);
    } else if (command == "actions") {
        SetCandidates(rest);
    } else if (command == "decide") {
        Decide("");
    } else if (command == "choose") {
        Choose(rest);
    } else if (command == "outcome") {
        std::istringstream args(rest);
        std::string result, duration;
        args >> result >> duration;
        ReportOutcome(result, duration);
    } else if (command == "teach") {
        Teach(rest);
    } else if (command == "workflow") {
        SuggestWorkflow();
    } else if (command == "recent") {
        size_t limit = 10;
        if (!rest.empty()) {
            try {
                limit = std::stoul(rest);
            } catch (const std::exception&) {
                out_ << "Usage: /recent [n]\n";
                return;
            }
        }
        ShowRecent(limit);
    } else if (command == "stats") {
        ShowStatistics();
    } else if (command == "prune") {
        Prune(rest);
    } else if (command == "verbose") {
        verbose_ = !verbose_;
        out_ << "Verbose mode: " << (verbose_ ? "ON" : "OFF") << "\n";
    } else {
        out_ << "Unknown command: /" << command << "\n";
        out_ << "Type '/help' for available commands.\n";
    }
}

// ============================================================================
// Decisions
// ============================================================================

void AaseCli::Decide(const std::string& text) {
    ++decisions_;
    last_text_ = text;
    pending_options_.clear();

    last_context_ = engine_.CaptureContext(situation_, std::nullopt, recent_actions_);
    last_prediction_ = engine_.SelectAction(situation_, last_context_, candidates_, text);

    if (!last_prediction_) {
        out_ << C(Color::YELLOW) << "I don't know what to do for '" << situation_
             << "' yet." << C(Color::RESET)
             << " Use /teach <action> to show me.\n";
        return;
    }

    if (last_prediction_->ask_user && !last_prediction_->options.empty()) {
        pending_options_ = last_prediction_->options;
        out_ << engine_.FormatDisambiguationPrompt(situation_, pending_options_) << "\n";
        out_ << C(Color::DIM) << "(answer with /choose <letter>)" << C(Color::RESET) << "\n";
        return;
    }

    PrintPrediction(*last_prediction_);
}

void AaseCli::PrintPrediction(const Prediction& pred) {
    out_ << C(Color::GREEN) << "→ " << pred.action << C(Color::RESET)
         << " (" << std::fixed << std::setprecision(0) << pred.confidence * 100.0f
         << "%, " << ToString(pred.source) << ")\n";
    if (!pred.params.empty()) {
        out_ << "  params: " << ParamsToString(pred.params) << "\n";
    }
    if (verbose_ && !pred.reason.empty()) {
        out_ << C(Color::DIM) << "  " << pred.reason << C(Color::RESET) << "\n";
    }
}

void AaseCli::Choose(const std::string& letter) {
    if (pending_options_.empty()) {
        out_ << "There is no open question.\n";
        return;
    }

    auto chosen = engine_.ApplyUserChoice(situation_, last_context_, pending_options_, letter);
    if (!chosen) {
        out_ << "Okay. Use /teach <action> to tell me what to do instead.\n";
        return;
    }

    pending_options_.clear();
    last_prediction_ = chosen;
    out_ << "✓ Learned: " << situation_ << " → " << chosen->action << "\n";
}

void AaseCli::ReportOutcome(const std::string& result, const std::string& duration) {
    if (!last_prediction_) {
        out_ << "Nothing to report on; make a decision first.\n";
        return;
    }

    ActionOutcome outcome;
    try {
        outcome = ParseActionOutcome(result);
    } catch (const std::invalid_argument&) {
        out_ << "Usage: /outcome <success|failure|canceled> [duration_ms]\n";
        return;
    }

    std::chrono::milliseconds elapsed(0);
    if (!duration.empty()) {
        try {
            elapsed = std::chrono::milliseconds(std::stol(duration));
        } catch (const std::exception&) {
            out_ << "Duration must be a number of milliseconds\n";
            return;
        }
    }

    auto report = engine_.LearnFromOutcome(last_text_, situation_, last_context_,
                                           last_prediction_->action, last_prediction_->params,
                                           outcome, elapsed);

    if (outcome == ActionOutcome::SUCCESS) {
        recent_actions_.push_back(last_prediction_->action);
        if (recent_actions_.size() > kMaxRecentActions) {
            recent_actions_.erase(recent_actions_.begin());
        }
    }

    out_ << "Recorded " << ToString(outcome) << " for " << last_prediction_->action;
    if (!report.recorded) {
        out_ << C(Color::RED) << " (history write failed)" << C(Color::RESET);
    }
    out_ << "\n";
    if (verbose_) {
        out_ << "  value updated: " << (report.value_updated ? "yes" : "no")
             << ", example stored: " << (report.exemplar_stored ? "yes" : "no") << "\n";
    }
    last_prediction_.reset();
}

void AaseCli::Teach(const std::string& action) {
    if (action.empty()) {
        out_ << "Usage: /teach <action>\n";
        return;
    }

    ContextSnapshot ctx = engine_.CaptureContext(situation_, std::nullopt, recent_actions_);
    if (engine_.TeachAction(situation_, ctx, action)) {
        pending_options_.clear();
        out_ << "✓ Learned: " << situation_ << " → " << action << "\n";
    } else {
        out_ << C(Color::RED) << "Could not store that." << C(Color::RESET) << "\n";
    }
}

// ============================================================================
// Inspection
// ============================================================================

void AaseCli::SetSituation(const std::string& name) {
    if (name.empty()) {
        out_ << "Current situation: " << situation_ << "\n";
        return;
    }
    situation_ = name;
    pending_options_.clear();
    out_ << "Situation: " << situation_ << "\n";
}

void AaseCli::SetCandidates(const std::string& list) {
    candidates_.clear();
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            candidates_.push_back(item);
        }
    }
    out_ << "Candidate actions: " << candidates_.size() << "\n";
}

void AaseCli::SuggestWorkflow() {
    auto suggestion = engine_.DetectWorkflow(recent_actions_);
    if (!suggestion) {
        out_ << "No routine recognised yet.\n";
        return;
    }
    out_ << "After " << suggestion->pattern[0] << ", " << suggestion->pattern[1]
         << " you usually do " << C(Color::CYAN) << suggestion->next_action << C(Color::RESET)
         << " (" << suggestion->occurrences << "/" << suggestion->matches << ")\n";
}

void AaseCli::ShowRecent(size_t limit) {
    auto records = engine_.RecentActions(limit);
    if (records.empty()) {
        out_ << "No history yet.\n";
        return;
    }
    for (const auto& rec : records) {
        out_ << "  " << rec.timestamp.ToString() << "  "
             << std::left << std::setw(16) << rec.situation << " "
             << std::setw(20) << rec.action << " "
             << ToString(rec.outcome) << "\n";
    }
    out_ << std::right;
}

void AaseCli::ShowStatistics() {
    out_ << engine_.GetStats().ToString();
}

void AaseCli::Prune(const std::string& days) {
    std::optional<int> retention;
    if (!days.empty()) {
        try {
            retention = std::stoi(days);
        } catch (const std::exception&) {
            out_ << "Usage: /prune [days]\n";
            return;
        }
        if (*retention <= 0) {
            out_ << "Retention must be at least one day\n";
            return;
        }
    }
    size_t removed = engine_.Prune(retention);
    out_ << "Removed " << removed << " old records\n";
}

void AaseCli::ShowHelp() {
    out_ << C(Color::BOLD) << "Commands:" << C(Color::RESET) << "\n"
         << "  <text>                   Decide what to do for what you said\n"
         << "  /situation <name>        Set the current situation\n"
         << "  /actions <a,b,c>         Set the candidate actions\n"
         << "  /decide                  Decide without text\n"
         << "  /choose <letter>         Answer a question\n"
         << "  /outcome <result> [ms]   Report success, failure or canceled\n"
         << "  /teach <action>          Tell me the right action\n"
         << "  /workflow                Suggest the next step of a routine\n"
         << "  /recent [n]              Show recent history\n"
         << "  /stats                   Show learning statistics\n"
         << "  /prune [days]            Delete old history\n"
         << "  /verbose                 Toggle reasons and details\n"
         << "  /quit                    Leave\n";
}

} // namespace aase
