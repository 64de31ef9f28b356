// File: examples/basic_example.cpp
//
// Basic decision-cycle example using the AASE engine.
// Demonstrates:
// - Creating a HybridEngine on an in-memory store
// - Feeding executed actions back as outcomes
// - Getting a confident decision from past behaviour
// - Asking the user when the engine is unsure
// - Viewing statistics

#include "engine/hybrid_engine.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace aase;

/// Context of a given local date and hour
ContextSnapshot At(int day, int hour, int battery) {
    ContextSnapshot ctx = ContextSnapshot::AtTime(Timestamp::FromLocalTime(2026, 3, day, hour, 15));
    ctx.battery_percent = battery;
    ctx.is_charging = false;
    return ctx;
}

void PrintPrediction(const std::optional<Prediction>& pred) {
    if (!pred) {
        std::cout << "  (no prediction)\n";
        return;
    }
    std::cout << "  → " << pred->action
              << " (" << std::fixed << std::setprecision(0) << pred->confidence * 100.0f
              << "%, " << ToString(pred->source) << ")"
              << (pred->ask_user ? " [ask user]" : "") << "\n";
    if (!pred->reason.empty()) {
        std::cout << "    " << pred->reason << "\n";
    }
}

int main() {
    std::cout << "=== AASE Basic Decision Example ===\n\n";

    // Step 1: Configure and create the engine
    std::cout << "Step 1: Creating HybridEngine...\n";

    EngineConfig config = EngineConfig::Default();
    config.storage.sqlite.db_path = ":memory:";
    config.reinforcement.seed = 7;
    config.reinforcement.epsilon = 0.0;   // Deterministic for the demo
    config.logging.level = "warn";

    HybridEngine engine(config);
    std::cout << "  ✓ Engine initialized\n\n";

    // Step 2: A week of late evenings where the user silenced the phone
    std::cout << "Step 2: Learning from a week of evenings...\n";
    const std::vector<std::string> candidates = {"dnd.on", "music.play", "lights.dim"};

    for (int day = 2; day <= 8; ++day) {
        ContextSnapshot ctx = At(day, 23, 40);
        ctx.situation = "tired";
        engine.LearnFromOutcome("i'm exhausted", "tired", ctx, "dnd.on",
                                {{"duration", "8h"}}, ActionOutcome::SUCCESS,
                                std::chrono::milliseconds(120));
    }
    ContextSnapshot rainy = At(8, 22, 35);
    engine.LearnFromOutcome("so sleepy", "tired", rainy, "music.play",
                            {{"playlist", "calm"}}, ActionOutcome::FAILURE,
                            std::chrono::milliseconds(300));
    std::cout << "  ✓ Recorded 8 outcomes\n\n";

    // Step 3: Decide for a familiar situation
    std::cout << "Step 3: Deciding for 'tired' at 23:15...\n";
    ContextSnapshot tonight = At(9, 23, 38);
    auto pred = engine.SelectAction("tired", tonight, candidates, "i'm exhausted");
    PrintPrediction(pred);
    std::cout << "\n";

    // Step 4: A related situation that has never been seen
    std::cout << "Step 4: Deciding for unseen 'very_tired' (labels overlap too little to borrow)...\n";
    auto transfer = engine.SelectAction("very_tired", tonight, {}, "");
    PrintPrediction(transfer);
    std::cout << "\n";

    // Step 5: Something the engine is unsure about
    std::cout << "Step 5: Deciding for 'bored' with little history...\n";
    ContextSnapshot afternoon = At(9, 15, 80);
    engine.TeachAction("bored", afternoon, "youtube.open");
    auto unsure = engine.SelectAction("bored", afternoon, {"youtube.open", "music.play"}, "");
    PrintPrediction(unsure);
    if (unsure && unsure->ask_user) {
        std::cout << engine.FormatDisambiguationPrompt("bored", unsure->options) << "\n";
        auto chosen = engine.ApplyUserChoice("bored", afternoon, unsure->options, "A");
        std::cout << "  User answered A:\n";
        PrintPrediction(chosen);
    }
    std::cout << "\n";

    // Step 6: Statistics
    std::cout << "Step 6: Statistics\n";
    std::cout << engine.GetStats().ToString() << "\n";

    std::cout << "=== Example Complete ===\n";
    return 0;
}
