// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the decision engine

#include "config/engine_config.hpp"
#include "core/logging.hpp"
#include <yaml.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace aase {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* BoolString(bool value) {
    return value ? "true" : "false";
}

static std::optional<uint32_t> ParseSeed(const std::string& value) {
    if (value.empty() || value == "none" || value == "null" || value == "~") {
        return std::nullopt;
    }
    return static_cast<uint32_t>(std::stoul(value));
}

// Apply one `section.key: value` pair
// Throws std::invalid_argument / std::out_of_range on malformed numbers.
static void ApplyValue(EngineConfig& config,
                       const std::string& section,
                       const std::string& key,
                       const std::string& value) {
    if (section == "storage") {
        auto& s = config.storage;
        if (key == "db_path") s.sqlite.db_path = value;
        else if (key == "enable_wal") s.sqlite.enable_wal = ParseBool(value);
        else if (key == "busy_timeout_ms") s.sqlite.busy_timeout_ms = std::stoi(value);
        else if (key == "synchronous") s.sqlite.synchronous = value;
        else if (key == "retention_days") s.retention_days = std::stoi(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
    }
    else if (section == "reinforcement") {
        auto& r = config.reinforcement;
        if (key == "learning_rate") r.learning_rate = std::stod(value);
        else if (key == "discount") r.discount = std::stod(value);
        else if (key == "epsilon") r.epsilon = std::stod(value);
        else if (key == "seed") r.seed = ParseSeed(value);
        else if (key == "success_reward") r.success_reward = std::stod(value);
        else if (key == "failure_reward") r.failure_reward = std::stod(value);
        else if (key == "canceled_reward") r.canceled_reward = std::stod(value);
    }
    else if (section == "few_shot") {
        auto& f = config.few_shot;
        if (key == "enabled") f.enabled = ParseBool(value);
        else if (key == "embedding_dimension") f.embedding_dimension = std::stoul(value);
        else if (key == "similarity_threshold") f.matcher.similarity_threshold = std::stof(value);
        else if (key == "embed_timeout_ms") f.matcher.embed_timeout = std::chrono::milliseconds(std::stol(value));
        else if (key == "boost_divisor") f.matcher.boost_divisor = std::stof(value);
        else if (key == "max_boost") f.matcher.max_boost = std::stof(value);
        else if (key == "breaker_threshold") f.matcher.breaker.open_threshold = std::stoi(value);
        else if (key == "breaker_cooldown_ms") f.matcher.breaker.cooldown = std::chrono::milliseconds(std::stol(value));
    }
    else if (section == "meta") {
        auto& m = config.meta;
        if (key == "min_similarity") m.min_similarity = std::stof(value);
        else if (key == "min_source_successes") m.min_source_successes = std::stoul(value);
        else if (key == "min_success_rate") m.min_success_rate = std::stod(value);
        else if (key == "min_frequency") m.min_frequency = std::stoul(value);
        else if (key == "max_transfers") m.max_transfers = std::stoul(value);
        else if (key == "max_confidence") m.max_confidence = std::stof(value);
    }
    else if (section == "historical") {
        auto& h = config.historical;
        if (key == "k") h.k = std::stoul(value);
        else if (key == "min_confidence") h.min_confidence = std::stof(value);
        else if (key == "min_records") h.min_records = std::stoul(value);
        else if (key == "recency_days") h.recency_days = std::stod(value);
        else if (key == "workflow_history") h.workflow_history = std::stoul(value);
        else if (key == "workflow_gap_seconds") h.workflow_gap_seconds = std::stoll(value);
        else if (key == "workflow_min_sequence") h.workflow_min_sequence = std::stoul(value);
        else if (key == "workflow_min_occurrences") h.workflow_min_occurrences = std::stoul(value);
        else if (key == "param_history") h.param_history = std::stoul(value);
        else if (key == "param_min_records") h.param_min_records = std::stoul(value);
        else if (key == "param_min_similarity") h.param_min_similarity = std::stof(value);
    }
    else if (section == "similarity") {
        auto& w = config.historical.weights;
        if (key == "time_of_day") w.time_of_day = std::stof(value);
        else if (key == "hour_proximity") w.hour_proximity = std::stof(value);
        else if (key == "day_of_week") w.day_of_week = std::stof(value);
        else if (key == "weekend") w.weekend = std::stof(value);
        else if (key == "battery") w.battery = std::stof(value);
        else if (key == "situation") w.situation = std::stof(value);
        else if (key == "hour_window") w.hour_window = std::stoi(value);
    }
    else if (section == "active") {
        auto& a = config.active;
        if (key == "uncertainty_threshold") a.uncertainty_threshold = std::stof(value);
        else if (key == "max_options") a.max_options = std::stoul(value);
        else if (key == "taught_confidence") a.taught_confidence = std::stof(value);
    }
    else if (section == "orchestrator") {
        auto& o = config.orchestrator;
        if (key == "reinforcement_gate") o.reinforcement_gate = std::stof(value);
        else if (key == "few_shot_gate") o.few_shot_gate = std::stof(value);
        else if (key == "meta_gate") o.meta_gate = std::stof(value);
        else if (key == "historical_gate") o.historical_gate = std::stof(value);
        else if (key == "decision_timeout_ms") o.decision_timeout = std::chrono::milliseconds(std::stol(value));
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        log::Get()->error("Failed to open config file: {}", filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        log::Get()->error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;
    bool ok = true;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            log::Get()->error("YAML parse error at line {}: {}",
                              parser.problem_mark.line + 1,
                              parser.problem ? parser.problem : "unknown");
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception&) {
                            log::Get()->error("Invalid value '{}' for {}.{}",
                                              value, current_section, current_key);
                            ok = false;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!ok) {
        return std::nullopt;
    }

    if (!config.Validate()) {
        log::Get()->error("Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            log::Get()->error("  - {}", error);
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        log::Get()->error("Failed to open file for writing: {}", filepath);
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# AASE Engine Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "storage:\n";
    ss << "  db_path: \"" << storage.sqlite.db_path << "\"\n";
    ss << "  enable_wal: " << BoolString(storage.sqlite.enable_wal) << "\n";
    ss << "  busy_timeout_ms: " << storage.sqlite.busy_timeout_ms << "\n";
    ss << "  synchronous: \"" << storage.sqlite.synchronous << "\"\n";
    ss << "  retention_days: " << storage.retention_days << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n\n";

    ss << "reinforcement:\n";
    ss << "  learning_rate: " << reinforcement.learning_rate << "\n";
    ss << "  discount: " << reinforcement.discount << "\n";
    ss << "  epsilon: " << reinforcement.epsilon << "\n";
    if (reinforcement.seed) {
        ss << "  seed: " << *reinforcement.seed << "\n";
    } else {
        ss << "  seed: none\n";
    }
    ss << "  success_reward: " << reinforcement.success_reward << "\n";
    ss << "  failure_reward: " << reinforcement.failure_reward << "\n";
    ss << "  canceled_reward: " << reinforcement.canceled_reward << "\n\n";

    ss << "few_shot:\n";
    ss << "  enabled: " << BoolString(few_shot.enabled) << "\n";
    ss << "  embedding_dimension: " << few_shot.embedding_dimension << "\n";
    ss << "  similarity_threshold: " << few_shot.matcher.similarity_threshold << "\n";
    ss << "  embed_timeout_ms: " << few_shot.matcher.embed_timeout.count() << "\n";
    ss << "  boost_divisor: " << few_shot.matcher.boost_divisor << "\n";
    ss << "  max_boost: " << few_shot.matcher.max_boost << "\n";
    ss << "  breaker_threshold: " << few_shot.matcher.breaker.open_threshold << "\n";
    ss << "  breaker_cooldown_ms: " << few_shot.matcher.breaker.cooldown.count() << "\n\n";

    ss << "meta:\n";
    ss << "  min_similarity: " << meta.min_similarity << "\n";
    ss << "  min_source_successes: " << meta.min_source_successes << "\n";
    ss << "  min_success_rate: " << meta.min_success_rate << "\n";
    ss << "  min_frequency: " << meta.min_frequency << "\n";
    ss << "  max_transfers: " << meta.max_transfers << "\n";
    ss << "  max_confidence: " << meta.max_confidence << "\n\n";

    ss << "historical:\n";
    ss << "  k: " << historical.k << "\n";
    ss << "  min_confidence: " << historical.min_confidence << "\n";
    ss << "  min_records: " << historical.min_records << "\n";
    ss << "  recency_days: " << historical.recency_days << "\n";
    ss << "  workflow_history: " << historical.workflow_history << "\n";
    ss << "  workflow_gap_seconds: " << historical.workflow_gap_seconds << "\n";
    ss << "  workflow_min_sequence: " << historical.workflow_min_sequence << "\n";
    ss << "  workflow_min_occurrences: " << historical.workflow_min_occurrences << "\n";
    ss << "  param_history: " << historical.param_history << "\n";
    ss << "  param_min_records: " << historical.param_min_records << "\n";
    ss << "  param_min_similarity: " << historical.param_min_similarity << "\n\n";

    ss << "similarity:\n";
    ss << "  time_of_day: " << historical.weights.time_of_day << "\n";
    ss << "  hour_proximity: " << historical.weights.hour_proximity << "\n";
    ss << "  day_of_week: " << historical.weights.day_of_week << "\n";
    ss << "  weekend: " << historical.weights.weekend << "\n";
    ss << "  battery: " << historical.weights.battery << "\n";
    ss << "  situation: " << historical.weights.situation << "\n";
    ss << "  hour_window: " << historical.weights.hour_window << "\n\n";

    ss << "active:\n";
    ss << "  uncertainty_threshold: " << active.uncertainty_threshold << "\n";
    ss << "  max_options: " << active.max_options << "\n";
    ss << "  taught_confidence: " << active.taught_confidence << "\n\n";

    ss << "orchestrator:\n";
    ss << "  reinforcement_gate: " << orchestrator.reinforcement_gate << "\n";
    ss << "  few_shot_gate: " << orchestrator.few_shot_gate << "\n";
    ss << "  meta_gate: " << orchestrator.meta_gate << "\n";
    ss << "  historical_gate: " << orchestrator.historical_gate << "\n";
    ss << "  decision_timeout_ms: " << orchestrator.decision_timeout.count() << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

static bool InUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Storage
    if (storage.sqlite.db_path.empty()) {
        errors.push_back("db_path must not be empty");
    }
    if (storage.sqlite.synchronous != "FULL" &&
        storage.sqlite.synchronous != "NORMAL" &&
        storage.sqlite.synchronous != "OFF") {
        errors.push_back("synchronous must be one of: FULL, NORMAL, OFF");
    }
    if (storage.sqlite.busy_timeout_ms < 0) {
        errors.push_back("busy_timeout_ms must be non-negative");
    }
    if (storage.retention_days <= 0) {
        errors.push_back("retention_days must be greater than 0");
    }

    // Logging
    static const char* kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                    "error", "critical", "off"};
    bool level_ok = false;
    for (const char* level : kLevels) {
        if (logging.level == level) {
            level_ok = true;
        }
    }
    if (!level_ok) {
        errors.push_back("logging level must be one of: trace, debug, info, warn, error, critical, off");
    }

    // Reinforcement
    if (reinforcement.learning_rate <= 0.0 || reinforcement.learning_rate > 1.0) {
        errors.push_back("learning_rate must be in (0.0, 1.0]");
    }
    if (!InUnitRange(reinforcement.discount)) {
        errors.push_back("discount must be between 0.0 and 1.0");
    }
    if (!InUnitRange(reinforcement.epsilon)) {
        errors.push_back("epsilon must be between 0.0 and 1.0");
    }

    // Few-shot
    if (few_shot.embedding_dimension == 0) {
        errors.push_back("embedding_dimension must be greater than 0");
    }
    if (!InUnitRange(few_shot.matcher.similarity_threshold)) {
        errors.push_back("few_shot similarity_threshold must be between 0.0 and 1.0");
    }
    if (few_shot.matcher.embed_timeout.count() <= 0) {
        errors.push_back("embed_timeout_ms must be greater than 0");
    }
    if (few_shot.matcher.boost_divisor <= 0.0f) {
        errors.push_back("boost_divisor must be greater than 0");
    }
    if (few_shot.matcher.breaker.open_threshold <= 0) {
        errors.push_back("breaker_threshold must be greater than 0");
    }

    // Meta
    if (!InUnitRange(meta.min_similarity)) {
        errors.push_back("meta min_similarity must be between 0.0 and 1.0");
    }
    if (!InUnitRange(meta.min_success_rate)) {
        errors.push_back("meta min_success_rate must be between 0.0 and 1.0");
    }
    if (!InUnitRange(meta.max_confidence)) {
        errors.push_back("meta max_confidence must be between 0.0 and 1.0");
    }
    if (meta.max_transfers == 0) {
        errors.push_back("max_transfers must be greater than 0");
    }

    // Historical
    if (historical.k == 0) {
        errors.push_back("k must be greater than 0");
    }
    if (!InUnitRange(historical.min_confidence)) {
        errors.push_back("historical min_confidence must be between 0.0 and 1.0");
    }
    if (historical.min_records == 0) {
        errors.push_back("min_records must be greater than 0");
    }
    if (historical.workflow_min_occurrences == 0) {
        errors.push_back("workflow_min_occurrences must be greater than 0");
    }
    if (historical.recency_days <= 0.0) {
        errors.push_back("recency_days must be greater than 0");
    }
    if (historical.workflow_gap_seconds <= 0) {
        errors.push_back("workflow_gap_seconds must be greater than 0");
    }

    // Similarity
    const auto& w = historical.weights;
    if (w.time_of_day < 0.0f || w.hour_proximity < 0.0f || w.day_of_week < 0.0f ||
        w.weekend < 0.0f || w.battery < 0.0f || w.situation < 0.0f) {
        errors.push_back("similarity weights must be non-negative");
    }
    if (w.hour_window < 0 || w.hour_window > 12) {
        errors.push_back("hour_window must be between 0 and 12");
    }

    // Active
    if (!InUnitRange(active.uncertainty_threshold)) {
        errors.push_back("uncertainty_threshold must be between 0.0 and 1.0");
    }
    if (active.max_options == 0 || active.max_options > 25) {
        errors.push_back("max_options must be between 1 and 25");
    }
    if (!InUnitRange(active.taught_confidence)) {
        errors.push_back("taught_confidence must be between 0.0 and 1.0");
    }

    // Orchestrator
    if (!InUnitRange(orchestrator.reinforcement_gate) ||
        !InUnitRange(orchestrator.few_shot_gate) ||
        !InUnitRange(orchestrator.meta_gate) ||
        !InUnitRange(orchestrator.historical_gate)) {
        errors.push_back("orchestrator gates must be between 0.0 and 1.0");
    }
    if (orchestrator.decision_timeout.count() < 0) {
        errors.push_back("decision_timeout_ms must be non-negative");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace aase
