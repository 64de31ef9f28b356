// File: src/embedding/hashing_embedding_provider.hpp
#pragma once

#include "embedding/embedding_provider.hpp"
#include <string>
#include <vector>

namespace aase {

/// Deterministic lexical embedding by feature hashing
///
/// Lower-cased word unigrams and adjacent-word bigrams are hashed
/// (FNV-1a) into a fixed number of signed buckets, then L2-normalised.
/// Texts sharing vocabulary land close together; it has no notion of
/// synonyms. Used when no model-backed provider is configured, and in tests.
class HashingEmbeddingProvider : public EmbeddingProvider {
public:
    struct Config {
        Config() = default;

        /// Output dimension
        size_t dimension{256};

        /// Weight of bigram features relative to unigrams
        float bigram_weight{0.5f};
    };

    HashingEmbeddingProvider();
    explicit HashingEmbeddingProvider(const Config& config);

    std::optional<std::vector<float>> Embed(
        const std::string& text,
        Deadline deadline = Deadline::Never()) override;

    bool IsAvailable() const override { return true; }
    size_t Dimension() const override { return config_.dimension; }
    std::string Name() const override { return "hashing"; }

    /// Lower-cased alphanumeric word tokens of `text`
    static std::vector<std::string> Tokenize(const std::string& text);

private:
    Config config_;

    void AddFeature(std::vector<float>& vec, const std::string& feature, float weight) const;
};

} // namespace aase
