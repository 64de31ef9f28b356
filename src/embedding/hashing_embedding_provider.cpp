// File: src/embedding/hashing_embedding_provider.cpp
#include "embedding/hashing_embedding_provider.hpp"
#include "core/hash.hpp"
#include <cctype>
#include <cmath>

namespace aase {

HashingEmbeddingProvider::HashingEmbeddingProvider()
    : config_() {
}

HashingEmbeddingProvider::HashingEmbeddingProvider(const Config& config)
    : config_(config) {
    if (config_.dimension == 0) {
        config_.dimension = 1;
    }
}

std::optional<std::vector<float>> HashingEmbeddingProvider::Embed(
        const std::string& text, Deadline deadline) {
    if (deadline.Expired()) {
        return std::nullopt;
    }

    std::vector<float> vec(config_.dimension, 0.0f);
    std::vector<std::string> tokens = Tokenize(text);

    for (size_t i = 0; i < tokens.size(); ++i) {
        AddFeature(vec, tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            AddFeature(vec, tokens[i] + " " + tokens[i + 1], config_.bigram_weight);
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (float& v : vec) {
            v = static_cast<float>(v / norm);
        }
    }
    return vec;
}

std::vector<std::string> HashingEmbeddingProvider::Tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

void HashingEmbeddingProvider::AddFeature(std::vector<float>& vec,
                                          const std::string& feature,
                                          float weight) const {
    uint64_t h = Fnv1a64(feature);
    size_t bucket = static_cast<size_t>(h % vec.size());
    // High bit picks the sign so collisions tend to cancel rather than pile up
    float sign = (h >> 63) ? -1.0f : 1.0f;
    vec[bucket] += sign * weight;
}

} // namespace aase
