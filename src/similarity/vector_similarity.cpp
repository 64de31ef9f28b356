// File: src/similarity/vector_similarity.cpp
#include "similarity/vector_similarity.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>

namespace aase {

float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || a.size() != b.size()) {
        return 0.0f;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    double norm_product = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (norm_product == 0.0) {
        return 0.0f;
    }
    return static_cast<float>(dot / norm_product);
}

std::set<std::string> SituationTokens(const std::string& situation) {
    std::set<std::string> tokens;
    std::string current;

    for (char c : situation) {
        if (c == '_') {
            if (!current.empty()) {
                tokens.insert(current);
                current.clear();
            }
        } else {
            current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (!current.empty()) {
        tokens.insert(current);
    }
    return tokens;
}

float JaccardSimilarity(const std::set<std::string>& a, const std::set<std::string>& b) {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }

    std::vector<std::string> intersection;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                          std::back_inserter(intersection));

    std::vector<std::string> union_set;
    std::set_union(a.begin(), a.end(), b.begin(), b.end(),
                   std::back_inserter(union_set));

    if (union_set.empty()) {
        return 0.0f;
    }
    return static_cast<float>(intersection.size()) / static_cast<float>(union_set.size());
}

float SituationSimilarity(const std::string& a, const std::string& b) {
    return JaccardSimilarity(SituationTokens(a), SituationTokens(b));
}

} // namespace aase
