// File: src/similarity/vector_similarity.hpp
#pragma once

#include <set>
#include <string>
#include <vector>

namespace aase {

/// Cosine similarity of two dense vectors
/// Returns 0.0 for mismatched dimensions or a zero-norm operand.
float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/// Lower-cased tokens of a situation label split on '_' (empty tokens dropped)
std::set<std::string> SituationTokens(const std::string& situation);

/// Jaccard similarity |A ∩ B| / |A ∪ B| of two token sets
/// Two empty sets score 0.0: an empty label says nothing about likeness.
float JaccardSimilarity(const std::set<std::string>& a, const std::set<std::string>& b);

/// Jaccard similarity of the token sets of two situation labels
float SituationSimilarity(const std::string& a, const std::string& b);

} // namespace aase
