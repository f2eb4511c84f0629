/// @file heuristic_scorer.cpp
/// @brief Heuristic score table

#include "classifier/heuristic_scorer.h"

#include <algorithm>

namespace promptguard::classifier {

namespace {

constexpr int64_t kLongInput = 500;
constexpr int64_t kVeryLongInput = 1000;
constexpr double kUppercaseCutoff = 0.3;
constexpr double kSpecialCharCutoff = 0.15;
constexpr int64_t kKeywordBurst = 3;

}  // namespace

double HeuristicScorer::Score(const FeatureVector& features) {
    // Summed in table order
    double score = 0.0;

    if (features.length > kLongInput) {
        score += 0.2;
    }
    if (features.length > kVeryLongInput) {
        score += 0.3;
    }

    if (features.uppercase_ratio > kUppercaseCutoff) {
        score += 0.25;
    }
    if (features.special_char_ratio > kSpecialCharCutoff) {
        score += 0.3;
    }

    if (features.has_multiple_delimiters) {
        score += 0.4;
    }
    if (features.has_system_tags) {
        score += 0.5;
    }
    if (features.command_like_structure) {
        score += 0.3;
    }

    const int64_t keywords = features.suspicious_keyword_count;
    if (keywords > 0) {
        score += static_cast<double>(keywords) * 0.2;
    }
    if (keywords > kKeywordBurst) {
        score += 0.4;
    }

    return std::min(score, 1.0);
}

}  // namespace promptguard::classifier
