#pragma once

/// @file types.h
/// @brief Value types produced by a classification call

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace promptguard::classifier {

/// @brief Decision threshold used when the caller does not supply one
inline constexpr double kDefaultThreshold = 0.7;

/// @brief Scores above this (and not above the threshold) are medium risk
inline constexpr double kMediumRiskCutoff = 0.4;

/// @brief Contribution of the heuristic score to the final score
inline constexpr double kHeuristicWeight = 0.4;

/// @brief Contribution of the rule score to the final score
inline constexpr double kRuleWeight = 0.6;

/// @brief Matched substrings kept per rule for display
inline constexpr size_t kMaxMatchesPerRule = 5;

/// @brief Risk tier of a verdict
enum class RiskLevel {
    kLow,
    kMedium,
    kHigh
};

/// @brief Surface features of a text (see FeatureExtractor)
struct FeatureVector {
    int64_t length = 0;              ///< Code points
    int64_t word_count = 0;          ///< White-space separated tokens
    double avg_word_length = 0.0;    ///< Mean token length in code points
    double uppercase_ratio = 0.0;    ///< [0, 1]
    double special_char_ratio = 0.0; ///< [0, 1]
    bool has_multiple_delimiters = false;
    bool has_system_tags = false;
    int64_t suspicious_keyword_count = 0;
    bool command_like_structure = false;

    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }
};

/// @brief One triggered rule
struct RuleMatch {
    std::string rule_name;
    std::vector<std::string> matched_substrings;  ///< First kMaxMatchesPerRule matches
    double weight = 0.0;

    bool operator==(const RuleMatch& other) const;
};

/// @brief Result of RiskClassifier::Classify
///
/// score, ml_score and rule_score are rounded to three decimals; the tier was
/// decided on the unrounded values.
struct Verdict {
    double score = 0.0;
    RiskLevel risk = RiskLevel::kLow;
    double ml_score = 0.0;
    double rule_score = 0.0;
    std::vector<RuleMatch> detected_patterns;  ///< In rule definition order
    std::optional<FeatureVector> features;     ///< Empty for blank input
    std::string recommendation;

    bool operator==(const Verdict& other) const;
};

/// @brief "low", "medium" or "high"
std::string RiskLevelToString(RiskLevel level);

// JSON wire format used by the HTTP service and the CLI

nlohmann::json ToJson(const FeatureVector& features);
nlohmann::json ToJson(const RuleMatch& match);

/// @brief Serialize a verdict; "features" is emitted only when include_features
///        is set (as {} when the verdict has none)
nlohmann::json ToJson(const Verdict& verdict, bool include_features);

}  // namespace promptguard::classifier
