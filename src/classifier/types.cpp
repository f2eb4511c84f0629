#include "classifier/types.h"

namespace promptguard::classifier {

bool FeatureVector::operator==(const FeatureVector& other) const {
    return length == other.length &&
           word_count == other.word_count &&
           avg_word_length == other.avg_word_length &&
           uppercase_ratio == other.uppercase_ratio &&
           special_char_ratio == other.special_char_ratio &&
           has_multiple_delimiters == other.has_multiple_delimiters &&
           has_system_tags == other.has_system_tags &&
           suspicious_keyword_count == other.suspicious_keyword_count &&
           command_like_structure == other.command_like_structure;
}

bool RuleMatch::operator==(const RuleMatch& other) const {
    return rule_name == other.rule_name &&
           matched_substrings == other.matched_substrings &&
           weight == other.weight;
}

bool Verdict::operator==(const Verdict& other) const {
    return score == other.score &&
           risk == other.risk &&
           ml_score == other.ml_score &&
           rule_score == other.rule_score &&
           detected_patterns == other.detected_patterns &&
           features == other.features &&
           recommendation == other.recommendation;
}

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow: return "low";
        case RiskLevel::kMedium: return "medium";
        case RiskLevel::kHigh: return "high";
    }
    return "low";
}

nlohmann::json ToJson(const FeatureVector& features) {
    return nlohmann::json{
        {"length", features.length},
        {"word_count", features.word_count},
        {"avg_word_length", features.avg_word_length},
        {"uppercase_ratio", features.uppercase_ratio},
        {"special_char_ratio", features.special_char_ratio},
        {"has_multiple_delimiters", features.has_multiple_delimiters},
        {"has_system_tags", features.has_system_tags},
        {"suspicious_keyword_count", features.suspicious_keyword_count},
        {"command_like_structure", features.command_like_structure}
    };
}

nlohmann::json ToJson(const RuleMatch& match) {
    return nlohmann::json{
        {"rule", match.rule_name},
        {"matches", match.matched_substrings},
        {"weight", match.weight}
    };
}

nlohmann::json ToJson(const Verdict& verdict, bool include_features) {
    nlohmann::json patterns = nlohmann::json::array();
    for (const auto& match : verdict.detected_patterns) {
        patterns.push_back(ToJson(match));
    }

    nlohmann::json result = {
        {"score", verdict.score},
        {"risk", RiskLevelToString(verdict.risk)},
        {"ml_score", verdict.ml_score},
        {"rule_score", verdict.rule_score},
        {"detected_patterns", std::move(patterns)},
        {"recommendation", verdict.recommendation}
    };

    if (include_features) {
        result["features"] = verdict.features.has_value()
            ? ToJson(*verdict.features)
            : nlohmann::json::object();
    }

    return result;
}

}  // namespace promptguard::classifier
