/// @file risk_classifier.cpp
/// @brief Score combination and tiering

#include "classifier/risk_classifier.h"

#include <cmath>
#include <future>

#include "classifier/feature_extractor.h"
#include "classifier/heuristic_scorer.h"
#include "classifier/text_utils.h"
#include "common/error.h"
#include "common/thread_pool.h"

namespace promptguard::classifier {

namespace {

constexpr char kEmptyInput[] = "Empty input";
constexpr char kBlockRecommendation[] =
    "Block this input - high probability of prompt injection";
constexpr char kFlagRecommendation[] =
    "Flag for review - potential prompt injection attempt";
constexpr char kSafeRecommendation[] = "Input appears safe";

}  // namespace

double RoundScore(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

RiskClassifier::RiskClassifier(PatternRuleSet rules)
    : rules_(std::move(rules)) {}

absl::StatusOr<std::unique_ptr<RiskClassifier>> RiskClassifier::Create() {
    return Create(DefaultRuleDefinitions());
}

absl::StatusOr<std::unique_ptr<RiskClassifier>> RiskClassifier::Create(
    const std::vector<RuleDefinition>& definitions) {
    PROMPTGUARD_ASSIGN_OR_RETURN(auto rules, PatternRuleSet::Create(definitions));
    return std::make_unique<RiskClassifier>(std::move(rules));
}

Verdict RiskClassifier::Classify(std::string_view text, double threshold) const {
    Verdict verdict;

    if (IsBlank(text)) {
        verdict.recommendation = kEmptyInput;
        return verdict;
    }

    FeatureVector features = FeatureExtractor::Extract(text);
    const double ml_score = HeuristicScorer::Score(features);
    MatchResult rule_result = rules_.MatchAll(text);
    const double rule_score = rule_result.max_weight;

    const double final_score = ml_score * kHeuristicWeight + rule_score * kRuleWeight;

    if (final_score > threshold) {
        verdict.risk = RiskLevel::kHigh;
        verdict.recommendation = kBlockRecommendation;
    } else if (final_score > kMediumRiskCutoff) {
        verdict.risk = RiskLevel::kMedium;
        verdict.recommendation = kFlagRecommendation;
    } else {
        verdict.risk = RiskLevel::kLow;
        verdict.recommendation = kSafeRecommendation;
    }

    verdict.score = RoundScore(final_score);
    verdict.ml_score = RoundScore(ml_score);
    verdict.rule_score = RoundScore(rule_score);
    verdict.detected_patterns = std::move(rule_result.matches);
    verdict.features = std::move(features);
    return verdict;
}

std::vector<Verdict> RiskClassifier::ClassifyBatch(const std::vector<std::string>& texts,
                                                   double threshold,
                                                   ThreadPool* pool) const {
    std::vector<Verdict> verdicts;
    verdicts.reserve(texts.size());

    if (pool == nullptr || pool->IsStopped() || texts.size() < 2) {
        for (const auto& text : texts) {
            verdicts.push_back(Classify(text, threshold));
        }
        return verdicts;
    }

    std::vector<std::future<Verdict>> futures;
    futures.reserve(texts.size());
    for (const auto& text : texts) {
        futures.push_back(pool->Submit([this, &text, threshold]() {
            return Classify(text, threshold);
        }));
    }
    for (auto& future : futures) {
        verdicts.push_back(future.get());
    }
    return verdicts;
}

}  // namespace promptguard::classifier
