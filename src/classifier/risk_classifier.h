#pragma once

/// @file risk_classifier.h
/// @brief Prompt injection risk classification
///
/// Combines two signals into one verdict:
/// - a heuristic score computed from surface features of the text
/// - the weight of the most severe pattern rule that matched
///
/// final = heuristic * 0.4 + rule * 0.6, then tiered against the caller's
/// threshold and the fixed 0.4 medium cutoff.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>

#include "classifier/pattern_rule_set.h"
#include "classifier/types.h"

namespace promptguard {
class ThreadPool;
}  // namespace promptguard

namespace promptguard::classifier {

/// @brief Stateless prompt injection classifier
///
/// The rule set is compiled once at construction and never modified, so a
/// single instance may be shared by any number of threads.
///
/// Example:
/// @code
///   auto classifier = RiskClassifier::Create();
///   if (!classifier.ok()) return classifier.status();
///
///   Verdict verdict = (*classifier)->Classify(user_input);
///   if (verdict.risk == RiskLevel::kHigh) {
///       PROMPTGUARD_LOG_WARN("Blocked input, score {}", verdict.score);
///   }
/// @endcode
class RiskClassifier {
public:
    explicit RiskClassifier(PatternRuleSet rules);

    RiskClassifier(const RiskClassifier&) = delete;
    RiskClassifier& operator=(const RiskClassifier&) = delete;

    /// @brief Build a classifier over the built-in rule catalog
    static absl::StatusOr<std::unique_ptr<RiskClassifier>> Create();

    /// @brief Build a classifier over caller-supplied rules
    static absl::StatusOr<std::unique_ptr<RiskClassifier>> Create(
        const std::vector<RuleDefinition>& definitions);

    /// @brief Classify one text
    /// @param text UTF-8 text, any length
    /// @param threshold Score above which the verdict is high risk. Range
    ///        checking is the caller's job.
    ///
    /// Blank text short-circuits to a zero-score "Empty input" verdict with
    /// no features.
    Verdict Classify(std::string_view text, double threshold = kDefaultThreshold) const;

    /// @brief Classify many texts, results in input order
    /// @param pool Fan out over this pool when given, else run inline
    std::vector<Verdict> ClassifyBatch(const std::vector<std::string>& texts,
                                       double threshold = kDefaultThreshold,
                                       ThreadPool* pool = nullptr) const;

    const PatternRuleSet& Rules() const { return rules_; }

private:
    PatternRuleSet rules_;
};

/// @brief Round to three decimals, as reported in verdicts
double RoundScore(double value);

}  // namespace promptguard::classifier
