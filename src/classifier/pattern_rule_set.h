#pragma once

/// @file pattern_rule_set.h
/// @brief Weighted regular-expression rules for prompt injection phrasing
///
/// Rules are compiled with RE2, whose automaton-based matcher runs in time
/// linear in the input, so adversarial text cannot trigger catastrophic
/// backtracking. A PatternRuleSet is immutable after Create() and MatchAll()
/// is const, so one instance can be shared by any number of threads.

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <re2/re2.h>

#include "classifier/types.h"

namespace promptguard::classifier {

/// @brief Source form of a rule
struct RuleDefinition {
    std::string name;
    std::string pattern;          ///< RE2 syntax
    double weight = 0.0;          ///< Severity in [0, 1]
    bool case_sensitive = false;
};

/// @brief A compiled rule
struct Rule {
    std::string name;
    std::unique_ptr<re2::RE2> matcher;
    double weight = 0.0;
};

/// @brief Output of PatternRuleSet::MatchAll
struct MatchResult {
    std::vector<RuleMatch> matches;  ///< In rule definition order
    double max_weight = 0.0;         ///< 0 when nothing matched
};

/// @brief Ordered, immutable collection of weighted rules
///
/// Example:
/// @code
///   auto rules = PatternRuleSet::CreateDefault();
///   if (!rules.ok()) return rules.status();
///   MatchResult result = rules->MatchAll(user_input);
///   double rule_score = result.max_weight;
/// @endcode
class PatternRuleSet {
public:
    PatternRuleSet(PatternRuleSet&&) = default;
    PatternRuleSet& operator=(PatternRuleSet&&) = default;
    PatternRuleSet(const PatternRuleSet&) = delete;
    PatternRuleSet& operator=(const PatternRuleSet&) = delete;

    /// @brief Compile rule definitions, preserving their order
    /// @return InvalidArgument if a pattern does not compile, a weight is
    ///         outside [0, 1] or a name is empty
    static absl::StatusOr<PatternRuleSet> Create(
        const std::vector<RuleDefinition>& definitions);

    /// @brief Compile the built-in catalog (DefaultRuleDefinitions())
    static absl::StatusOr<PatternRuleSet> CreateDefault();

    /// @brief Run every rule over text
    ///
    /// Each rule scans left to right for non-overlapping matches; a rule that
    /// matches at least once contributes a RuleMatch holding its first
    /// kMaxMatchesPerRule matched substrings. Never fails.
    MatchResult MatchAll(std::string_view text) const;

    const std::vector<Rule>& Rules() const { return rules_; }
    size_t Size() const { return rules_.size(); }

private:
    explicit PatternRuleSet(std::vector<Rule> rules) : rules_(std::move(rules)) {}

    std::vector<Rule> rules_;
};

/// @brief The built-in rule catalog, in evaluation order
///
/// | Rule                   | Weight |
/// |------------------------|--------|
/// | Role Manipulation      | 0.90   |
/// | System Override        | 0.95   |
/// | Instruction Injection  | 0.85   |
/// | Delimiter Manipulation | 0.40   |
/// | Context Switching      | 0.70   |
/// | Jailbreak Keywords     | 0.90   |
/// | Encoded Instructions   | 0.75   |
/// | Privilege Escalation   | 0.80   |
/// | Output Manipulation    | 0.50   |
/// | Prompt Leaking         | 0.85   |
const std::vector<RuleDefinition>& DefaultRuleDefinitions();

}  // namespace promptguard::classifier
