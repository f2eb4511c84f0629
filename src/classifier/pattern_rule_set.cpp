/// @file pattern_rule_set.cpp
/// @brief RE2-backed rule compilation and matching

#include "classifier/pattern_rule_set.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "classifier/text_utils.h"
#include "common/error.h"
#include "common/logging.h"

namespace promptguard::classifier {

const std::vector<RuleDefinition>& DefaultRuleDefinitions() {
    static const std::vector<RuleDefinition> kDefinitions = {
        {"Role Manipulation",
         R"((?:ignore|disregard|forget).*(?:previous|above|prior|earlier|system).*(?:instructions?|prompts?|rules?|directives?))",
         0.9},
        {"System Override",
         R"((?:you are now|act as|pretend to be|simulate).*(?:DAN|evil|unfiltered|unrestricted))",
         0.95},
        {"Instruction Injection",
         R"(\[SYSTEM\]|\[INST\]|\[/INST\]|<\|system\|>|<\|assistant\|>|<\|user\|>)",
         0.85},
        {"Delimiter Manipulation",
         R"(#{3,}|={3,}|\*{3,}|_{3,}|-{3,})",
         0.4,
         /*case_sensitive=*/true},
        {"Context Switching",
         R"((?:new task|different task|switch to|change to|instead of).*(?:mode|role|character|persona))",
         0.7},
        {"Jailbreak Keywords",
         R"((?:jailbreak|bypass|circumvent|override|hack).*(?:filter|restriction|safety|guardrail))",
         0.9},
        {"Encoded Instructions",
         R"((?:base64|rot13|hex|decode|decrypt).*(?:instruction|command|prompt))",
         0.75},
        {"Privilege Escalation",
         R"((?:sudo|admin|root|superuser|god mode|developer mode))",
         0.8},
        {"Output Manipulation",
         R"((?:respond|answer|reply|output).*(?:only|just|exactly).*(?:with|in).*(?:json|code|format|yes|no))",
         0.5},
        {"Prompt Leaking",
         R"((?:show|reveal|display|print|output).*(?:your|the).*(?:prompt|instructions|system message|guidelines))",
         0.85},
    };
    return kDefinitions;
}

absl::StatusOr<PatternRuleSet> PatternRuleSet::Create(
    const std::vector<RuleDefinition>& definitions) {
    std::vector<Rule> rules;
    rules.reserve(definitions.size());

    for (const auto& def : definitions) {
        if (def.name.empty()) {
            return absl::InvalidArgumentError("Rule name must not be empty");
        }
        if (!(def.weight >= 0.0 && def.weight <= 1.0)) {
            return absl::InvalidArgumentError(
                absl::StrCat("Rule '", def.name, "' has weight ", def.weight,
                             " outside [0, 1]"));
        }

        RE2::Options options;
        options.set_case_sensitive(def.case_sensitive);
        options.set_log_errors(false);

        auto matcher = std::make_unique<re2::RE2>(def.pattern, options);
        if (!matcher->ok()) {
            return MakeError(ErrorCode::kPatternCompileError,
                             absl::StrCat("Rule '", def.name, "' failed to compile: ",
                                          matcher->error()));
        }

        rules.push_back(Rule{def.name, std::move(matcher), def.weight});
    }

    PROMPTGUARD_LOG_DEBUG("Compiled {} detection rules", rules.size());
    return PatternRuleSet(std::move(rules));
}

absl::StatusOr<PatternRuleSet> PatternRuleSet::CreateDefault() {
    return Create(DefaultRuleDefinitions());
}

MatchResult PatternRuleSet::MatchAll(std::string_view text) const {
    MatchResult result;
    const re2::StringPiece input(text.data(), text.size());

    for (const auto& rule : rules_) {
        std::vector<std::string> found;
        size_t pos = 0;

        while (pos <= text.size() && found.size() < kMaxMatchesPerRule) {
            re2::StringPiece match;
            if (!rule.matcher->Match(input, pos, text.size(), RE2::UNANCHORED,
                                     &match, 1)) {
                break;
            }
            const size_t start = static_cast<size_t>(match.data() - text.data());
            const size_t end = start + match.size();
            found.emplace_back(match.data(), match.size());

            if (!match.empty()) {
                pos = end;
            } else if (end < text.size()) {
                // Step over one code point so an empty match cannot repeat
                pos = end + Utf8SequenceLength(text, end);
            } else {
                break;
            }
        }

        if (!found.empty()) {
            result.max_weight = std::max(result.max_weight, rule.weight);
            result.matches.push_back(RuleMatch{rule.name, std::move(found), rule.weight});
        }
    }

    return result;
}

}  // namespace promptguard::classifier
