#pragma once

/// @file feature_extractor.h
/// @brief Surface statistics of a text used by the heuristic scorer

#include <string_view>

#include "classifier/types.h"

namespace promptguard::classifier {

/// @brief Compute the FeatureVector of a text
///
/// | Feature                  | Definition                                          |
/// |--------------------------|-----------------------------------------------------|
/// | length                   | code points                                         |
/// | word_count               | maximal runs of non-white-space                     |
/// | avg_word_length          | mean token length, 0 with no tokens                 |
/// | uppercase_ratio          | A-Z / length                                        |
/// | special_char_ratio       | neither alphanumeric nor white space / length       |
/// | has_multiple_delimiters  | a run of 3+ characters from # * _ - =               |
/// | has_system_tags          | "<\|", "[SYSTEM]" or "[INST]", any case             |
/// | suspicious_keyword_count | whole-word ignore, disregard, forget, override,     |
/// |                          | bypass, jailbreak (any case)                        |
/// | command_like_structure   | a line that starts with optional white space, a     |
/// |                          | word of letters/digits/_/- and a colon              |
///
/// Extraction is pure and thread-safe. Callers must not pass empty text
/// (ratios divide by length); RiskClassifier short-circuits blank input.
class FeatureExtractor {
public:
    FeatureExtractor() = delete;

    static FeatureVector Extract(std::string_view text);

    /// @brief Count whole-word suspicious keywords
    static int64_t CountSuspiciousKeywords(std::string_view text);
};

}  // namespace promptguard::classifier
