#pragma once

/// @file heuristic_scorer.h
/// @brief Additive scoring of a FeatureVector

#include "classifier/types.h"

namespace promptguard::classifier {

/// @brief Deterministic stand-in for a learned model
///
/// Adds a fixed contribution for each indicator and caps the sum at 1.0:
///
/// | Condition                        | Contribution           |
/// |----------------------------------|------------------------|
/// | length > 500                     | +0.2                   |
/// | length > 1000                    | +0.3 (on top of 0.2)   |
/// | uppercase_ratio > 0.3            | +0.25                  |
/// | special_char_ratio > 0.15        | +0.3                   |
/// | has_multiple_delimiters          | +0.4                   |
/// | has_system_tags                  | +0.5                   |
/// | command_like_structure           | +0.3                   |
/// | suspicious_keyword_count = k > 0 | +0.2 * k               |
/// | k > 3                            | +0.4                   |
class HeuristicScorer {
public:
    HeuristicScorer() = delete;

    /// @return Score in [0, 1]
    static double Score(const FeatureVector& features);
};

}  // namespace promptguard::classifier
