// Copyright (c) 2025 VAM Desktop Live Whisper
// Rule-based correction used when no correction model can be loaded

#pragma once

#include <string>
#include <vector>

namespace text {

struct RuleBasedResult {
    std::string corrected_text;
    std::vector<std::string> corrections;  ///< one entry per rule that changed the text
    double improvement_score = 0.0;        ///< corrections per 100 characters, 2 decimals
};

/// Removes German filler words (äh, ähm, eh, ehm) and double spaces,
/// capitalizes sentence starts and, optionally, normalizes common dialect forms.
RuleBasedResult rule_based_correct(const std::string& text, bool dialect_normalization);

} // namespace text
