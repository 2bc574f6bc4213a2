// Copyright (c) 2025 VAM Desktop Live Whisper
// Prompt construction for the correction model

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace text {

enum class CorrectionLevel {
    Light,     ///< spelling only
    Standard,  ///< spelling and basic grammar
    Strict     ///< full rewrite into standard German
};

const char* to_string(CorrectionLevel level);

/// Throws std::invalid_argument for names other than light, standard, strict.
CorrectionLevel parse_correction_level(const std::string& name);

std::vector<CorrectionLevel> available_levels();

struct CorrectionPrompt {
    std::string system;
    std::string user;

    /// system + blank line + user, the form sent to the worker
    std::string combined() const { return system + "\n\n" + user; }
};

constexpr size_t kMaxPromptTextChars = 10000;

struct PromptRequest {
    CorrectionLevel level = CorrectionLevel::Standard;
    std::string text;
    std::string language = "de";  ///< prompt language, "de" or "en"; others fall back to "de"
    bool dialect_normalization = false;
    std::optional<std::string> prev_context;
    std::optional<std::string> next_context;
};

/// Throws std::invalid_argument for blank text or text over kMaxPromptTextChars code points.
/// The corrected text is German either way; language only picks the instruction wording.
CorrectionPrompt build_correction_prompt(const PromptRequest& request);

/// Rough prompt size: (system + template + text chars) / 4, plus 20%.
int estimate_prompt_tokens(const std::string& text, CorrectionLevel level);

} // namespace text
