// Copyright (c) 2025 VAM Desktop Live Whisper
// Exact token counts from a loaded whisper.cpp vocabulary

#pragma once

#include "asr/whisper_engine.hpp"
#include "text/token_estimator.hpp"

namespace asr {

// Borrows the engine: only valid while the transcription resource stays loaded.
// Falls back to the character ratio when tokenization fails.
class WhisperTokenEstimator : public text::TokenEstimator {
public:
    explicit WhisperTokenEstimator(const WhisperEngine& engine) : engine_(engine) {}

    int estimate(const std::string& text) const override;
    std::string name() const override { return "whisper"; }

private:
    const WhisperEngine& engine_;
    text::CharacterRatioEstimator fallback_;
};

} // namespace asr
