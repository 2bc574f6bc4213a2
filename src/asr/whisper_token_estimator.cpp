// Copyright (c) 2025 VAM Desktop Live Whisper
// Exact token counts from a loaded whisper.cpp vocabulary

#include "asr/whisper_token_estimator.hpp"

namespace asr {

int WhisperTokenEstimator::estimate(const std::string& text) const {
    if (text.empty()) return 0;
    const int n = engine_.count_tokens(text);
    if (n < 0) return fallback_.estimate(text);
    return n < 1 ? 1 : n;
}

} // namespace asr
