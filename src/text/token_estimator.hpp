// Copyright (c) 2025 VAM Desktop Live Whisper
// Token count strategies used to size chunks

#pragma once

#include <memory>
#include <string>

namespace text {

/// Pure, deterministic estimate. Must return >= 1 for any non-empty text.
class TokenEstimator {
public:
    virtual ~TokenEstimator() = default;
    virtual int estimate(const std::string& text) const = 0;
    virtual std::string name() const = 0;
};

/// ceil(code points / chars_per_token). The always-available fallback.
class CharacterRatioEstimator : public TokenEstimator {
public:
    explicit CharacterRatioEstimator(double chars_per_token = 4.0);
    int estimate(const std::string& text) const override;
    std::string name() const override { return "chars"; }

private:
    double chars_per_token_;
};

/// words * tokens_per_word + overhead
class WordRatioEstimator : public TokenEstimator {
public:
    explicit WordRatioEstimator(double tokens_per_word = 1.3, int overhead = 10);
    int estimate(const std::string& text) const override;
    std::string name() const override { return "words"; }

private:
    double tokens_per_word_;
    int overhead_;
};

/// "chars" or "words". Throws std::invalid_argument otherwise.
std::unique_ptr<TokenEstimator> make_heuristic_estimator(const std::string& strategy);

/// Number of UTF-8 code points (continuation bytes are not counted).
size_t utf8_length(const std::string& s);

/// Moves pos forward to the next code point boundary (or s.size()).
size_t utf8_boundary(const std::string& s, size_t pos);

} // namespace text
