// Copyright (c) 2025 VAM Desktop Live Whisper
// Token count strategies used to size chunks

#include "text/token_estimator.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>

namespace text {

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

size_t utf8_boundary(const std::string& s, size_t pos) {
    while (pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) ++pos;
    return pos < s.size() ? pos : s.size();
}

CharacterRatioEstimator::CharacterRatioEstimator(double chars_per_token)
    : chars_per_token_(chars_per_token) {
    if (chars_per_token_ <= 0.0) {
        throw std::invalid_argument("chars_per_token must be positive");
    }
}

int CharacterRatioEstimator::estimate(const std::string& text) const {
    const size_t n = utf8_length(text);
    if (n == 0) return 0;
    const int tokens = static_cast<int>(std::ceil(static_cast<double>(n) / chars_per_token_));
    return tokens < 1 ? 1 : tokens;
}

WordRatioEstimator::WordRatioEstimator(double tokens_per_word, int overhead)
    : tokens_per_word_(tokens_per_word), overhead_(overhead) {
    if (tokens_per_word_ <= 0.0 || overhead_ < 0) {
        throw std::invalid_argument("invalid word ratio parameters");
    }
}

int WordRatioEstimator::estimate(const std::string& text) const {
    if (text.empty()) return 0;
    int words = 0;
    bool in_word = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++words;
        }
    }
    const int tokens = static_cast<int>(words * tokens_per_word_) + overhead_;
    return tokens < 1 ? 1 : tokens;
}

std::unique_ptr<TokenEstimator> make_heuristic_estimator(const std::string& strategy) {
    if (strategy == "chars") return std::make_unique<CharacterRatioEstimator>();
    if (strategy == "words") return std::make_unique<WordRatioEstimator>();
    throw std::invalid_argument("unknown token strategy: " + strategy);
}

} // namespace text
