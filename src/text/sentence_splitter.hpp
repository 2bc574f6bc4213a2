// Copyright (c) 2025 VAM Desktop Live Whisper
// Sentence boundary detection

#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace text {

/// Byte range [begin, end) of one sentence, trimmed of surrounding whitespace.
/// Terminal punctuation and closing quotes belong to the sentence.
struct SentenceSpan {
    size_t begin = 0;
    size_t end = 0;
};

/// Splits on runs of '.', '!' or '?' followed by whitespace or end of text.
/// Trailing text without terminal punctuation becomes the last sentence.
class SentenceSplitter {
public:
    virtual ~SentenceSplitter() = default;

    std::vector<SentenceSpan> split(const std::string& s) const;
    virtual std::string name() const { return "punctuation"; }

protected:
    // s[punct_begin, punct_end) is the terminal run, next is the first
    // non-space byte after it (s.size() at end of text).
    virtual bool accept_boundary(const std::string& s, size_t sentence_begin,
                                 size_t punct_begin, size_t punct_end, size_t next) const;
};

/// Punctuation splitting that keeps abbreviations ("z.B.", "Dr."), initials,
/// German ordinals ("am 3. Mai") and lowercase continuations inside a sentence.
class LanguageAwareSplitter : public SentenceSplitter {
public:
    explicit LanguageAwareSplitter(const std::string& language);
    std::string name() const override { return "language:" + language_; }

protected:
    bool accept_boundary(const std::string& s, size_t sentence_begin,
                         size_t punct_begin, size_t punct_end, size_t next) const override;

private:
    std::string language_;
    std::set<std::string> abbreviations_;
};

/// Language-aware splitter for "de" and "en", punctuation splitter otherwise.
std::shared_ptr<SentenceSplitter> make_sentence_splitter(const std::string& language);

} // namespace text
