// Copyright (c) 2025 VAM Desktop Live Whisper
// Sentence boundary detection

#include "text/sentence_splitter.hpp"
#include "core/logging.hpp"

#include <cctype>
#include <cstring>

namespace text {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminal(char c) {
    return c == '.' || c == '!' || c == '?';
}

// Length of a closing quote or bracket at s[i], 0 if none.
size_t closer_length(const std::string& s, size_t i) {
    const char c = s[i];
    if (c == '"' || c == '\'' || c == ')' || c == ']') return 1;
    static const char* const multi[] = {
        "\xE2\x80\x9D",  // ”
        "\xE2\x80\x9C",  // “ (German closing)
        "\xE2\x80\x99",  // ’
        "\xE2\x80\x98",  // ‘
        "\xC2\xBB",      // »
        "\xC2\xAB",      // «
    };
    for (const char* m : multi) {
        const size_t n = std::strlen(m);
        if (s.compare(i, n, m) == 0) return n;
    }
    return 0;
}

size_t skip_space(const std::string& s, size_t i) {
    while (i < s.size() && is_space(s[i])) ++i;
    return i;
}

bool starts_lowercase(const std::string& s, size_t i) {
    if (i >= s.size()) return false;
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) return std::islower(c) != 0;
    // ä ö ü ß
    if (c == 0xC3 && i + 1 < s.size()) {
        const unsigned char d = static_cast<unsigned char>(s[i + 1]);
        return d == 0xA4 || d == 0xB6 || d == 0xBC || d == 0x9F;
    }
    return false;
}

const char* const kGermanAbbreviations[] = {
    "z.b.", "d.h.", "u.a.", "o.ä.", "z.t.", "u.u.", "usw.", "bzw.", "ca.", "dr.", "prof.",
    "nr.", "vgl.", "evtl.", "ggf.", "inkl.", "etc.", "hr.", "fr.", "str.", "bspw.", "sog.",
    "mio.", "mrd.", "jh.", "abs.", "tel.", "allg.", "bzgl.", "zzgl.", "max.", "min.",
};

const char* const kEnglishAbbreviations[] = {
    "mr.", "mrs.", "ms.", "dr.", "prof.", "e.g.", "i.e.", "etc.", "vs.", "no.", "st.",
    "jr.", "sr.", "inc.", "ltd.", "approx.", "dept.", "fig.", "cf.",
};

} // namespace

std::vector<SentenceSpan> SentenceSplitter::split(const std::string& s) const {
    std::vector<SentenceSpan> spans;
    size_t start = skip_space(s, 0);
    size_t i = start;
    while (i < s.size()) {
        if (!is_terminal(s[i])) {
            ++i;
            continue;
        }
        size_t punct_end = i;
        while (punct_end < s.size() && is_terminal(s[punct_end])) ++punct_end;
        size_t end = punct_end;
        while (end < s.size()) {
            const size_t n = closer_length(s, end);
            if (n == 0) break;
            end += n;
        }
        if (end == s.size() || is_space(s[end])) {
            const size_t next = skip_space(s, end);
            if (accept_boundary(s, start, i, punct_end, next)) {
                spans.push_back({start, end});
                start = next;
                i = start;
                continue;
            }
        }
        i = end;
    }
    if (start < s.size()) {
        size_t e = s.size();
        while (e > start && is_space(s[e - 1])) --e;
        if (e > start) spans.push_back({start, e});
    }
    return spans;
}

bool SentenceSplitter::accept_boundary(const std::string&, size_t, size_t, size_t, size_t) const {
    return true;
}

LanguageAwareSplitter::LanguageAwareSplitter(const std::string& language)
    : language_(language) {
    if (language_ == "de") {
        for (const char* a : kGermanAbbreviations) abbreviations_.insert(a);
    } else {
        for (const char* a : kEnglishAbbreviations) abbreviations_.insert(a);
    }
}

bool LanguageAwareSplitter::accept_boundary(const std::string& s, size_t sentence_begin,
                                            size_t punct_begin, size_t punct_end, size_t next) const {
    if (next >= s.size()) return true;
    if (starts_lowercase(s, next)) return false;

    // Only a single '.' can belong to an abbreviation, initial or ordinal
    if (punct_end - punct_begin != 1 || s[punct_begin] != '.') return true;

    size_t w = punct_begin;
    while (w > sentence_begin && !is_space(s[w - 1])) --w;
    while (w < punct_begin && (s[w] == '(' || s[w] == '"' || s[w] == '\'')) ++w;
    std::string word = s.substr(w, punct_begin - w);
    if (word.empty()) return true;

    std::string key;
    key.reserve(word.size() + 1);
    for (char c : word) key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    key.push_back('.');
    if (abbreviations_.count(key)) return false;

    // Initials: "J. Smith"
    if (word.size() == 1 && std::isupper(static_cast<unsigned char>(word[0]))) return false;

    if (language_ == "de" && word.size() <= 2) {
        bool digits = true;
        for (char c : word) digits = digits && std::isdigit(static_cast<unsigned char>(c));
        if (digits) return false;
    }
    return true;
}

std::shared_ptr<SentenceSplitter> make_sentence_splitter(const std::string& language) {
    if (language == "de" || language == "en") {
        return std::make_shared<LanguageAwareSplitter>(language);
    }
    core::log_debug("[chunker] no sentence rules for '" + language + "', using punctuation splitter");
    return std::make_shared<SentenceSplitter>();
}

} // namespace text
