// Copyright (c) 2025 VAM Desktop Live Whisper
// Rule-based correction used when no correction model can be loaded

#include "text/rule_based_corrector.hpp"
#include "text/token_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace text {

namespace {

// Replaces until no occurrence is left so adjacent fillers collapse too.
bool replace_all(std::string& s, const std::string& from, const std::string& to) {
    bool changed = false;
    size_t pos = s.find(from);
    while (pos != std::string::npos) {
        s.replace(pos, from.size(), to);
        changed = true;
        pos = s.find(from, pos);
    }
    return changed;
}

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

// Uppercases the first letter (ASCII and German umlauts).
std::string capitalize_first(std::string s) {
    if (s.empty()) return s;
    const unsigned char c = static_cast<unsigned char>(s[0]);
    if (c < 0x80) {
        s[0] = static_cast<char>(std::toupper(c));
    } else if (c == 0xC3 && s.size() > 1) {
        const unsigned char d = static_cast<unsigned char>(s[1]);
        if (d == 0xA4 || d == 0xB6 || d == 0xBC) {  // ä ö ü -> Ä Ö Ü
            s[1] = static_cast<char>(d - 0x20);
        }
    }
    return s;
}

} // namespace

RuleBasedResult rule_based_correct(const std::string& text, bool dialect_normalization) {
    RuleBasedResult out;
    std::string s = text;

    static const std::pair<const char*, const char*> kFillers[] = {
        {" äh ", " "},
        {" ähm ", " "},
        {" eh ", " "},
        {" ehm ", " "},
        {"  ", " "},
    };
    for (const auto& f : kFillers) {
        if (replace_all(s, f.first, f.second)) {
            out.corrections.push_back(std::string("Removed filler word/space: '") + f.first + "' -> '" + f.second + "'");
        }
    }

    // Sentence starts
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(". ", start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 2;
    }
    if (parts.size() > 1) {
        std::string joined;
        for (const auto& p : parts) {
            std::string t = trim(p);
            if (t.empty()) continue;
            if (!joined.empty()) joined += ". ";
            joined += capitalize_first(t);
        }
        const char last = joined.empty() ? '\0' : joined.back();
        if (last != '.' && last != '!' && last != '?') joined += '.';
        if (joined != s) {
            out.corrections.push_back("Capitalized sentence starts");
        }
        s = joined;
    }

    if (dialect_normalization) {
        static const std::pair<const char*, const char*> kDialect[] = {
            {"net", "nicht"},
            {"hab", "habe"},
            {"n", "ein"},
            {"mal", "einmal"},
        };
        for (const auto& d : kDialect) {
            if (replace_all(s, std::string(" ") + d.first + " ", std::string(" ") + d.second + " ")) {
                out.corrections.push_back(std::string("Dialect correction: '") + d.first + "' -> '" + d.second + "'");
            }
        }
    }

    const double len = static_cast<double>(std::max<size_t>(utf8_length(text), 1));
    out.improvement_score = std::round(out.corrections.size() / len * 100.0 * 100.0) / 100.0;
    out.corrected_text = s;
    return out;
}

} // namespace text
